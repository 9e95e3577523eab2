/*
 * Copyright (c) 2017 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <relic/chain/database.hpp>

#include <relic/chain/marketplace_object.hpp>
#include <relic/chain/nft_object.hpp>

namespace relic { namespace chain {

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   return get( dynamic_global_property_id_type() );
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const engine_settings_object& database::get_engine_settings( engine_type engine )const
{
   FC_ASSERT( engine < ENGINE_TYPE_COUNT, "Invalid engine ${e}", ("e", int(engine)) );
   return get( engine_settings_id_type( uint64_t( engine ) ) );
}

const marketplace_statistics_object& database::get_marketplace_statistics()const
{
   return get( marketplace_statistics_id_type() );
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& accounts_by_name = get_index_type<account_index>().indices().get<by_name>();
   auto itr = accounts_by_name.find( name );
   if( itr == accounts_by_name.end() )
      return nullptr;
   return &*itr;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unknown account name '${n}'", ("n", name) );
   return *account;
}

const nft_object* database::find_nft( asset_registry_id_type registry, token_id_type token_id )const
{
   const auto& idx = get_index_type<nft_index>().indices().get<by_registry_token>();
   auto itr = idx.find( boost::make_tuple( registry, token_id ) );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const listing_object* database::find_active_listing( asset_registry_id_type registry, token_id_type token_id )const
{
   const auto& idx = get_index_type<listing_index>().indices().get<by_active_asset>();
   auto itr = idx.lower_bound( boost::make_tuple( true, registry, token_id ) );
   if( itr == idx.end() || !itr->active || itr->registry != registry || itr->token_id != token_id )
      return nullptr;
   return &*itr;
}

} }
