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

#include <relic/chain/asset_registry.hpp>
#include <relic/chain/royalty_object.hpp>

namespace relic { namespace chain {

royalty_info database::get_royalty( asset_registry_id_type registry, token_id_type token_id, share_type sale_price )
{ try {
   FC_ASSERT( sale_price >= 0, "Sale price may not be negative" );

   // The registry's own answer comes first, as long as it is sane
   try {
      auto source = get_asset_registry( registry );
      const auto* provider = dynamic_cast<const royalty_info_provider*>( source.get() );
      if( provider != nullptr )
      {
         const optional<royalty_info> answer = provider->query_royalty( token_id, sale_price );
         if( answer.valid() && answer->recipient.valid() && find( *answer->recipient ) != nullptr
             && answer->amount >= 0 && answer->amount <= cut_fee( sale_price, RELIC_MAX_ROYALTY_BPS ) )
            return *answer;
         if( answer.valid() && answer->recipient.valid() )
            dlog( "Ignoring royalty answer of registry ${r}: ${a}", ("r", registry)("a", *answer) );
      }
   } catch( const fc::exception& e ) {
      wlog( "Royalty query of registry ${r} failed, falling back to overrides: ${e}",
            ("r", registry)("e", e.to_string()) );
   }

   const auto& records = get_index_type<royalty_record_index>().indices().get<by_scope>();
   auto lookup = [&]( royalty_scope scope, asset_registry_id_type r, token_id_type t ) -> optional<royalty_info> {
      auto itr = records.find( boost::make_tuple( scope, r, t ) );
      if( itr == records.end() || itr->bps == 0 )
         return optional<royalty_info>();
      royalty_info info;
      info.recipient = itr->recipient;
      info.amount = cut_fee( sale_price, itr->bps );
      return info;
   };

   optional<royalty_info> result = lookup( token_royalty, registry, token_id );
   if( !result.valid() )
      result = lookup( contract_royalty, registry, 0 );
   if( !result.valid() )
      result = lookup( default_royalty, asset_registry_id_type(), 0 );
   if( result.valid() )
      return *result;

   return royalty_info();
} FC_CAPTURE_AND_RETHROW( (registry)(token_id)(sale_price) ) }

} }
