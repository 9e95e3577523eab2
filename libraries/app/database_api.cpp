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

#include "database_api_impl.hxx"

#include <relic/chain/royalty_object.hpp>

#include <fc/container/flat.hpp>

namespace relic { namespace app {

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( relic::chain::database& db )
   : my( new database_api_impl( db ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( relic::chain::database& db )
:_db(db)
{
   dlog("creating database api ${x}", ("x",int64_t(this)) );
   _applied_operation_connection = _db.applied_operation.connect( [this]( const operation_history_object& op ) {
                                      on_applied_operation( op );
                                   });
}

database_api_impl::~database_api_impl()
{
   dlog("freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Objects                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::variants database_api::get_objects( const vector<object_id_type>& ids )const
{
   return my->get_objects( ids );
}

fc::variants database_api_impl::get_objects( const vector<object_id_type>& ids )const
{
   fc::variants result;
   result.reserve(ids.size());

   std::transform(ids.begin(), ids.end(), std::back_inserter(result),
                  [this](object_id_type id) -> fc::variant {
      if(auto obj = _db.find_object(id))
         return obj->to_variant();
      return {};
   });

   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Subscriptions                                                    //
//                                                                  //
//////////////////////////////////////////////////////////////////////

void database_api::set_applied_operation_callback( std::function<void(const variant&)> cb )
{
   my->set_applied_operation_callback( cb );
}

void database_api_impl::set_applied_operation_callback( std::function<void(const variant&)> cb )
{
   _applied_operation_callback = cb;
}

void database_api::cancel_all_subscriptions()
{
   my->cancel_all_subscriptions();
}

void database_api_impl::cancel_all_subscriptions()
{
   _applied_operation_callback = std::function<void(const fc::variant&)>();
}

void database_api_impl::on_applied_operation( const operation_history_object& op )
{
   if( _applied_operation_callback )
      _applied_operation_callback( fc::variant( op, RELIC_MAX_NESTED_OBJECTS ) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Globals                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

time_point_sec database_api::get_head_time()const
{
   return my->get_head_time();
}

time_point_sec database_api_impl::get_head_time()const
{
   return _db.head_time();
}

engine_settings_object database_api::get_engine_settings( engine_type engine )const
{
   return my->get_engine_settings( engine );
}

engine_settings_object database_api_impl::get_engine_settings( engine_type engine )const
{
   return _db.get_engine_settings( engine );
}

bool database_api::is_whitelisted( engine_type engine, asset_registry_id_type registry )const
{
   return my->is_whitelisted( engine, registry );
}

bool database_api_impl::is_whitelisted( engine_type engine, asset_registry_id_type registry )const
{
   return _db.get_engine_settings( engine ).is_whitelisted( registry );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Accounts                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<account_object> database_api::get_account_by_name( string name )const
{
   return my->get_account_by_name( name );
}

optional<account_object> database_api_impl::get_account_by_name( string name )const
{
   const auto& idx = _db.get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find(name);
   if (itr != idx.end())
      return *itr;
   return optional<account_object>();
}

share_type database_api::get_balance( account_id_type account )const
{
   return my->get_balance( account );
}

share_type database_api_impl::get_balance( account_id_type account )const
{
   return _db.get_balance( account );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Tokens                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

account_id_type database_api::owner_of( asset_registry_id_type registry, token_id_type token_id )const
{
   return my->owner_of( registry, token_id );
}

account_id_type database_api_impl::owner_of( asset_registry_id_type registry, token_id_type token_id )const
{
   FC_ASSERT( _db.find( registry ) != nullptr, "Unknown asset registry ${r}", ("r", registry) );
   return _db.get_asset_registry( registry )->owner_of( token_id );
}

optional<nft_object> database_api::get_nft( asset_registry_id_type registry, token_id_type token_id )const
{
   return my->get_nft( registry, token_id );
}

optional<nft_object> database_api_impl::get_nft( asset_registry_id_type registry, token_id_type token_id )const
{
   const nft_object* token = _db.find_nft( registry, token_id );
   if( token != nullptr )
      return *token;
   return optional<nft_object>();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Escrows                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<escrow_object> database_api::get_escrow( escrow_id_type id )const
{
   return my->get_escrow( id );
}

optional<escrow_object> database_api_impl::get_escrow( escrow_id_type id )const
{
   const escrow_object* e = _db.find( id );
   if( e != nullptr )
      return *e;
   return optional<escrow_object>();
}

vector<escrow_id_type> database_api::get_user_escrows( account_id_type account )const
{
   return my->get_user_escrows( account );
}

vector<escrow_id_type> database_api_impl::get_user_escrows( account_id_type account )const
{
   flat_set<escrow_id_type> ids;

   const auto& by_seller_idx = _db.get_index_type<escrow_index>().indices().get<by_seller>();
   auto seller_range = by_seller_idx.equal_range( boost::make_tuple( account ) );
   for( auto itr = seller_range.first; itr != seller_range.second; ++itr )
      ids.insert( itr->get_id() );

   const auto& by_buyer_idx = _db.get_index_type<escrow_index>().indices().get<by_buyer>();
   auto buyer_range = by_buyer_idx.equal_range( boost::make_tuple( account ) );
   for( auto itr = buyer_range.first; itr != buyer_range.second; ++itr )
      ids.insert( itr->get_id() );

   return vector<escrow_id_type>( ids.begin(), ids.end() );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Marketplace                                                      //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<listing_object> database_api::get_listing( listing_id_type id )const
{
   return my->get_listing( id );
}

optional<listing_object> database_api_impl::get_listing( listing_id_type id )const
{
   const listing_object* l = _db.find( id );
   if( l != nullptr )
      return *l;
   return optional<listing_object>();
}

optional<listing_object> database_api::get_active_listing( asset_registry_id_type registry,
                                                           token_id_type token_id )const
{
   return my->get_active_listing( registry, token_id );
}

optional<listing_object> database_api_impl::get_active_listing( asset_registry_id_type registry,
                                                                token_id_type token_id )const
{
   const listing_object* l = _db.find_active_listing( registry, token_id );
   if( l != nullptr )
      return *l;
   return optional<listing_object>();
}

optional<offer_object> database_api::get_offer( offer_id_type id )const
{
   return my->get_offer( id );
}

optional<offer_object> database_api_impl::get_offer( offer_id_type id )const
{
   const offer_object* o = _db.find( id );
   if( o != nullptr )
      return *o;
   return optional<offer_object>();
}

vector<listing_id_type> database_api::get_user_listings( account_id_type seller )const
{
   return my->get_user_listings( seller );
}

vector<listing_id_type> database_api_impl::get_user_listings( account_id_type seller )const
{
   vector<listing_id_type> result;
   const auto& idx = _db.get_index_type<listing_index>().indices().get<by_seller>();
   auto range = idx.equal_range( boost::make_tuple( seller ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

vector<offer_id_type> database_api::get_user_offers( account_id_type buyer )const
{
   return my->get_user_offers( buyer );
}

vector<offer_id_type> database_api_impl::get_user_offers( account_id_type buyer )const
{
   vector<offer_id_type> result;
   const auto& idx = _db.get_index_type<offer_index>().indices().get<by_buyer>();
   auto range = idx.equal_range( boost::make_tuple( buyer ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

vector<offer_id_type> database_api::get_offers_for_asset( asset_registry_id_type registry,
                                                          token_id_type token_id )const
{
   return my->get_offers_for_asset( registry, token_id );
}

vector<offer_id_type> database_api_impl::get_offers_for_asset( asset_registry_id_type registry,
                                                               token_id_type token_id )const
{
   vector<offer_id_type> result;
   const auto& idx = _db.get_index_type<offer_index>().indices().get<by_asset>();
   auto range = idx.equal_range( boost::make_tuple( registry, token_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

marketplace_statistics_object database_api::get_marketplace_statistics()const
{
   return my->get_marketplace_statistics();
}

marketplace_statistics_object database_api_impl::get_marketplace_statistics()const
{
   return _db.get_marketplace_statistics();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Royalty                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

royalty_info database_api::get_royalty( asset_registry_id_type registry, token_id_type token_id,
                                        share_type sale_price )const
{
   return my->get_royalty( registry, token_id, sale_price );
}

royalty_info database_api_impl::get_royalty( asset_registry_id_type registry, token_id_type token_id,
                                             share_type sale_price )const
{
   FC_ASSERT( sale_price >= 0, "Sale price can not be negative" );
   return _db.get_royalty( registry, token_id, sale_price );
}

} } // relic::app
