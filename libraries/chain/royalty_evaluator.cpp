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
#include <relic/chain/royalty_evaluator.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/asset_registry.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/nft_object.hpp>
#include <relic/chain/royalty_object.hpp>

namespace relic { namespace chain {

namespace {

   void check_recipient( const database& d, const optional<account_id_type>& recipient )
   {
      if( recipient.valid() )
         FC_ASSERT( d.find( *recipient ) != nullptr, "Invalid recipient", ("recipient", *recipient) );
   }

   bool is_royalty_owner( const database& d, account_id_type who )
   {
      return d.get_engine_settings( royalty_engine ).owner == who;
   }

   /// registry owner probe; a registry that fails to answer grants nothing
   bool is_registry_owner( database& d, asset_registry_id_type registry, account_id_type who )
   {
      try {
         return d.get_asset_registry( registry )->registry_owner() == who;
      } catch( const fc::exception& e ) {
         wlog( "Owner query of registry ${r} failed: ${e}", ("r", registry)("e", e.to_string()) );
         return false;
      }
   }

   bool is_token_owner( database& d, asset_registry_id_type registry, token_id_type token_id, account_id_type who )
   {
      try {
         return d.get_asset_registry( registry )->owner_of( token_id ) == who;
      } catch( const fc::exception& e ) {
         wlog( "Owner query of token ${t} in registry ${r} failed: ${e}",
               ("t", token_id)("r", registry)("e", e.to_string()) );
         return false;
      }
   }

   /// stores the override, or removes it when it carries no royalty
   void store_royalty_record( database& d, royalty_scope scope, asset_registry_id_type registry,
                              token_id_type token_id, const optional<account_id_type>& recipient, uint16_t bps )
   {
      const auto& records = d.get_index_type<royalty_record_index>().indices().get<by_scope>();
      auto itr = records.find( boost::make_tuple( scope, registry, token_id ) );

      if( bps == 0 || !recipient.valid() )
      {
         if( itr != records.end() )
            d.remove( *itr );
         return;
      }

      if( itr == records.end() )
      {
         d.create<royalty_record_object>( [&]( royalty_record_object& r ) {
            r.scope = scope;
            r.registry = registry;
            r.token_id = token_id;
            r.recipient = *recipient;
            r.bps = bps;
         });
      }
      else
      {
         d.modify( *itr, [&]( royalty_record_object& r ) {
            r.recipient = *recipient;
            r.bps = bps;
         });
      }
   }

} // anonymous namespace

void_result royalty_set_default_evaluator::do_evaluate( const royalty_set_default_operation& op )
{ try {
   const database& d = db();
   assert_not_paused( royalty_engine );

   RELIC_ASSERT( is_royalty_owner( d, op.owner ), unauthorized_caller_exception,
                 "Ownable: caller is not the owner", ("caller", op.owner) );
   check_recipient( d, op.recipient );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result royalty_set_default_evaluator::do_apply( const royalty_set_default_operation& op )
{ try {
   store_royalty_record( db(), default_royalty, asset_registry_id_type(), 0, op.recipient, op.bps );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result royalty_set_contract_evaluator::do_evaluate( const royalty_set_contract_operation& op )
{ try {
   database& d = db();
   assert_not_paused( royalty_engine );

   op.registry(d);
   RELIC_ASSERT( is_royalty_owner( d, op.who ) || is_registry_owner( d, op.registry, op.who ),
                 unauthorized_caller_exception, "Not authorized", ("who", op.who)("registry", op.registry) );
   check_recipient( d, op.recipient );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result royalty_set_contract_evaluator::do_apply( const royalty_set_contract_operation& op )
{ try {
   store_royalty_record( db(), contract_royalty, op.registry, 0, op.recipient, op.bps );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result royalty_set_token_evaluator::do_evaluate( const royalty_set_token_operation& op )
{ try {
   database& d = db();
   assert_not_paused( royalty_engine );

   op.registry(d);
   RELIC_ASSERT( is_royalty_owner( d, op.who ) || is_registry_owner( d, op.registry, op.who )
                 || is_token_owner( d, op.registry, op.token_id, op.who ),
                 unauthorized_caller_exception, "Not authorized",
                 ("who", op.who)("registry", op.registry)("token_id", op.token_id) );
   check_recipient( d, op.recipient );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result royalty_set_token_evaluator::do_apply( const royalty_set_token_operation& op )
{ try {
   store_royalty_record( db(), token_royalty, op.registry, op.token_id, op.recipient, op.bps );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // relic::chain
