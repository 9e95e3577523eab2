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
#include <relic/chain/engine_evaluator.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/nft_object.hpp>

namespace relic { namespace chain {

namespace {

const engine_settings_object& get_owned_settings( const database& d, engine_type engine, account_id_type caller )
{
   const engine_settings_object& settings = d.get_engine_settings( engine );
   RELIC_ASSERT( settings.owner == caller, unauthorized_caller_exception, "Ownable: caller is not the owner",
                 ("caller", caller)("owner", settings.owner) );
   return settings;
}

} // anonymous namespace

void_result engine_update_evaluator::do_evaluate( const engine_update_operation& op )
{ try {
   const database& d = db();
   settings = &get_owned_settings( d, op.engine, op.owner );

   if( op.fee_recipient.valid() )
      FC_ASSERT( d.find( *op.fee_recipient ) != nullptr, "Invalid address" );
   if( op.dispute_resolver.valid() )
      FC_ASSERT( d.find( *op.dispute_resolver ) != nullptr, "Invalid address" );
   if( op.new_owner.valid() )
      FC_ASSERT( d.find( *op.new_owner ) != nullptr, "Invalid address" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_update_evaluator::do_apply( const engine_update_operation& op )
{ try {
   db().modify( *settings, [&op]( engine_settings_object& s ) {
      if( op.fee_bps.valid() )
         s.fee_bps = *op.fee_bps;
      if( op.fee_recipient.valid() )
         s.fee_recipient = *op.fee_recipient;
      if( op.dispute_resolver.valid() )
         s.dispute_resolver = *op.dispute_resolver;
      if( op.new_owner.valid() )
         s.owner = *op.new_owner;
   });
   ilog( "Engine ${e} settings updated: ${s}", ("e", op.engine)("s", *settings) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_pause_evaluator::do_evaluate( const engine_pause_operation& op )
{ try {
   settings = &get_owned_settings( db(), op.engine, op.owner );

   if( op.paused )
      RELIC_ASSERT( !settings->paused, engine_paused_exception, "Pausable: paused", ("engine", op.engine) );
   else
      RELIC_ASSERT( settings->paused, invalid_state_exception, "Pausable: not paused", ("engine", op.engine) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_pause_evaluator::do_apply( const engine_pause_operation& op )
{ try {
   db().modify( *settings, [&op]( engine_settings_object& s ) {
      s.paused = op.paused;
   });
   ilog( "Engine ${e} ${what}", ("e", op.engine)("what", op.paused ? "paused" : "unpaused") );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_whitelist_evaluator::do_evaluate( const engine_whitelist_operation& op )
{ try {
   const database& d = db();
   settings = &get_owned_settings( d, op.engine, op.owner );
   FC_ASSERT( d.find( op.registry ) != nullptr, "Invalid address" );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_whitelist_evaluator::do_apply( const engine_whitelist_operation& op )
{ try {
   db().modify( *settings, [&op]( engine_settings_object& s ) {
      if( op.whitelisted )
         s.whitelisted_registries.insert( op.registry );
      else
         s.whitelisted_registries.erase( op.registry );
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_emergency_withdraw_evaluator::do_evaluate( const engine_emergency_withdraw_operation& op )
{ try {
   settings = &get_owned_settings( db(), op.engine, op.owner );
   RELIC_ASSERT( settings->paused, invalid_state_exception, "Pausable: not paused", ("engine", op.engine) );
   FC_ASSERT( settings->custody_account.valid(), "Engine ${e} holds no funds", ("e", op.engine) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result engine_emergency_withdraw_evaluator::do_apply( const engine_emergency_withdraw_operation& op )
{ try {
   database& d = db();
   const account_id_type custody = *settings->custody_account;
   const share_type amount = d.get_balance( custody );
   d.transfer_balance( custody, settings->owner, amount );
   wlog( "Emergency withdraw of ${a} from engine ${e} to ${o}", ("a", amount)("e", op.engine)("o", settings->owner) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // relic::chain
