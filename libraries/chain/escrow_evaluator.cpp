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
#include <relic/chain/escrow_evaluator.hpp>
#include <relic/chain/escrow_object.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/exceptions.hpp>

namespace relic { namespace chain {

   namespace {

      const escrow_object& get_escrow( const database& d, escrow_id_type id )
      {
         const escrow_object* escrow = d.find( id );
         RELIC_ASSERT( escrow != nullptr, invalid_state_exception, "Invalid escrow ID", ("id", id) );
         return *escrow;
      }

      account_id_type escrow_custody( const database& d )
      {
         const auto& settings = d.get_engine_settings( escrow_engine );
         FC_ASSERT( settings.custody_account.valid(), "The escrow engine has no custody account" );
         return *settings.custody_account;
      }

      /// token to the buyer, price less the fee to the seller
      settlement_result complete_escrow( database& d, const escrow_object& escrow )
      {
         const auto& settings = d.get_engine_settings( escrow_engine );
         const account_id_type custody = escrow_custody( d );

         settlement_result result;
         result.seller = escrow.seller;
         result.fee_recipient = settings.fee_recipient;
         result.fee = cut_fee( escrow.price, settings.fee_bps );
         result.seller_amount = escrow.price - result.fee;

         d.get_asset_registry( escrow.registry )->safe_transfer_from( custody, custody, escrow.buyer, escrow.token_id );
         d.transfer_balance( custody, escrow.seller, result.seller_amount );
         d.transfer_balance( custody, result.fee_recipient, result.fee );

         d.modify( escrow, []( escrow_object& e ) {
            e.status = escrow_status::completed;
         });

         d.push_applied_operation( escrow_completed_operation( escrow.get_id(), escrow.seller, escrow.buyer,
                                                               result.seller_amount, result.fee_recipient,
                                                               result.fee ) );
         dlog( "Escrow ${id} completed: ${r}", ("id", escrow.id)("r", result) );
         return result;
      }

      /// token back to the seller, held payment to the buyer
      void refund_escrow( database& d, const escrow_object& escrow )
      {
         const account_id_type custody = escrow_custody( d );

         d.get_asset_registry( escrow.registry )->safe_transfer_from( custody, custody, escrow.seller, escrow.token_id );
         d.transfer_balance( custody, escrow.buyer, escrow.price );

         d.modify( escrow, []( escrow_object& e ) {
            e.status = escrow_status::cancelled;
         });

         d.push_applied_operation( escrow_refunded_operation( escrow.get_id(), escrow.seller, escrow.buyer,
                                                              escrow.price ) );
         dlog( "Escrow ${id} cancelled", ("id", escrow.id) );
      }

   } // anonymous namespace

      void_result escrow_create_evaluator::do_evaluate(const escrow_create_operation& o)
      { try {
         database& d = db();
         assert_not_paused( escrow_engine );

         settings = &d.get_engine_settings( escrow_engine );
         RELIC_ASSERT( settings->is_whitelisted( o.registry ), registry_not_whitelisted_exception,
                       "Contract not whitelisted", ("registry", o.registry) );
         FC_ASSERT( d.find( o.buyer ) != nullptr, "Invalid address" );
         RELIC_ASSERT( o.deadline > d.head_time(), invalid_parameter_exception, "Invalid deadline",
                       ("deadline", o.deadline)("now", d.head_time()) );

         const account_id_type custody = escrow_custody( d );
         auto registry = d.get_asset_registry( o.registry );
         RELIC_ASSERT( registry->owner_of( o.token_id ) == o.seller, custody_exception, "Seller doesn't own NFT",
                       ("token_id", o.token_id) );
         const auto approved = registry->get_approved( o.token_id );
         RELIC_ASSERT( ( approved.valid() && *approved == custody ) || registry->is_approved_for_all( o.seller, custody ),
                       custody_exception, "Contract not approved", ("token_id", o.token_id) );

         RELIC_ASSERT( d.get_balance( o.seller ) >= o.payment, insufficient_balance_exception,
                       "Insufficient Balance: ${b} is less than the escrow price ${p}",
                       ("b", d.get_balance( o.seller ))("p", o.payment) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      object_id_type escrow_create_evaluator::do_apply(const escrow_create_operation& o)
      { try {
         database& d = db();
         const account_id_type custody = *settings->custody_account;

         d.transfer_balance( o.seller, custody, o.payment );
         d.get_asset_registry( o.registry )->safe_transfer_from( custody, o.seller, custody, o.token_id );

         const escrow_object& esc = d.create<escrow_object>([&]( escrow_object& esc ) {
            esc.seller     = o.seller;
            esc.buyer      = o.buyer;
            esc.registry   = o.registry;
            esc.token_id   = o.token_id;
            esc.price      = o.payment;
            esc.created_at = d.head_time();
            esc.deadline   = o.deadline;
         });
         dlog( "Escrow ${id} created: ${e}", ("id", esc.id)("e", esc) );
         return esc.id;
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_approve_evaluator::do_evaluate(const escrow_approve_operation& o)
      { try {
         assert_not_paused( escrow_engine );
         escrow = &get_escrow( db(), o.escrow_id );
         RELIC_ASSERT( escrow->status == escrow_status::active, invalid_state_exception, "Escrow not active",
                       ("status", escrow->status) );
         RELIC_ASSERT( escrow->is_participant( o.who ), unauthorized_caller_exception, "Not authorized",
                       ("who", o.who) );
         if( o.who == escrow->seller )
            RELIC_ASSERT( !escrow->seller_approved, invalid_state_exception, "Already approved", ("who", o.who) );
         else
            RELIC_ASSERT( !escrow->buyer_approved, invalid_state_exception, "Already approved", ("who", o.who) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      operation_result escrow_approve_evaluator::do_apply(const escrow_approve_operation& o)
      { try {
         database& d = db();
         d.modify( *escrow, [&o]( escrow_object& e ) {
            if( o.who == e.seller )
               e.seller_approved = true;
            else
               e.buyer_approved = true;
         });

         if( escrow->is_approved() )
            return complete_escrow( d, *escrow );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_cancel_evaluator::do_evaluate(const escrow_cancel_operation& o)
      { try {
         const database& d = db();
         assert_not_paused( escrow_engine );
         escrow = &get_escrow( d, o.escrow_id );
         RELIC_ASSERT( escrow->status == escrow_status::active, invalid_state_exception, "Escrow not active",
                       ("status", escrow->status) );
         RELIC_ASSERT( escrow->is_participant( o.who ) || d.head_time() > escrow->deadline,
                       unauthorized_caller_exception, "Not authorized to cancel", ("who", o.who) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_cancel_evaluator::do_apply(const escrow_cancel_operation& o)
      { try {
         refund_escrow( db(), *escrow );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_dispute_evaluator::do_evaluate(const escrow_dispute_operation& o)
      { try {
         const database& d = db();
         assert_not_paused( escrow_engine );
         escrow = &get_escrow( d, o.escrow_id );
         RELIC_ASSERT( escrow->status == escrow_status::active, invalid_state_exception, "Escrow not active",
                       ("status", escrow->status) );
         RELIC_ASSERT( escrow->is_participant( o.who ), unauthorized_caller_exception, "Not authorized",
                       ("who", o.who) );
         const uint32_t window = d.get_engine_settings( escrow_engine ).dispute_window;
         const uint64_t window_end = uint64_t( escrow->deadline.sec_since_epoch() ) + window;
         RELIC_ASSERT( d.head_time().sec_since_epoch() <= window_end, invalid_state_exception, "Dispute window closed",
                       ("deadline", escrow->deadline)("window", window)("now", d.head_time()) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_dispute_evaluator::do_apply(const escrow_dispute_operation& o)
      { try {
         db().modify( *escrow, []( escrow_object& e ) {
            e.status = escrow_status::disputed;
         });
         ilog( "Escrow ${id} disputed by ${who}", ("id", o.escrow_id)("who", o.who) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      void_result escrow_resolve_dispute_evaluator::do_evaluate(const escrow_resolve_dispute_operation& o)
      { try {
         const database& d = db();
         assert_not_paused( escrow_engine );
         escrow = &get_escrow( d, o.escrow_id );
         RELIC_ASSERT( o.resolver == d.get_engine_settings( escrow_engine ).dispute_resolver,
                       unauthorized_caller_exception, "Only dispute resolver", ("resolver", o.resolver) );
         RELIC_ASSERT( escrow->status == escrow_status::disputed, invalid_state_exception, "Escrow not disputed",
                       ("status", escrow->status) );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

      operation_result escrow_resolve_dispute_evaluator::do_apply(const escrow_resolve_dispute_operation& o)
      { try {
         database& d = db();
         ilog( "Escrow ${id} resolved in favor of the ${side}", ("id", o.escrow_id)("side", o.favor_buyer ? "buyer" : "seller") );
         if( o.favor_buyer )
            return complete_escrow( d, *escrow );
         refund_escrow( d, *escrow );
         return void_result();
      } FC_CAPTURE_AND_RETHROW( (o) ) }

   } } // relic::chain
