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
#include <relic/chain/marketplace_evaluator.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/marketplace_object.hpp>

namespace relic { namespace chain {

namespace {

   account_id_type marketplace_custody( const database& d )
   {
      const auto& settings = d.get_engine_settings( marketplace_engine );
      FC_ASSERT( settings.custody_account.valid(), "The marketplace engine has no custody account" );
      return *settings.custody_account;
   }

   /// the seller owns the token and the marketplace may move it
   void check_seller_custody( database& d, asset_registry_id_type registry_id, token_id_type token_id,
                              account_id_type seller, const char* not_owner_message )
   {
      const account_id_type custody = marketplace_custody( d );
      auto registry = d.get_asset_registry( registry_id );
      RELIC_ASSERT( registry->owner_of( token_id ) == seller, custody_exception, not_owner_message,
                    ("seller", seller)("token_id", token_id) );
      const auto approved = registry->get_approved( token_id );
      RELIC_ASSERT( ( approved.valid() && *approved == custody ) || registry->is_approved_for_all( seller, custody ),
                    custody_exception, "Contract not approved", ("seller", seller)("token_id", token_id) );
   }

   /// expires_at must stay representable as time_point_sec
   void check_duration( const database& d, uint32_t duration_seconds )
   {
      const uint64_t expiry = uint64_t( d.head_time().sec_since_epoch() ) + duration_seconds;
      RELIC_ASSERT( expiry <= time_point_sec::maximum().sec_since_epoch(), invalid_parameter_exception,
                    "Invalid duration", ("duration", duration_seconds)("now", d.head_time()) );
   }

   void deactivate_listing( database& d, const listing_object& listing )
   {
      d.modify( listing, []( listing_object& l ) {
         l.active = false;
      });
      d.push_applied_operation( listing_deactivated_operation( listing.get_id(), listing.seller ) );
   }

   /**
    *  Pays out a sale whose price already sits in marketplace custody: the royalty, the
    *  marketplace fee and the rest to the seller.  The token moves from seller to buyer with
    *  the marketplace as operator.
    */
   settlement_result settle_sale( database& d, asset_registry_id_type registry, token_id_type token_id,
                                  account_id_type seller, account_id_type buyer, share_type price )
   {
      const auto& settings = d.get_engine_settings( marketplace_engine );
      const account_id_type custody = marketplace_custody( d );

      const royalty_info royalty = d.get_royalty( registry, token_id, price );

      settlement_result result;
      result.seller = seller;
      result.fee_recipient = settings.fee_recipient;
      result.fee = cut_fee( price, settings.fee_bps );
      if( royalty.recipient.valid() && royalty.amount > 0 )
      {
         result.royalty_recipient = royalty.recipient;
         result.royalty = royalty.amount;
      }
      result.seller_amount = price - result.fee - result.royalty;
      FC_ASSERT( result.seller_amount >= 0, "Fee and royalty exceed the price",
                 ("price", price)("fee", result.fee)("royalty", result.royalty) );

      d.get_asset_registry( registry )->safe_transfer_from( custody, seller, buyer, token_id );

      d.transfer_balance( custody, seller, result.seller_amount );
      d.transfer_balance( custody, result.fee_recipient, result.fee );
      if( result.royalty_recipient.valid() )
         d.transfer_balance( custody, *result.royalty_recipient, result.royalty );

      d.modify( d.get_marketplace_statistics(), [price]( marketplace_statistics_object& s ) {
         s.total_sales += 1;
         s.total_volume += price;
      });

      dlog( "Token ${t} of ${r} sold by ${s} to ${b}: ${res}",
            ("t", token_id)("r", registry)("s", seller)("b", buyer)("res", result) );
      return result;
   }

} // anonymous namespace

void_result listing_create_evaluator::do_evaluate( const listing_create_operation& op )
{ try {
   database& d = db();
   assert_not_paused( marketplace_engine );

   RELIC_ASSERT( d.get_engine_settings( marketplace_engine ).is_whitelisted( op.registry ),
                 registry_not_whitelisted_exception, "Contract not whitelisted", ("registry", op.registry) );
   check_duration( d, op.duration_seconds );
   check_seller_custody( d, op.registry, op.token_id, op.seller, "Not token owner" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type listing_create_evaluator::do_apply( const listing_create_operation& op )
{ try {
   database& d = db();

   const listing_object* previous = d.find_active_listing( op.registry, op.token_id );
   if( previous != nullptr )
      deactivate_listing( d, *previous );

   const time_point_sec now = d.head_time();
   const listing_object& new_listing = d.create<listing_object>( [&]( listing_object& l ) {
      l.seller = op.seller;
      l.registry = op.registry;
      l.token_id = op.token_id;
      l.price = op.price;
      l.created_at = now;
      l.expires_at = now + op.duration_seconds;
      l.active = true;
   });

   d.modify( d.get_marketplace_statistics(), []( marketplace_statistics_object& s ) {
      s.total_listings += 1;
   });

   return new_listing.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result listing_update_evaluator::do_evaluate( const listing_update_operation& op )
{ try {
   const database& d = db();
   assert_not_paused( marketplace_engine );

   listing = d.find( op.listing_id );
   RELIC_ASSERT( listing != nullptr, invalid_state_exception, "Invalid listing ID", ("id", op.listing_id) );
   RELIC_ASSERT( listing->seller == op.seller, unauthorized_caller_exception, "Not authorized",
                 ("seller", op.seller) );
   RELIC_ASSERT( listing->active, invalid_state_exception, "Listing not active", ("id", op.listing_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result listing_update_evaluator::do_apply( const listing_update_operation& op )
{ try {
   db().modify( *listing, [&op]( listing_object& l ) {
      l.price = op.new_price;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result listing_cancel_evaluator::do_evaluate( const listing_cancel_operation& op )
{ try {
   const database& d = db();
   assert_not_paused( marketplace_engine );

   listing = d.find( op.listing_id );
   RELIC_ASSERT( listing != nullptr, invalid_state_exception, "Invalid listing ID", ("id", op.listing_id) );
   RELIC_ASSERT( listing->seller == op.who || d.get_engine_settings( marketplace_engine ).owner == op.who,
                 unauthorized_caller_exception, "Not authorized", ("who", op.who) );
   RELIC_ASSERT( listing->active, invalid_state_exception, "Listing not active", ("id", op.listing_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result listing_cancel_evaluator::do_apply( const listing_cancel_operation& op )
{ try {
   db().modify( *listing, []( listing_object& l ) {
      l.active = false;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result listing_buy_evaluator::do_evaluate( const listing_buy_operation& op )
{ try {
   database& d = db();
   assert_not_paused( marketplace_engine );

   listing = d.find( op.listing_id );
   RELIC_ASSERT( listing != nullptr, invalid_state_exception, "Invalid listing ID", ("id", op.listing_id) );
   RELIC_ASSERT( listing->active, invalid_state_exception, "Listing not active", ("id", op.listing_id) );
   RELIC_ASSERT( d.head_time() <= listing->expires_at, invalid_state_exception, "Listing expired",
                 ("expires_at", listing->expires_at)("now", d.head_time()) );
   RELIC_ASSERT( op.payment >= listing->price, insufficient_payment_exception, "Insufficient payment",
                 ("payment", op.payment)("price", listing->price) );
   RELIC_ASSERT( op.buyer != listing->seller, unauthorized_caller_exception, "Cannot buy own item",
                 ("buyer", op.buyer) );
   check_seller_custody( d, listing->registry, listing->token_id, listing->seller, "Seller no longer owns NFT" );

   RELIC_ASSERT( d.get_balance( op.buyer ) >= op.payment, insufficient_balance_exception,
                 "Insufficient Balance: ${b} is less than the payment ${p}",
                 ("b", d.get_balance( op.buyer ))("p", op.payment) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

settlement_result listing_buy_evaluator::do_apply( const listing_buy_operation& op )
{ try {
   database& d = db();
   const account_id_type custody = marketplace_custody( d );
   const share_type price = listing->price;

   d.modify( *listing, []( listing_object& l ) {
      l.active = false;
   });

   d.transfer_balance( op.buyer, custody, op.payment );
   settlement_result result = settle_sale( d, listing->registry, listing->token_id, listing->seller, op.buyer, price );

   result.refund = op.payment - price;
   d.transfer_balance( custody, op.buyer, result.refund );

   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result offer_create_evaluator::do_evaluate( const offer_create_operation& op )
{ try {
   const database& d = db();
   assert_not_paused( marketplace_engine );

   RELIC_ASSERT( d.get_engine_settings( marketplace_engine ).is_whitelisted( op.registry ),
                 registry_not_whitelisted_exception, "Contract not whitelisted", ("registry", op.registry) );
   check_duration( d, op.duration_seconds );
   RELIC_ASSERT( d.get_balance( op.buyer ) >= op.amount, insufficient_balance_exception,
                 "Insufficient Balance: ${b} is less than the offered amount ${a}",
                 ("b", d.get_balance( op.buyer ))("a", op.amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type offer_create_evaluator::do_apply( const offer_create_operation& op )
{ try {
   database& d = db();

   d.transfer_balance( op.buyer, marketplace_custody( d ), op.amount );

   const time_point_sec now = d.head_time();
   const offer_object& new_offer = d.create<offer_object>( [&]( offer_object& o ) {
      o.buyer = op.buyer;
      o.registry = op.registry;
      o.token_id = op.token_id;
      o.amount = op.amount;
      o.created_at = now;
      o.expires_at = now + op.duration_seconds;
      o.active = true;
   });

   return new_offer.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result offer_accept_evaluator::do_evaluate( const offer_accept_operation& op )
{ try {
   database& d = db();
   assert_not_paused( marketplace_engine );

   offer = d.find( op.offer_id );
   RELIC_ASSERT( offer != nullptr, invalid_state_exception, "Invalid offer ID", ("id", op.offer_id) );
   RELIC_ASSERT( offer->active, invalid_state_exception, "Offer not active", ("id", op.offer_id) );
   RELIC_ASSERT( d.head_time() <= offer->expires_at, invalid_state_exception, "Offer expired",
                 ("expires_at", offer->expires_at)("now", d.head_time()) );
   RELIC_ASSERT( op.seller != offer->buyer, unauthorized_caller_exception, "Cannot accept own offer",
                 ("seller", op.seller) );
   check_seller_custody( d, offer->registry, offer->token_id, op.seller, "Not token owner" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

settlement_result offer_accept_evaluator::do_apply( const offer_accept_operation& op )
{ try {
   database& d = db();

   d.modify( *offer, []( offer_object& o ) {
      o.active = false;
   });

   const listing_object* listing = d.find_active_listing( offer->registry, offer->token_id );
   if( listing != nullptr )
      deactivate_listing( d, *listing );

   return settle_sale( d, offer->registry, offer->token_id, op.seller, offer->buyer, offer->amount );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result offer_cancel_evaluator::do_evaluate( const offer_cancel_operation& op )
{ try {
   const database& d = db();
   assert_not_paused( marketplace_engine );

   offer = d.find( op.offer_id );
   RELIC_ASSERT( offer != nullptr, invalid_state_exception, "Invalid offer ID", ("id", op.offer_id) );
   RELIC_ASSERT( offer->buyer == op.who || d.get_engine_settings( marketplace_engine ).owner == op.who,
                 unauthorized_caller_exception, "Not authorized", ("who", op.who) );
   RELIC_ASSERT( offer->active, invalid_state_exception, "Offer not active", ("id", op.offer_id) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result offer_cancel_evaluator::do_apply( const offer_cancel_operation& op )
{ try {
   database& d = db();

   d.modify( *offer, []( offer_object& o ) {
      o.active = false;
   });
   d.transfer_balance( marketplace_custody( d ), offer->buyer, offer->amount );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // relic::chain
