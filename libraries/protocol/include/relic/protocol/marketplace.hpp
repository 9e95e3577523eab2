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
#pragma once
#include <relic/protocol/base.hpp>

namespace relic { namespace protocol {

   /**
    * @brief List a token for sale at a fixed price
    * @ingroup operations
    *
    * The token stays with the seller until it is bought; the marketplace only needs to be
    * approved to move it.  Listing a token that already has an active listing replaces it.
    */
   struct listing_create_operation : public base_operation
   {
      account_id_type         seller;
      asset_registry_id_type  registry;
      token_id_type           token_id = 0;
      share_type              price;
      uint32_t                duration_seconds = 0;   ///< The listing expires this long after creation

      account_id_type caller()const { return seller; }
      void            validate()const override;
   };

   struct listing_update_operation : public base_operation
   {
      account_id_type  seller;
      listing_id_type  listing_id;
      share_type       new_price;

      account_id_type caller()const { return seller; }
      void            validate()const override;
   };

   /**
    * Cancels a listing.  The seller or the marketplace owner may cancel.
    */
   struct listing_cancel_operation : public base_operation
   {
      account_id_type  who;
      listing_id_type  listing_id;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /**
    * @brief Buy a listed token
    * @ingroup operations
    *
    * The payment must cover the price; the difference is refunded.  The result is a
    * settlement_result describing the split of the price.
    */
   struct listing_buy_operation : public base_operation
   {
      account_id_type  buyer;
      listing_id_type  listing_id;
      share_type       payment;

      account_id_type caller()const { return buyer; }
      void            validate()const override;
   };

   /**
    * @brief Bid for a token
    * @ingroup operations
    *
    * The amount is held by the marketplace until the offer is accepted or cancelled.
    * Several offers may be open for the same token.
    */
   struct offer_create_operation : public base_operation
   {
      account_id_type         buyer;
      asset_registry_id_type  registry;
      token_id_type           token_id = 0;
      share_type              amount;
      uint32_t                duration_seconds = 0;

      account_id_type caller()const { return buyer; }
      void            validate()const override;
   };

   /**
    * The current owner of the token sells it to the bidder at the offered amount.
    */
   struct offer_accept_operation : public base_operation
   {
      account_id_type  seller;
      offer_id_type    offer_id;

      account_id_type caller()const { return seller; }
      void            validate()const override;
   };

   /**
    * Cancels an offer and refunds the bidder.  The bidder or the marketplace owner may cancel.
    */
   struct offer_cancel_operation : public base_operation
   {
      account_id_type  who;
      offer_id_type    offer_id;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /**
    *  @brief Virtual op, generated when a listing is closed by a newer listing or by an accepted offer
    *  @ingroup operations
    */
   struct listing_deactivated_operation : public base_operation
   {
      listing_deactivated_operation() = default;
      listing_deactivated_operation( listing_id_type id, account_id_type s )
      : listing_id(id), seller(s) {}

      listing_id_type  listing_id;
      account_id_type  seller;

      account_id_type caller()const { return seller; }
      void            validate()const override { FC_ASSERT( !"virtual operation" ); }
   };

} } // relic::protocol

FC_REFLECT( relic::protocol::listing_create_operation, (seller)(registry)(token_id)(price)(duration_seconds) )
FC_REFLECT( relic::protocol::listing_update_operation, (seller)(listing_id)(new_price) )
FC_REFLECT( relic::protocol::listing_cancel_operation, (who)(listing_id) )
FC_REFLECT( relic::protocol::listing_buy_operation, (buyer)(listing_id)(payment) )
FC_REFLECT( relic::protocol::offer_create_operation, (buyer)(registry)(token_id)(amount)(duration_seconds) )
FC_REFLECT( relic::protocol::offer_accept_operation, (seller)(offer_id) )
FC_REFLECT( relic::protocol::offer_cancel_operation, (who)(offer_id) )
FC_REFLECT( relic::protocol::listing_deactivated_operation, (listing_id)(seller) )
