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
    *  @brief Put a token and a payment into escrow
    *  @ingroup operations
    *
    *  The seller hands the token to the escrow custody account together with the payment.
    *  Once both the seller and the buyer approve, the token goes to the buyer and the payment
    *  (less the escrow fee) goes to the seller.  Either party may cancel while the escrow is
    *  active, anybody may cancel it after the deadline, and either party may raise a dispute
    *  until the dispute window that follows the deadline closes.  A disputed escrow is settled
    *  by the dispute resolver.
    *
    *  The escrow engine must be approved to move the token before this operation is pushed.
    */
   struct escrow_create_operation : public base_operation
   {
      account_id_type         seller;
      account_id_type         buyer;
      asset_registry_id_type  registry;
      token_id_type           token_id = 0;
      time_point_sec          deadline;
      share_type              payment;       ///< Held by the escrow, this is the escrow price

      account_id_type caller()const { return seller; }
      void            validate()const override;
   };

   /**
    *  Seller or buyer approval.  The second approval completes the escrow.
    */
   struct escrow_approve_operation : public base_operation
   {
      account_id_type  who;
      escrow_id_type   escrow_id;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /**
    *  Returns the token to the seller and the payment to the buyer.
    */
   struct escrow_cancel_operation : public base_operation
   {
      account_id_type  who;
      escrow_id_type   escrow_id;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   struct escrow_dispute_operation : public base_operation
   {
      account_id_type  who;
      escrow_id_type   escrow_id;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /**
    *  The dispute resolver settles a disputed escrow, either completing it in favor of the
    *  buyer or cancelling it in favor of the seller.
    */
   struct escrow_resolve_dispute_operation : public base_operation
   {
      account_id_type  resolver;
      escrow_id_type   escrow_id;
      bool             favor_buyer = false;

      account_id_type caller()const { return resolver; }
      void            validate()const override;
   };

   /**
    *  @brief Virtual op, generated when an escrow completes
    *  @ingroup operations
    */
   struct escrow_completed_operation : public base_operation
   {
      escrow_completed_operation() = default;
      escrow_completed_operation( escrow_id_type id, account_id_type s, account_id_type b,
                                  share_type amount, account_id_type recipient, share_type f )
      : escrow_id(id), seller(s), buyer(b), seller_amount(amount), fee_recipient(recipient), fee(f) {}

      escrow_id_type   escrow_id;
      account_id_type  seller;
      account_id_type  buyer;
      share_type       seller_amount;
      account_id_type  fee_recipient;
      share_type       fee;

      account_id_type caller()const { return seller; }
      void            validate()const override { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    *  @brief Virtual op, generated when an escrow is cancelled and unwound
    *  @ingroup operations
    */
   struct escrow_refunded_operation : public base_operation
   {
      escrow_refunded_operation() = default;
      escrow_refunded_operation( escrow_id_type id, account_id_type s, account_id_type b, share_type amount )
      : escrow_id(id), seller(s), buyer(b), refund(amount) {}

      escrow_id_type   escrow_id;
      account_id_type  seller;   ///< Receives the token back
      account_id_type  buyer;    ///< Receives the held payment
      share_type       refund;

      account_id_type caller()const { return buyer; }
      void            validate()const override { FC_ASSERT( !"virtual operation" ); }
   };

} } // relic::protocol

FC_REFLECT( relic::protocol::escrow_create_operation, (seller)(buyer)(registry)(token_id)(deadline)(payment) )
FC_REFLECT( relic::protocol::escrow_approve_operation, (who)(escrow_id) )
FC_REFLECT( relic::protocol::escrow_cancel_operation, (who)(escrow_id) )
FC_REFLECT( relic::protocol::escrow_dispute_operation, (who)(escrow_id) )
FC_REFLECT( relic::protocol::escrow_resolve_dispute_operation, (resolver)(escrow_id)(favor_buyer) )
FC_REFLECT( relic::protocol::escrow_completed_operation,
            (escrow_id)(seller)(buyer)(seller_amount)(fee_recipient)(fee) )
FC_REFLECT( relic::protocol::escrow_refunded_operation, (escrow_id)(seller)(buyer)(refund) )
