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
#include <relic/protocol/account.hpp>
#include <relic/protocol/engine.hpp>
#include <relic/protocol/escrow.hpp>
#include <relic/protocol/marketplace.hpp>
#include <relic/protocol/nft.hpp>
#include <relic/protocol/royalty.hpp>
#include <relic/protocol/transfer.hpp>

namespace relic { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ account_create_operation,
            /*  1 */ transfer_operation,
            /*  2 */ asset_registry_create_operation,
            /*  3 */ nft_mint_operation,
            /*  4 */ nft_approve_operation,
            /*  5 */ nft_set_approval_for_all_operation,
            /*  6 */ nft_transfer_operation,
            /*  7 */ engine_update_operation,
            /*  8 */ engine_pause_operation,
            /*  9 */ engine_whitelist_operation,
            /* 10 */ engine_emergency_withdraw_operation,
            /* 11 */ escrow_create_operation,
            /* 12 */ escrow_approve_operation,
            /* 13 */ escrow_cancel_operation,
            /* 14 */ escrow_dispute_operation,
            /* 15 */ escrow_resolve_dispute_operation,
            /* 16 */ listing_create_operation,
            /* 17 */ listing_update_operation,
            /* 18 */ listing_cancel_operation,
            /* 19 */ listing_buy_operation,
            /* 20 */ offer_create_operation,
            /* 21 */ offer_accept_operation,
            /* 22 */ offer_cancel_operation,
            /* 23 */ royalty_set_default_operation,
            /* 24 */ royalty_set_contract_operation,
            /* 25 */ royalty_set_token_operation,
            /* 26 */ escrow_completed_operation,        // VIRTUAL
            /* 27 */ escrow_refunded_operation,         // VIRTUAL
            /* 28 */ listing_deactivated_operation      // VIRTUAL
         > operation;

   /// @} // operations group

   /**
    *  Performs stateless validation of an operation; throws fc::exception when it is malformed.
    */
   void operation_validate( const operation& op );

   /** the account an operation acts on behalf of */
   account_id_type operation_caller( const operation& op );

   bool is_virtual_operation( const operation& op );

} } // relic::protocol

FC_REFLECT_TYPENAME( relic::protocol::operation )
