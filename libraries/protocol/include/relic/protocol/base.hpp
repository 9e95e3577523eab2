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

#include <relic/protocol/types.hpp>

namespace relic { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup transactions Transactions
    *  @brief A set of valid commands for mutating the settlement state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  state of the engines.  The members of each struct are like function
    *  arguments and each operation can potentially generate a return value.
    *
    *  Operations can be grouped into transactions (@ref transaction) to ensure that they occur
    *  in a particular order and that all operations apply successfully or
    *  no operations apply.
    *
    *  Each operation names the account that invokes it.  Authenticating that account is the
    *  business of the environment hosting the engines; the engines only check what the named
    *  account is allowed to do.
    *
    *  Payments travel with the operation that needs them (see the @c payment and @c amount
    *  members).  They are taken from the caller's balance when the operation is applied.
    *
    *  @{
    */

   struct void_result{};

   /**
    *  How a single payment was split by a sale or a completed escrow.
    *  seller_amount + fee + royalty always equals the settled price.
    */
   struct settlement_result
   {
      account_id_type            seller;
      share_type                 seller_amount;
      account_id_type            fee_recipient;
      share_type                 fee;
      optional<account_id_type>  royalty_recipient;
      share_type                 royalty;
      share_type                 refund;        ///< overpayment returned to the payer
   };

   typedef fc::static_variant<void_result,object_id_type,settlement_result> operation_result;

   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const{}
   };

   ///@}

} } // relic::protocol

FC_REFLECT_TYPENAME( relic::protocol::operation_result )
FC_REFLECT( relic::protocol::void_result, )
FC_REFLECT( relic::protocol::settlement_result,
            (seller)(seller_amount)(fee_recipient)(fee)(royalty_recipient)(royalty)(refund) )
