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
#include <relic/protocol/operations.hpp>

namespace relic { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All operations of a transaction are applied in order and they succeed or fail together:
    * when one of them throws, the effects of all of them are discarded.
    */

   /**
    *  @brief groups a set of operations that must be applied atomically
    *  @ingroup transactions
    */
   struct transaction
   {
      vector<operation>  operations;

      /// Calls the validate() method of every operation
      void validate()const;

      void clear() { operations.clear(); }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  When processing a transaction some operations generate
    *  new object IDs and these IDs cannot be known until the
    *  transaction is actually included in the engine state.
    *  The operation results carry these IDs as well as the settlement splits.
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // relic::protocol

FC_REFLECT( relic::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( relic::protocol::processed_transaction, (relic::protocol::transaction), (operation_results) )
