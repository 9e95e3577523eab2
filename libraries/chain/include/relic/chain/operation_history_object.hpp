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
#include <relic/chain/types.hpp>

namespace relic { namespace chain {

   /**
    * @brief tracks the history of all logical operations on engine state
    * @ingroup implementation
    *
    *  All operations and virtual operations result in an operation_history_object.  Each
    *  real or virtual operation is assigned a unique sequence number when the transaction
    *  that produced it is committed.  The records are handed to the observers of
    *  database::applied_operation, the engines do not keep them.
    *
    *  @note  this object is READ ONLY it can never be modified
    */
   class operation_history_object
   {
      public:
         operation_history_object( const operation& o ):op(o){}
         operation_history_object(){}

         operation         op;
         operation_result  result;
         uint64_t          sequence = 0;
         /** the operation within the transaction */
         uint16_t          op_in_trx = 0;
         /** any virtual operations implied by operation in transaction */
         uint16_t          virtual_op = 0;
         /** head time when the operation was applied */
         time_point_sec    time;

         bool is_virtual()const { return is_virtual_operation( op ); }
   };

} } // relic::chain

FC_REFLECT( relic::chain::operation_history_object,
            (op)(result)(sequence)(op_in_trx)(virtual_op)(time) )
