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

#include <fc/exception/exception.hpp>
#include <relic/protocol/exceptions.hpp>
#include <relic/chain/types.hpp>

namespace relic { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "settlement engine exception" )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,      relic::chain::chain_exception, 3010000,
                                 "database query exception" )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_process_exception, relic::chain::chain_exception, 3030000,
                                 "transaction processing exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,  relic::chain::chain_exception, 3040000,
                                 "operation validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,  relic::chain::chain_exception, 3050000,
                                 "operation evaluation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,       relic::chain::chain_exception, 3070000,
                                 "undo database exception" )

   FC_DECLARE_DERIVED_EXCEPTION( settlement_exception,          relic::chain::operation_evaluate_exception, 3110000,
                                 "settlement exception" )

   /// caller is not the seller, buyer, owner, resolver or participant the operation requires
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_caller_exception, relic::chain::settlement_exception, 3110001,
                                 "caller is not authorized" )
   /// inactive, expired or wrong-status record, or an unknown id
   FC_DECLARE_DERIVED_EXCEPTION( invalid_state_exception,       relic::chain::settlement_exception, 3110002,
                                 "record is not in the required state" )
   /// parameter that can only be judged against the current state, such as a deadline
   FC_DECLARE_DERIVED_EXCEPTION( invalid_parameter_exception,   relic::chain::settlement_exception, 3110003,
                                 "invalid parameter" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_payment_exception, relic::chain::settlement_exception, 3110004,
                                 "insufficient payment" )
   /// asset not owned or not approved by the expected party, or refused by its receiver
   FC_DECLARE_DERIVED_EXCEPTION( custody_exception,             relic::chain::settlement_exception, 3110005,
                                 "asset custody exception" )
   FC_DECLARE_DERIVED_EXCEPTION( registry_not_whitelisted_exception, relic::chain::settlement_exception, 3110006,
                                 "asset registry is not whitelisted" )
   FC_DECLARE_DERIVED_EXCEPTION( engine_paused_exception,       relic::chain::settlement_exception, 3110007,
                                 "engine is paused" )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception, relic::chain::operation_evaluate_exception, 3050001,
                                 "insufficient balance" )

} } // relic::chain
