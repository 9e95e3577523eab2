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
#include <relic/protocol/engine.hpp>
#include <relic/protocol/exceptions.hpp>
#include <relic/protocol/transfer.hpp>

namespace relic { namespace protocol {

FC_IMPLEMENT_EXCEPTION( protocol_exception, 4000000, "protocol exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( transaction_exception,      protocol_exception, 4010000,
                                "transaction validation exception" )

FC_IMPLEMENT_DERIVED_EXCEPTION( tx_empty_operations,        transaction_exception, 4010001,
                                "transaction has no operations" )
FC_IMPLEMENT_DERIVED_EXCEPTION( tx_virtual_operation,       transaction_exception, 4010002,
                                "virtual operations can not be pushed" )

void transfer_operation::validate()const
{
   FC_ASSERT( from != to, "Cannot transfer to self" );
   FC_ASSERT( amount > 0, "Amount must be greater than 0" );
   FC_ASSERT( amount <= RELIC_MAX_SHARE_SUPPLY, "Amount exceeds the maximum supply" );
}

static void validate_engine( engine_type engine )
{
   FC_ASSERT( engine < ENGINE_TYPE_COUNT, "Unknown engine ${e}", ("e", uint32_t(engine)) );
}

void engine_update_operation::validate()const
{
   validate_engine( engine );
   FC_ASSERT( fee_bps.valid() || fee_recipient.valid() || dispute_resolver.valid() || new_owner.valid(),
              "Nothing to update" );
   if( fee_bps.valid() )
   {
      FC_ASSERT( engine != royalty_engine, "The royalty engine does not charge a fee" );
      FC_ASSERT( *fee_bps <= RELIC_MAX_FEE_BPS, "Fee too high" );
   }
   if( fee_recipient.valid() )
      FC_ASSERT( engine != royalty_engine, "The royalty engine does not charge a fee" );
   if( dispute_resolver.valid() )
      FC_ASSERT( engine == escrow_engine, "Only the escrow engine has a dispute resolver" );
}

void engine_pause_operation::validate()const
{
   validate_engine( engine );
}

void engine_whitelist_operation::validate()const
{
   validate_engine( engine );
   FC_ASSERT( engine != royalty_engine, "The royalty engine has no whitelist" );
}

void engine_emergency_withdraw_operation::validate()const
{
   validate_engine( engine );
   FC_ASSERT( engine != royalty_engine, "The royalty engine holds no funds" );
}

} } // relic::protocol
