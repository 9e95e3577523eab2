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
#include <relic/protocol/account.hpp>
#include <relic/protocol/nft.hpp>

namespace relic { namespace protocol {

void asset_registry_create_operation::validate()const
{
   FC_ASSERT( !name.empty(), "Registry name should not be empty" );
   FC_ASSERT( name.size() <= RELIC_MAX_REGISTRY_NAME_LENGTH, "Registry name is too long" );
   FC_ASSERT( is_valid_symbol( symbol ), "Invalid registry symbol ${s}", ("s", symbol) );
   if( royalty.valid() )
      FC_ASSERT( royalty->bps <= RELIC_100_PERCENT, "Declared royalty can not exceed 100%" );
}

void nft_mint_operation::validate()const
{
   FC_ASSERT( uri.size() <= RELIC_MAX_URI_LENGTH, "Token URI is too long" );
}

void nft_approve_operation::validate()const
{
   if( approved.valid() )
      FC_ASSERT( *approved != owner, "Approval to current owner" );
}

void nft_set_approval_for_all_operation::validate()const
{
   FC_ASSERT( operator_account != owner, "Approve to caller" );
}

void nft_transfer_operation::validate()const
{
   FC_ASSERT( from != to, "Cannot transfer a token to its owner" );
}

} } // relic::protocol
