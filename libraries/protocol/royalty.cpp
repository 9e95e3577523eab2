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
#include <relic/protocol/royalty.hpp>

namespace relic { namespace protocol {

void validate_royalty_setting( const optional<account_id_type>& recipient, uint16_t bps )
{
   FC_ASSERT( bps <= RELIC_MAX_ROYALTY_BPS, "Royalty too high" );
   if( bps > 0 )
      FC_ASSERT( recipient.valid(), "Invalid recipient" );
}

void royalty_set_default_operation::validate()const
{
   validate_royalty_setting( recipient, bps );
}

void royalty_set_contract_operation::validate()const
{
   validate_royalty_setting( recipient, bps );
}

void royalty_set_token_operation::validate()const
{
   validate_royalty_setting( recipient, bps );
}

} } // relic::protocol
