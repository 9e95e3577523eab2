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
#include <relic/protocol/marketplace.hpp>

namespace relic { namespace protocol {

static void validate_amount( const share_type& amount, const char* what )
{
   FC_ASSERT( amount > 0, "${w} must be greater than 0", ("w", what) );
   FC_ASSERT( amount <= RELIC_MAX_SHARE_SUPPLY, "${w} exceeds the maximum supply", ("w", what) );
}

void listing_create_operation::validate()const
{
   validate_amount( price, "Price" );
   FC_ASSERT( duration_seconds > 0, "Duration must be greater than 0" );
}

void listing_update_operation::validate()const
{
   validate_amount( new_price, "Price" );
}

void listing_cancel_operation::validate()const {}

void listing_buy_operation::validate()const
{
   validate_amount( payment, "Payment" );
}

void offer_create_operation::validate()const
{
   validate_amount( amount, "Offer amount" );
   FC_ASSERT( duration_seconds > 0, "Duration must be greater than 0" );
}

void offer_accept_operation::validate()const {}
void offer_cancel_operation::validate()const {}

} } // relic::protocol
