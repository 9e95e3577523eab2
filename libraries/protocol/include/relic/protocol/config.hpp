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

#define RELIC_SYMBOL "RLC"

#define RELIC_BLOCKCHAIN_PRECISION        uint64_t( 100000000 )
#define RELIC_BLOCKCHAIN_PRECISION_DIGITS 8

#define RELIC_MIN_ACCOUNT_NAME_LENGTH 1
#define RELIC_MAX_ACCOUNT_NAME_LENGTH 63

#define RELIC_MIN_REGISTRY_SYMBOL_LENGTH 3
#define RELIC_MAX_REGISTRY_SYMBOL_LENGTH 16
#define RELIC_MAX_REGISTRY_NAME_LENGTH   127
#define RELIC_MAX_URI_LENGTH             2048

#define RELIC_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)

/** basis points */
#define RELIC_100_PERCENT 10000
#define RELIC_1_PERCENT   (RELIC_100_PERCENT/100)

#define RELIC_MAX_FEE_BPS              (10*RELIC_1_PERCENT) ///< 10%
#define RELIC_MAX_ROYALTY_BPS          (10*RELIC_1_PERCENT) ///< 10%, also the ceiling for registry-reported royalties
#define RELIC_DEFAULT_FEE_BPS          250                  ///< 2.5%
#define RELIC_DEFAULT_DISPUTE_WINDOW   (60*60*24*7)         ///< seconds, 7 days

#define RELIC_MAX_UNDO_HISTORY 256

#define RELIC_MAX_NESTED_OBJECTS (200)

/**
 *  Reserved accounts, created by genesis in this order.
 */
///@{
/// Holds escrowed assets and escrowed payments
#define RELIC_ESCROW_ACCOUNT (relic::protocol::account_id_type(0))
/// Holds the amounts of open offers and routes sale payments
#define RELIC_MARKETPLACE_ACCOUNT (relic::protocol::account_id_type(1))
/// Receives the initial supply of the native currency
#define RELIC_TREASURY_ACCOUNT (relic::protocol::account_id_type(2))
///@}

#define RELIC_ESCROW_ACCOUNT_NAME      "escrow"
#define RELIC_MARKETPLACE_ACCOUNT_NAME "marketplace"
#define RELIC_TREASURY_ACCOUNT_NAME    "treasury"
