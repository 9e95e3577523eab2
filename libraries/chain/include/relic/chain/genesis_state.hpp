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

#include <relic/chain/types.hpp>

#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace relic { namespace chain {
using std::string;
using std::vector;

/**
 *  Initial state of the engines.  Engine owners, fee recipients and the dispute resolver
 *  are referenced by account name; the reserved accounts (escrow, marketplace, treasury)
 *  are always created first and may be named too.
 */
struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string(),
                           share_type balance = 0,
                           bool is_contract = false,
                           bool accepts_assets = true)
         : name(name),
           balance(balance),
           is_contract(is_contract),
           accepts_assets(accepts_assets)
      {}
      string      name;
      share_type  balance;
      bool        is_contract = false;
      bool        accepts_assets = true;
   };
   struct initial_royalty_type {
      string      recipient_name;
      uint16_t    bps = 0;
   };

   time_point_sec                           initial_timestamp;
   share_type                               treasury_supply;
   vector<initial_account_type>             initial_accounts;

   string                                   escrow_owner_name = RELIC_TREASURY_ACCOUNT_NAME;
   string                                   marketplace_owner_name = RELIC_TREASURY_ACCOUNT_NAME;
   string                                   royalty_owner_name = RELIC_TREASURY_ACCOUNT_NAME;
   string                                   escrow_fee_recipient_name = RELIC_TREASURY_ACCOUNT_NAME;
   string                                   marketplace_fee_recipient_name = RELIC_TREASURY_ACCOUNT_NAME;
   uint16_t                                 escrow_fee_bps = RELIC_DEFAULT_FEE_BPS;
   uint16_t                                 marketplace_fee_bps = RELIC_DEFAULT_FEE_BPS;
   string                                   dispute_resolver_name = RELIC_TREASURY_ACCOUNT_NAME;
   uint32_t                                 dispute_window = RELIC_DEFAULT_DISPUTE_WINDOW;
   optional<initial_royalty_type>           default_royalty;
};

/**
 * Reads a genesis state from a JSON file.
 */
genesis_state_type load_genesis_from_file( const fc::path& genesis_file );

} } // namespace relic::chain

FC_REFLECT( relic::chain::genesis_state_type::initial_account_type,
            (name)(balance)(is_contract)(accepts_assets) )

FC_REFLECT( relic::chain::genesis_state_type::initial_royalty_type, (recipient_name)(bps) )

FC_REFLECT( relic::chain::genesis_state_type,
            (initial_timestamp)(treasury_supply)(initial_accounts)
            (escrow_owner_name)(marketplace_owner_name)(royalty_owner_name)
            (escrow_fee_recipient_name)(marketplace_fee_recipient_name)
            (escrow_fee_bps)(marketplace_fee_bps)(dispute_resolver_name)(dispute_window)
            (default_royalty) )
