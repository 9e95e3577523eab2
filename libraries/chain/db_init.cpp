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
#include <relic/chain/database.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/escrow_object.hpp>
#include <relic/chain/marketplace_object.hpp>
#include <relic/chain/nft_object.hpp>
#include <relic/chain/royalty_object.hpp>

#include <relic/chain/account_evaluator.hpp>
#include <relic/chain/engine_evaluator.hpp>
#include <relic/chain/escrow_evaluator.hpp>
#include <relic/chain/marketplace_evaluator.hpp>
#include <relic/chain/nft_evaluator.hpp>
#include <relic/chain/royalty_evaluator.hpp>
#include <relic/chain/transfer_evaluator.hpp>

namespace relic { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<account_create_evaluator>();
   register_evaluator<transfer_evaluator>();
   register_evaluator<asset_registry_create_evaluator>();
   register_evaluator<nft_mint_evaluator>();
   register_evaluator<nft_approve_evaluator>();
   register_evaluator<nft_set_approval_for_all_evaluator>();
   register_evaluator<nft_transfer_evaluator>();
   register_evaluator<engine_update_evaluator>();
   register_evaluator<engine_pause_evaluator>();
   register_evaluator<engine_whitelist_evaluator>();
   register_evaluator<engine_emergency_withdraw_evaluator>();
   register_evaluator<escrow_create_evaluator>();
   register_evaluator<escrow_approve_evaluator>();
   register_evaluator<escrow_cancel_evaluator>();
   register_evaluator<escrow_dispute_evaluator>();
   register_evaluator<escrow_resolve_dispute_evaluator>();
   register_evaluator<listing_create_evaluator>();
   register_evaluator<listing_update_evaluator>();
   register_evaluator<listing_cancel_evaluator>();
   register_evaluator<listing_buy_evaluator>();
   register_evaluator<offer_create_evaluator>();
   register_evaluator<offer_accept_evaluator>();
   register_evaluator<offer_cancel_evaluator>();
   register_evaluator<royalty_set_default_evaluator>();
   register_evaluator<royalty_set_contract_evaluator>();
   register_evaluator<royalty_set_token_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( RELIC_MAX_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<asset_registry_index> >();
   add_index< primary_index<nft_index> >();
   add_index< primary_index<escrow_index> >();
   add_index< primary_index<listing_index> >();
   add_index< primary_index<offer_index> >();

   //Implementation object indexes
   add_index< primary_index<simple_index<dynamic_global_property_object> > >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<simple_index<engine_settings_object> > >();
   add_index< primary_index<simple_index<marketplace_statistics_object> > >();
   add_index< primary_index<royalty_record_index> >();
   add_index< primary_index<nft_operator_approval_index> >();
}

} }
