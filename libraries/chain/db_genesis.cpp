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
#include <relic/chain/marketplace_object.hpp>
#include <relic/chain/royalty_object.hpp>

namespace relic { namespace chain {

void database::init_genesis(const genesis_state_type& genesis_state)
{ try {
   FC_ASSERT( get_index<account_object>().get_next_id() == object_id_type( account_id_type() ),
              "Genesis state can only be applied to an empty database" );
   FC_ASSERT( genesis_state.treasury_supply >= 0 && genesis_state.treasury_supply <= RELIC_MAX_SHARE_SUPPLY,
              "Invalid treasury supply" );
   FC_ASSERT( genesis_state.escrow_fee_bps <= RELIC_MAX_FEE_BPS, "Fee too high" );
   FC_ASSERT( genesis_state.marketplace_fee_bps <= RELIC_MAX_FEE_BPS, "Fee too high" );

   ilog( "Initializing settlement engines from genesis state" );

   _undo_db.disable();

   // Create the reserved accounts
   auto create_reserved = [this]( const string& name, bool is_contract ) -> const account_object& {
      return create<account_object>( [&name,is_contract]( account_object& a ) {
         a.name = name;
         a.is_contract = is_contract;
         a.accepts_assets = true;
      });
   };
   FC_ASSERT( create_reserved( RELIC_ESCROW_ACCOUNT_NAME, true ).get_id() == RELIC_ESCROW_ACCOUNT );
   FC_ASSERT( create_reserved( RELIC_MARKETPLACE_ACCOUNT_NAME, true ).get_id() == RELIC_MARKETPLACE_ACCOUNT );
   FC_ASSERT( create_reserved( RELIC_TREASURY_ACCOUNT_NAME, false ).get_id() == RELIC_TREASURY_ACCOUNT );

   adjust_balance( RELIC_TREASURY_ACCOUNT, genesis_state.treasury_supply );

   // Create initial accounts
   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( is_valid_name( account.name ), "Invalid account name '${n}'", ("n", account.name) );
      FC_ASSERT( find_account_by_name( account.name ) == nullptr, "Duplicate account name '${n}'",
                 ("n", account.name) );
      FC_ASSERT( account.balance >= 0, "Initial balances may not be negative" );
      const account_object& new_account = create<account_object>( [&account]( account_object& a ) {
         a.name = account.name;
         a.registrar = RELIC_TREASURY_ACCOUNT;
         a.is_contract = account.is_contract;
         a.accepts_assets = account.accepts_assets;
      });
      adjust_balance( new_account.get_id(), account.balance );
   }

   auto get_account_id = [this]( const string& name ) {
      return get_account_by_name( name ).get_id();
   };

   // Create global properties
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
   });

   // Create engine settings, one per engine_type in order
   create<engine_settings_object>( [&]( engine_settings_object& s ) {
      s.engine = escrow_engine;
      s.owner = get_account_id( genesis_state.escrow_owner_name );
      s.custody_account = RELIC_ESCROW_ACCOUNT;
      s.fee_bps = genesis_state.escrow_fee_bps;
      s.fee_recipient = get_account_id( genesis_state.escrow_fee_recipient_name );
      s.dispute_resolver = get_account_id( genesis_state.dispute_resolver_name );
      s.dispute_window = genesis_state.dispute_window;
   });
   create<engine_settings_object>( [&]( engine_settings_object& s ) {
      s.engine = marketplace_engine;
      s.owner = get_account_id( genesis_state.marketplace_owner_name );
      s.custody_account = RELIC_MARKETPLACE_ACCOUNT;
      s.fee_bps = genesis_state.marketplace_fee_bps;
      s.fee_recipient = get_account_id( genesis_state.marketplace_fee_recipient_name );
   });
   create<engine_settings_object>( [&]( engine_settings_object& s ) {
      s.engine = royalty_engine;
      s.owner = get_account_id( genesis_state.royalty_owner_name );
      s.fee_recipient = s.owner;
   });
   FC_ASSERT( get_engine_settings( royalty_engine ).engine == royalty_engine );

   create<marketplace_statistics_object>( []( marketplace_statistics_object& ) {} );

   if( genesis_state.default_royalty.valid() && genesis_state.default_royalty->bps > 0 )
   {
      FC_ASSERT( genesis_state.default_royalty->bps <= RELIC_MAX_ROYALTY_BPS, "Royalty too high" );
      const auto recipient = get_account_id( genesis_state.default_royalty->recipient_name );
      create<royalty_record_object>( [&]( royalty_record_object& r ) {
         r.scope = default_royalty;
         r.recipient = recipient;
         r.bps = genesis_state.default_royalty->bps;
      });
   }

   _undo_db.enable();

   ilog( "Genesis created ${n} accounts, head time ${t}",
         ("n", genesis_state.initial_accounts.size() + 3)("t", genesis_state.initial_timestamp) );
} FC_CAPTURE_AND_RETHROW() }

} }
