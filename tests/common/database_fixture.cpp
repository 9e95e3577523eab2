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
#include <boost/test/unit_test.hpp>

#include <relic/chain/database.hpp>

#include <fc/log/logger.hpp>

#include <iostream>

#include "database_fixture.hpp"

using namespace relic::chain::test;

uint32_t RELIC_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace relic { namespace chain {

using std::cout;
using std::cerr;

namespace buf = boost::unit_test::framework;

database_fixture::database_fixture( const fc::time_point_sec& initial_timestamp )
   : current_test_name( buf::current_test_case().p_name.value ),
     current_suite_name( buf::get<boost::unit_test::test_suite>( buf::current_test_case().p_parent_id ).p_name.value )
{
   try {
   int argc = buf::master_test_suite().argc;
   char** argv = buf::master_test_suite().argv;
   for( int i=1; i<argc; i++ )
   {
      const std::string arg = argv[i];
      if( arg == "--record-assert-trip" )
         fc::enable_record_assert_trip = true;
      if( arg == "--show-test-names" )
         std::cout << "running test " << buf::current_test_case().p_name << std::endl;
   }

   genesis_state.initial_timestamp = initial_timestamp;
   genesis_state.treasury_supply = RLC(1000000);

   genesis_state.initial_accounts.emplace_back( "admin" );
   genesis_state.initial_accounts.emplace_back( "feesink" );
   genesis_state.initial_accounts.emplace_back( "arbiter" );

   genesis_state.escrow_owner_name = "admin";
   genesis_state.marketplace_owner_name = "admin";
   genesis_state.royalty_owner_name = "admin";
   genesis_state.escrow_fee_recipient_name = "feesink";
   genesis_state.marketplace_fee_recipient_name = "feesink";
   genesis_state.dispute_resolver_name = "arbiter";

   db.init_genesis( genesis_state );
   } catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

database_fixture::~database_fixture()
{
}

processed_transaction database_fixture::push_operation( const operation& op )
{
   trx.operations.clear();
   trx.operations.push_back( op );
   auto result = PUSH_TX( db, trx );
   trx.operations.clear();
   return result;
}

const account_object& database_fixture::create_account( const string& name, bool is_contract, bool accepts_assets )
{ try {
   account_create_operation create_account;
   create_account.registrar = RELIC_TREASURY_ACCOUNT;
   create_account.name = name;
   create_account.is_contract = is_contract;
   create_account.accepts_assets = accepts_assets;
   processed_transaction ptx = push_operation( create_account );
   return db.get<account_object>( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (name)(is_contract)(accepts_assets) ) }

const account_object& database_fixture::get_account( const string& name )const
{
   return db.get_account_by_name( name );
}

account_id_type database_fixture::engine_owner()const
{
   return get_account( "admin" ).get_id();
}

void database_fixture::transfer( account_id_type from, account_id_type to, share_type amount )
{ try {
   transfer_operation trans;
   trans.from = from;
   trans.to = to;
   trans.amount = amount;
   push_operation( trans );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void database_fixture::fund( account_id_type to, share_type amount )
{
   transfer( RELIC_TREASURY_ACCOUNT, to, amount );
}

share_type database_fixture::get_balance( account_id_type account )const
{
   return db.get_balance( account );
}

const asset_registry_object& database_fixture::create_registry( account_id_type issuer, const string& symbol,
                                                                optional<registry_royalty> royalty )
{ try {
   asset_registry_create_operation creator;
   creator.issuer = issuer;
   creator.name = symbol + " collection";
   creator.symbol = symbol;
   creator.royalty = royalty;
   processed_transaction ptx = push_operation( creator );
   return db.get<asset_registry_object>( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (issuer)(symbol)(royalty) ) }

const nft_object& database_fixture::mint( asset_registry_id_type registry, account_id_type to, token_id_type token_id )
{ try {
   nft_mint_operation minter;
   minter.issuer = registry(db).issuer;
   minter.registry = registry;
   minter.to = to;
   minter.token_id = token_id;
   minter.uri = "ipfs://token/" + fc::to_string( token_id );
   processed_transaction ptx = push_operation( minter );
   return db.get<nft_object>( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (registry)(to)(token_id) ) }

void database_fixture::approve( account_id_type owner, asset_registry_id_type registry, token_id_type token_id,
                                optional<account_id_type> approved )
{ try {
   nft_approve_operation op;
   op.owner = owner;
   op.registry = registry;
   op.token_id = token_id;
   op.approved = approved;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (owner)(registry)(token_id)(approved) ) }

void database_fixture::set_approval_for_all( account_id_type owner, asset_registry_id_type registry,
                                             account_id_type operator_account, bool approved )
{ try {
   nft_set_approval_for_all_operation op;
   op.owner = owner;
   op.registry = registry;
   op.operator_account = operator_account;
   op.approved = approved;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (owner)(registry)(operator_account)(approved) ) }

account_id_type database_fixture::owner_of( asset_registry_id_type registry, token_id_type token_id )
{
   return db.get_asset_registry( registry )->owner_of( token_id );
}

void database_fixture::whitelist( engine_type engine, asset_registry_id_type registry, bool whitelisted )
{ try {
   engine_whitelist_operation op;
   op.owner = engine_owner();
   op.engine = engine;
   op.registry = registry;
   op.whitelisted = whitelisted;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (engine)(registry)(whitelisted) ) }

void database_fixture::pause( engine_type engine, bool paused )
{ try {
   engine_pause_operation op;
   op.owner = engine_owner();
   op.engine = engine;
   op.paused = paused;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (engine)(paused) ) }

void database_fixture::set_fee( engine_type engine, uint16_t fee_bps )
{ try {
   engine_update_operation op;
   op.owner = engine_owner();
   op.engine = engine;
   op.fee_bps = fee_bps;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (engine)(fee_bps) ) }

escrow_id_type database_fixture::create_escrow( account_id_type seller, account_id_type buyer,
                                                asset_registry_id_type registry, token_id_type token_id,
                                                share_type price, uint32_t seconds_to_deadline )
{ try {
   escrow_create_operation op;
   op.seller = seller;
   op.buyer = buyer;
   op.registry = registry;
   op.token_id = token_id;
   op.payment = price;
   op.deadline = db.head_time() + seconds_to_deadline;
   processed_transaction ptx = push_operation( op );
   return escrow_id_type( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (seller)(buyer)(registry)(token_id)(price)(seconds_to_deadline) ) }

operation_result database_fixture::approve_escrow( account_id_type who, escrow_id_type id )
{ try {
   escrow_approve_operation op;
   op.who = who;
   op.escrow_id = id;
   return push_operation( op ).operation_results[0];
} FC_CAPTURE_AND_RETHROW( (who)(id) ) }

listing_id_type database_fixture::list_item( account_id_type seller, asset_registry_id_type registry,
                                             token_id_type token_id, share_type price, uint32_t duration_seconds )
{ try {
   listing_create_operation op;
   op.seller = seller;
   op.registry = registry;
   op.token_id = token_id;
   op.price = price;
   op.duration_seconds = duration_seconds;
   processed_transaction ptx = push_operation( op );
   return listing_id_type( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (seller)(registry)(token_id)(price)(duration_seconds) ) }

settlement_result database_fixture::buy_item( account_id_type buyer, listing_id_type id, share_type payment )
{ try {
   listing_buy_operation op;
   op.buyer = buyer;
   op.listing_id = id;
   op.payment = payment;
   return push_operation( op ).operation_results[0].get<settlement_result>();
} FC_CAPTURE_AND_RETHROW( (buyer)(id)(payment) ) }

offer_id_type database_fixture::make_offer( account_id_type buyer, asset_registry_id_type registry,
                                            token_id_type token_id, share_type amount, uint32_t duration_seconds )
{ try {
   offer_create_operation op;
   op.buyer = buyer;
   op.registry = registry;
   op.token_id = token_id;
   op.amount = amount;
   op.duration_seconds = duration_seconds;
   processed_transaction ptx = push_operation( op );
   return offer_id_type( ptx.operation_results[0].get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (buyer)(registry)(token_id)(amount)(duration_seconds) ) }

settlement_result database_fixture::accept_offer( account_id_type seller, offer_id_type id )
{ try {
   offer_accept_operation op;
   op.seller = seller;
   op.offer_id = id;
   return push_operation( op ).operation_results[0].get<settlement_result>();
} FC_CAPTURE_AND_RETHROW( (seller)(id) ) }

void database_fixture::set_default_royalty( optional<account_id_type> recipient, uint16_t bps )
{ try {
   royalty_set_default_operation op;
   op.owner = engine_owner();
   op.recipient = recipient;
   op.bps = bps;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (recipient)(bps) ) }

void database_fixture::set_contract_royalty( account_id_type who, asset_registry_id_type registry,
                                             optional<account_id_type> recipient, uint16_t bps )
{ try {
   royalty_set_contract_operation op;
   op.who = who;
   op.registry = registry;
   op.recipient = recipient;
   op.bps = bps;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (who)(registry)(recipient)(bps) ) }

void database_fixture::set_token_royalty( account_id_type who, asset_registry_id_type registry,
                                          token_id_type token_id, optional<account_id_type> recipient, uint16_t bps )
{ try {
   royalty_set_token_operation op;
   op.who = who;
   op.registry = registry;
   op.token_id = token_id;
   op.recipient = recipient;
   op.bps = bps;
   push_operation( op );
} FC_CAPTURE_AND_RETHROW( (who)(registry)(token_id)(recipient)(bps) ) }

void database_fixture::advance_time( uint32_t seconds )
{
   db.set_head_time( db.head_time() + seconds );
}

namespace test {

processed_transaction _push_transaction( database& db, const transaction& tx )
{ try {
   return db.push_transaction( tx );
} FC_CAPTURE_AND_RETHROW( (tx) ) }

} // relic::chain::test

} } // relic::chain
