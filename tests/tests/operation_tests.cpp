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
#include <relic/chain/account_object.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace relic::chain;
using namespace relic::chain::test;

BOOST_FIXTURE_TEST_SUITE( operation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_account_test )
{ try {
   const account_object& nathan = create_account( "nathan" );
   BOOST_CHECK_EQUAL( nathan.name, "nathan" );
   BOOST_CHECK( nathan.registrar == RELIC_TREASURY_ACCOUNT );
   BOOST_CHECK( !nathan.is_contract );
   BOOST_CHECK( nathan.accepts_assets );
   BOOST_CHECK( db.find_account_by_name( "nathan" ) == &nathan );

   const account_object& vault = create_account( "vault", true, false );
   BOOST_CHECK( vault.is_contract );
   BOOST_CHECK( !vault.accepts_assets );

   account_create_operation op;
   op.registrar = RELIC_TREASURY_ACCOUNT;
   op.name = "nathan";
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "already exists" );

   REQUIRE_OP_VALIDATION_FAILURE( op, name, "Nathan" );
   REQUIRE_OP_VALIDATION_FAILURE( op, accepts_assets, false );
   REQUIRE_OP_VALIDATION_SUCCESS( op, name, "nathan.two" );

   op.name = "orphan";
   op.registrar = account_id_type(999);
   BOOST_CHECK_THROW( push_operation( op ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_test )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice_id, RLC(10) );
   BOOST_CHECK_EQUAL( get_balance( RELIC_TREASURY_ACCOUNT ).value, RLC(1000000 - 10).value );

   transfer( alice_id, bob_id, RLC(4) );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(6).value );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, RLC(4).value );

   transfer_operation op;
   op.from = alice_id;
   op.to = bob_id;
   op.amount = RLC(7);
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Insufficient Balance" );
   RELIC_REQUIRE_THROW( push_operation( op ), insufficient_balance_exception );

   op.amount = RLC(1);
   op.to = account_id_type(999);
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Invalid address" );

   op.to = bob_id;
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, 0 );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, -1 );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, RELIC_MAX_SHARE_SUPPLY + 1 );
   REQUIRE_OP_VALIDATION_FAILURE( op, to, alice_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_validation )
{ try {
   RELIC_REQUIRE_THROW( PUSH_TX( db, trx ), tx_empty_operations );

   trx.operations.push_back( listing_deactivated_operation( listing_id_type(), account_id_type() ) );
   RELIC_REQUIRE_THROW( PUSH_TX( db, trx ), tx_virtual_operation );
   trx.clear();

   transfer_operation op;
   op.from = RELIC_TREASURY_ACCOUNT;
   op.to = engine_owner();
   op.amount = 0;
   trx.operations.push_back( op );
   BOOST_CHECK_THROW( PUSH_TX( db, trx ), fc::exception );
   trx.clear();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( settlement_operation_validation )
{ try {
   escrow_create_operation escrow;
   escrow.seller = account_id_type(6);
   escrow.buyer = account_id_type(7);
   escrow.payment = RLC(1);
   escrow.validate();
   REQUIRE_OP_VALIDATION_FAILURE( escrow, buyer, escrow.seller );
   REQUIRE_OP_VALIDATION_FAILURE( escrow, payment, 0 );

   listing_create_operation listing;
   listing.price = RLC(1);
   listing.duration_seconds = 60;
   listing.validate();
   REQUIRE_OP_VALIDATION_FAILURE( listing, price, 0 );
   REQUIRE_OP_VALIDATION_FAILURE( listing, duration_seconds, 0 );

   listing_update_operation update;
   update.new_price = 0;
   BOOST_CHECK_THROW( update.validate(), fc::exception );

   offer_create_operation offer;
   offer.amount = RLC(1);
   offer.duration_seconds = 60;
   offer.validate();
   REQUIRE_OP_VALIDATION_FAILURE( offer, amount, -5 );
   REQUIRE_OP_VALIDATION_FAILURE( offer, duration_seconds, 0 );

   asset_registry_create_operation registry;
   registry.name = "Art";
   registry.symbol = "ART";
   registry.validate();
   REQUIRE_OP_VALIDATION_FAILURE( registry, symbol, "art" );
   REQUIRE_OP_VALIDATION_FAILURE( registry, name, "" );
   registry_royalty declared;
   declared.bps = RELIC_100_PERCENT + 1;
   REQUIRE_OP_VALIDATION_FAILURE( registry, royalty, declared );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( engine_update_test )
{ try {
   ACTORS( (alice)(bob) );

   engine_update_operation op;
   op.owner = engine_owner();
   op.engine = escrow_engine;
   BOOST_CHECK_THROW( op.validate(), fc::exception );

   REQUIRE_OP_VALIDATION_FAILURE( op, fee_bps, RELIC_MAX_FEE_BPS + 1 );
   REQUIRE_OP_VALIDATION_SUCCESS( op, fee_bps, RELIC_MAX_FEE_BPS );
   op.engine = royalty_engine;
   REQUIRE_OP_VALIDATION_FAILURE( op, fee_bps, 10 );
   op.engine = marketplace_engine;
   REQUIRE_OP_VALIDATION_FAILURE( op, dispute_resolver, alice_id );

   BOOST_TEST_MESSAGE( "Only the owner may update an engine" );
   op.owner = alice_id;
   op.fee_bps = 100;
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Ownable: caller is not the owner" );
   RELIC_REQUIRE_THROW( push_operation( op ), unauthorized_caller_exception );

   op.owner = engine_owner();
   op.fee_recipient = alice_id;
   push_operation( op );
   BOOST_CHECK_EQUAL( db.get_engine_settings( marketplace_engine ).fee_bps, 100 );
   BOOST_CHECK( db.get_engine_settings( marketplace_engine ).fee_recipient == alice_id );
   BOOST_CHECK_EQUAL( db.get_engine_settings( escrow_engine ).fee_bps, RELIC_DEFAULT_FEE_BPS );

   op.fee_recipient = account_id_type(999);
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Invalid address" );

   BOOST_TEST_MESSAGE( "Ownership can be handed over" );
   op.fee_recipient.reset();
   op.fee_bps.reset();
   op.new_owner = bob_id;
   push_operation( op );
   BOOST_CHECK( db.get_engine_settings( marketplace_engine ).owner == bob_id );
   RELIC_REQUIRE_THROW( set_fee( marketplace_engine, 50 ), unauthorized_caller_exception );

   op.owner = bob_id;
   op.new_owner.reset();
   op.fee_bps = 50;
   push_operation( op );
   BOOST_CHECK_EQUAL( db.get_engine_settings( marketplace_engine ).fee_bps, 50 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( engine_pause_test )
{ try {
   ACTOR( alice );

   engine_pause_operation op;
   op.owner = engine_owner();
   op.engine = marketplace_engine;
   op.paused = false;
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Pausable: not paused" );

   pause( marketplace_engine );
   BOOST_CHECK( db.get_engine_settings( marketplace_engine ).paused );
   BOOST_CHECK( !db.get_engine_settings( escrow_engine ).paused );
   REQUIRE_EXCEPTION_WITH_TEXT( pause( marketplace_engine ), "Pausable: paused" );

   op.owner = alice_id;
   RELIC_REQUIRE_THROW( push_operation( op ), unauthorized_caller_exception );

   pause( marketplace_engine, false );
   BOOST_CHECK( !db.get_engine_settings( marketplace_engine ).paused );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( engine_whitelist_test )
{ try {
   ACTOR( alice );
   const asset_registry_id_type registry_id = create_registry( alice_id, "ART" ).get_id();

   BOOST_CHECK( !db.get_engine_settings( escrow_engine ).is_whitelisted( registry_id ) );
   whitelist( escrow_engine, registry_id );
   BOOST_CHECK( db.get_engine_settings( escrow_engine ).is_whitelisted( registry_id ) );
   BOOST_CHECK( !db.get_engine_settings( marketplace_engine ).is_whitelisted( registry_id ) );

   // whitelisting twice is harmless
   whitelist( escrow_engine, registry_id );
   whitelist( escrow_engine, registry_id, false );
   BOOST_CHECK( !db.get_engine_settings( escrow_engine ).is_whitelisted( registry_id ) );

   engine_whitelist_operation op;
   op.owner = engine_owner();
   op.engine = marketplace_engine;
   op.registry = asset_registry_id_type(99);
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Invalid address" );
   REQUIRE_OP_VALIDATION_FAILURE( op, engine, royalty_engine );

   op.registry = registry_id;
   op.owner = alice_id;
   RELIC_REQUIRE_THROW( push_operation( op ), unauthorized_caller_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( emergency_withdraw_test )
{ try {
   ACTOR( alice );
   transfer( RELIC_TREASURY_ACCOUNT, RELIC_ESCROW_ACCOUNT, RLC(3) );

   engine_emergency_withdraw_operation op;
   op.owner = engine_owner();
   op.engine = escrow_engine;
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Pausable: not paused" );
   REQUIRE_OP_VALIDATION_FAILURE( op, engine, royalty_engine );

   pause( escrow_engine );
   op.owner = alice_id;
   RELIC_REQUIRE_THROW( push_operation( op ), unauthorized_caller_exception );

   op.owner = engine_owner();
   push_operation( op );
   BOOST_CHECK_EQUAL( get_balance( RELIC_ESCROW_ACCOUNT ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( engine_owner() ).value, RLC(3).value );

   // an empty custody account withdraws nothing
   push_operation( op );
   BOOST_CHECK_EQUAL( get_balance( engine_owner() ).value, RLC(3).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
