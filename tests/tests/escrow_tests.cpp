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

#include <relic/app/database_api.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/escrow_object.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/marketplace_object.hpp>

#include "../common/database_fixture.hpp"

using namespace relic::chain;
using namespace relic::chain::test;

namespace {

/**
 *  alice owns token 1 of the whitelisted ART registry, approved for the escrow engine,
 *  and holds 10 RLC.  bob is the buyer, carol an outsider.
 */
struct escrow_database_fixture : database_fixture
{
   const token_id_type token_id = 1;
   account_id_type alice_id;
   account_id_type bob_id;
   account_id_type carol_id;
   account_id_type arbiter_id;
   account_id_type feesink_id;
   asset_registry_id_type registry_id;

   escrow_database_fixture()
   {
      alice_id = create_account( "alice" ).get_id();
      bob_id = create_account( "bob" ).get_id();
      carol_id = create_account( "carol" ).get_id();
      arbiter_id = get_account( "arbiter" ).get_id();
      feesink_id = get_account( "feesink" ).get_id();

      registry_id = create_registry( alice_id, "ART" ).get_id();
      mint( registry_id, alice_id, token_id );
      approve( alice_id, registry_id, token_id, RELIC_ESCROW_ACCOUNT );
      whitelist( escrow_engine, registry_id );
      fund( alice_id, RLC(10) );
   }

   void dispute( account_id_type who, escrow_id_type id )
   {
      escrow_dispute_operation op;
      op.who = who;
      op.escrow_id = id;
      push_operation( op );
   }

   void cancel( account_id_type who, escrow_id_type id )
   {
      escrow_cancel_operation op;
      op.who = who;
      op.escrow_id = id;
      push_operation( op );
   }

   operation_result resolve( account_id_type resolver, escrow_id_type id, bool favor_buyer )
   {
      escrow_resolve_dispute_operation op;
      op.resolver = resolver;
      op.escrow_id = id;
      op.favor_buyer = favor_buyer;
      return push_operation( op ).operation_results[0];
   }
};

}

BOOST_FIXTURE_TEST_SUITE( escrow_tests, escrow_database_fixture )

BOOST_AUTO_TEST_CASE( create_escrow_takes_custody )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );

   const escrow_object& e = id(db);
   BOOST_CHECK( e.seller == alice_id );
   BOOST_CHECK( e.buyer == bob_id );
   BOOST_CHECK( e.registry == registry_id );
   BOOST_CHECK_EQUAL( e.token_id, token_id );
   BOOST_CHECK_EQUAL( e.price.value, RLC(1).value );
   BOOST_CHECK( e.status == escrow_status::active );
   BOOST_CHECK( !e.seller_approved );
   BOOST_CHECK( !e.buyer_approved );
   BOOST_CHECK( e.created_at == db.head_time() );
   BOOST_CHECK( e.deadline == db.head_time() + 86400 );

   BOOST_CHECK( owner_of( registry_id, token_id ) == RELIC_ESCROW_ACCOUNT );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(9).value );
   BOOST_CHECK_EQUAL( get_balance( RELIC_ESCROW_ACCOUNT ).value, RLC(1).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_escrow_rejections )
{ try {
   escrow_create_operation op;
   op.seller = alice_id;
   op.buyer = bob_id;
   op.registry = registry_id;
   op.token_id = token_id;
   op.payment = RLC(1);
   op.deadline = db.head_time() + 3600;

   BOOST_TEST_MESSAGE( "Buyer and seller must differ" );
   REQUIRE_OP_VALIDATION_FAILURE( op, buyer, alice_id );
   BOOST_TEST_MESSAGE( "Payment must be positive" );
   REQUIRE_OP_VALIDATION_FAILURE( op, payment, 0 );

   BOOST_TEST_MESSAGE( "Deadline must be in the future" );
   op.deadline = db.head_time();
   RELIC_REQUIRE_THROW( push_operation( op ), invalid_parameter_exception );
   op.deadline = db.head_time() + 3600;

   BOOST_TEST_MESSAGE( "Seller must own the token" );
   op.seller = carol_id;
   op.buyer = bob_id;
   fund( carol_id, RLC(2) );
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Seller doesn't own NFT" );
   RELIC_REQUIRE_THROW( push_operation( op ), custody_exception );
   op.seller = alice_id;

   BOOST_TEST_MESSAGE( "Seller must hold the payment" );
   op.payment = RLC(11);
   RELIC_REQUIRE_THROW( push_operation( op ), insufficient_balance_exception );
   op.payment = RLC(1);

   BOOST_TEST_MESSAGE( "Escrow engine must be approved" );
   approve( alice_id, registry_id, token_id, optional<account_id_type>() );
   REQUIRE_EXCEPTION_WITH_TEXT( push_operation( op ), "Contract not approved" );
   set_approval_for_all( alice_id, registry_id, RELIC_ESCROW_ACCOUNT );
   push_operation( op );

   BOOST_CHECK( owner_of( registry_id, token_id ) == RELIC_ESCROW_ACCOUNT );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(9).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_escrow_requires_whitelisted_registry )
{ try {
   whitelist( escrow_engine, registry_id, false );
   REQUIRE_EXCEPTION_WITH_TEXT( create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) ),
                                "Contract not whitelisted" );
   RELIC_REQUIRE_THROW( create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) ),
                        registry_not_whitelisted_exception );

   BOOST_CHECK( owner_of( registry_id, token_id ) == alice_id );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(10).value );
   BOOST_CHECK( db.find( escrow_id_type() ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dual_approval_completes_escrow )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );

   BOOST_TEST_MESSAGE( "The first approval only records the vote" );
   operation_result first = approve_escrow( alice_id, id );
   BOOST_CHECK( first.is_type<void_result>() );
   BOOST_CHECK( id(db).seller_approved );
   BOOST_CHECK( id(db).status == escrow_status::active );
   BOOST_CHECK( owner_of( registry_id, token_id ) == RELIC_ESCROW_ACCOUNT );

   BOOST_TEST_MESSAGE( "The second approval releases token and payment" );
   const settlement_result result = approve_escrow( bob_id, id ).get<settlement_result>();
   BOOST_CHECK_EQUAL( result.fee.value, 2500000 );
   BOOST_CHECK_EQUAL( result.seller_amount.value, 97500000 );
   BOOST_CHECK( result.fee_recipient == feesink_id );

   BOOST_CHECK( id(db).status == escrow_status::completed );
   BOOST_CHECK( owner_of( registry_id, token_id ) == bob_id );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(9).value + 97500000 );
   BOOST_CHECK_EQUAL( get_balance( feesink_id ).value, 2500000 );
   BOOST_CHECK_EQUAL( get_balance( RELIC_ESCROW_ACCOUNT ).value, 0 );

   BOOST_TEST_MESSAGE( "A completed escrow accepts nothing more" );
   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( alice_id, id ), "Escrow not active" );
   RELIC_REQUIRE_THROW( cancel( bob_id, id ), invalid_state_exception );
   RELIC_REQUIRE_THROW( dispute( bob_id, id ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approval_rules )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );

   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( carol_id, id ), "Not authorized" );
   RELIC_REQUIRE_THROW( approve_escrow( carol_id, id ), unauthorized_caller_exception );

   approve_escrow( bob_id, id );
   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( bob_id, id ), "Already approved" );
   BOOST_CHECK( id(db).buyer_approved );
   BOOST_CHECK( !id(db).seller_approved );

   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( bob_id, escrow_id_type(42) ), "Invalid escrow ID" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_returns_token_and_payment )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );

   REQUIRE_EXCEPTION_WITH_TEXT( cancel( carol_id, id ), "Not authorized to cancel" );

   cancel( bob_id, id );

   BOOST_CHECK( id(db).status == escrow_status::cancelled );
   BOOST_CHECK( owner_of( registry_id, token_id ) == alice_id );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, RLC(1).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(9).value );
   BOOST_CHECK_EQUAL( get_balance( RELIC_ESCROW_ACCOUNT ).value, 0 );

   RELIC_REQUIRE_THROW( cancel( alice_id, id ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( anyone_may_cancel_after_deadline )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1), 3600 );

   advance_time( 3600 );
   BOOST_TEST_MESSAGE( "At the deadline outsiders are still refused" );
   RELIC_REQUIRE_THROW( cancel( carol_id, id ), unauthorized_caller_exception );

   advance_time( 1 );
   cancel( carol_id, id );
   BOOST_CHECK( id(db).status == escrow_status::cancelled );
   BOOST_CHECK( owner_of( registry_id, token_id ) == alice_id );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, RLC(1).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_resolved_for_buyer )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );

   REQUIRE_EXCEPTION_WITH_TEXT( dispute( carol_id, id ), "Not authorized" );
   REQUIRE_EXCEPTION_WITH_TEXT( resolve( arbiter_id, id, true ), "Escrow not disputed" );

   dispute( bob_id, id );
   BOOST_CHECK( id(db).status == escrow_status::disputed );

   BOOST_TEST_MESSAGE( "A disputed escrow can neither be approved nor cancelled" );
   RELIC_REQUIRE_THROW( approve_escrow( alice_id, id ), invalid_state_exception );
   RELIC_REQUIRE_THROW( cancel( alice_id, id ), invalid_state_exception );

   REQUIRE_EXCEPTION_WITH_TEXT( resolve( bob_id, id, true ), "Only dispute resolver" );
   RELIC_REQUIRE_THROW( resolve( alice_id, id, false ), unauthorized_caller_exception );

   const settlement_result result = resolve( arbiter_id, id, true ).get<settlement_result>();
   BOOST_CHECK_EQUAL( result.seller_amount.value, 97500000 );
   BOOST_CHECK( id(db).status == escrow_status::completed );
   BOOST_CHECK( owner_of( registry_id, token_id ) == bob_id );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(9).value + 97500000 );
   BOOST_CHECK_EQUAL( get_balance( feesink_id ).value, 2500000 );

   RELIC_REQUIRE_THROW( resolve( arbiter_id, id, true ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_resolved_for_seller )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );
   approve_escrow( bob_id, id );
   dispute( alice_id, id );

   const operation_result result = resolve( arbiter_id, id, false );
   BOOST_CHECK( result.is_type<void_result>() );
   BOOST_CHECK( id(db).status == escrow_status::cancelled );
   BOOST_CHECK( owner_of( registry_id, token_id ) == alice_id );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, RLC(1).value );
   BOOST_CHECK_EQUAL( get_balance( feesink_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_window_closes )
{ try {
   const uint32_t window = db.get_engine_settings( escrow_engine ).dispute_window;
   BOOST_CHECK_EQUAL( window, uint32_t(RELIC_DEFAULT_DISPUTE_WINDOW) );

   const escrow_id_type first = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1), 3600 );
   cancel( alice_id, first );
   approve( alice_id, registry_id, token_id, RELIC_ESCROW_ACCOUNT );
   const escrow_id_type second = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1), 3600 );

   BOOST_TEST_MESSAGE( "The last second of the window is still open" );
   advance_time( 3600 + window );
   dispute( bob_id, second );
   BOOST_CHECK( second(db).status == escrow_status::disputed );

   resolve( arbiter_id, second, false );
   approve( alice_id, registry_id, token_id, RELIC_ESCROW_ACCOUNT );
   const escrow_id_type third = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1), 3600 );
   advance_time( 3600 + window + 1 );
   REQUIRE_EXCEPTION_WITH_TEXT( dispute( bob_id, third ), "Dispute window closed" );
   BOOST_CHECK( third(db).status == escrow_status::active );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_window_near_end_of_time )
{ try {
   db.set_head_time( time_point_sec::maximum() - 3*86400 );
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1), 3600 );

   BOOST_TEST_MESSAGE( "The window end lies past the last representable second, so the dispute stays open" );
   advance_time( 7200 );
   dispute( bob_id, id );
   BOOST_CHECK( id(db).status == escrow_status::disputed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_completion_reverts_approval )
{ try {
   const account_id_type vault_id = create_account( "vault", true, false ).get_id();
   const escrow_id_type id = create_escrow( alice_id, vault_id, registry_id, token_id, RLC(1) );
   approve_escrow( alice_id, id );

   BOOST_TEST_MESSAGE( "The buyer contract refuses the token, so the final approval fails as a whole" );
   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( vault_id, id ), "Transfer to non receiver implementer" );

   const escrow_object& e = id(db);
   BOOST_CHECK( e.status == escrow_status::active );
   BOOST_CHECK( e.seller_approved );
   BOOST_CHECK( !e.buyer_approved );
   BOOST_CHECK( owner_of( registry_id, token_id ) == RELIC_ESCROW_ACCOUNT );
   BOOST_CHECK_EQUAL( get_balance( RELIC_ESCROW_ACCOUNT ).value, RLC(1).value );
   BOOST_CHECK_EQUAL( get_balance( feesink_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( paused_escrow_engine )
{ try {
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(1) );
   mint( registry_id, alice_id, 2 );
   approve( alice_id, registry_id, 2, RELIC_MARKETPLACE_ACCOUNT );
   whitelist( marketplace_engine, registry_id );
   const listing_id_type listing = list_item( alice_id, registry_id, 2, RLC(2) );

   pause( escrow_engine );
   pause( marketplace_engine );

   REQUIRE_EXCEPTION_WITH_TEXT( approve_escrow( alice_id, id ), "Pausable: paused" );
   RELIC_REQUIRE_THROW( cancel( bob_id, id ), engine_paused_exception );
   RELIC_REQUIRE_THROW( dispute( bob_id, id ), engine_paused_exception );

   BOOST_TEST_MESSAGE( "Queries keep working while paused" );
   relic::app::database_api db_api( db );
   BOOST_CHECK( db_api.get_engine_settings( escrow_engine ).paused );
   BOOST_CHECK( db_api.get_engine_settings( marketplace_engine ).paused );

   const optional<escrow_object> escrow = db_api.get_escrow( id );
   BOOST_REQUIRE( escrow.valid() );
   BOOST_CHECK( escrow->status == escrow_status::active );
   BOOST_CHECK( escrow->seller == alice_id );

   const vector<escrow_id_type> bob_escrows = db_api.get_user_escrows( bob_id );
   BOOST_REQUIRE_EQUAL( bob_escrows.size(), 1u );
   BOOST_CHECK( bob_escrows[0] == id );

   const optional<listing_object> listed = db_api.get_listing( listing );
   BOOST_REQUIRE( listed.valid() );
   BOOST_CHECK( listed->active );
   BOOST_CHECK_EQUAL( listed->price.value, RLC(2).value );

   pause( marketplace_engine, false );

   pause( escrow_engine, false );
   approve_escrow( alice_id, id );
   BOOST_CHECK( id(db).seller_approved );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( escrow_fee_follows_settings )
{ try {
   set_fee( escrow_engine, 1000 );
   const escrow_id_type id = create_escrow( alice_id, bob_id, registry_id, token_id, RLC(2) );
   approve_escrow( alice_id, id );
   const settlement_result result = approve_escrow( bob_id, id ).get<settlement_result>();

   BOOST_CHECK_EQUAL( result.fee.value, RLC(2).value / 10 );
   BOOST_CHECK_EQUAL( result.seller_amount.value + result.fee.value, RLC(2).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, RLC(8).value + result.seller_amount.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
