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

#include "../common/database_fixture.hpp"

using namespace relic::chain;
using namespace relic::chain::test;
using namespace relic::app;

namespace {

struct api_database_fixture : database_fixture
{
   account_id_type alice_id;
   account_id_type bob_id;
   account_id_type carol_id;
   asset_registry_id_type registry_id;

   api_database_fixture()
   {
      alice_id = create_account( "alice" ).get_id();
      bob_id = create_account( "bob" ).get_id();
      carol_id = create_account( "carol" ).get_id();

      registry_id = create_registry( alice_id, "ART" ).get_id();
      for( token_id_type t = 1; t <= 3; ++t )
         mint( registry_id, alice_id, t );
      set_approval_for_all( alice_id, registry_id, RELIC_ESCROW_ACCOUNT );
      set_approval_for_all( alice_id, registry_id, RELIC_MARKETPLACE_ACCOUNT );
      whitelist( escrow_engine, registry_id );
      whitelist( marketplace_engine, registry_id );

      fund( alice_id, RLC(10) );
      fund( bob_id, RLC(10) );
      fund( carol_id, RLC(10) );
   }
};

}

BOOST_FIXTURE_TEST_SUITE( database_api_tests, api_database_fixture )

BOOST_AUTO_TEST_CASE( get_objects )
{ try {
   database_api db_api( db );

   const vector<object_id_type> ids = { object_id_type( alice_id ), object_id_type( registry_id ),
                                        object_id_type( listing_id_type(99) ) };
   const fc::variants objects = db_api.get_objects( ids );
   BOOST_REQUIRE_EQUAL( objects.size(), 3u );
   BOOST_CHECK_EQUAL( objects[0].as<account_object>( RELIC_MAX_NESTED_OBJECTS ).name, "alice" );
   BOOST_CHECK_EQUAL( objects[1].as<asset_registry_object>( RELIC_MAX_NESTED_OBJECTS ).symbol, "ART" );
   BOOST_CHECK( objects[2].is_null() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( globals_and_accounts )
{ try {
   database_api db_api( db );

   BOOST_CHECK( db_api.get_head_time() == db.head_time() );
   BOOST_CHECK_EQUAL( db_api.get_engine_settings( marketplace_engine ).fee_bps, RELIC_DEFAULT_FEE_BPS );
   BOOST_CHECK( db_api.is_whitelisted( escrow_engine, registry_id ) );
   whitelist( escrow_engine, registry_id, false );
   BOOST_CHECK( !db_api.is_whitelisted( escrow_engine, registry_id ) );
   BOOST_CHECK( db_api.is_whitelisted( marketplace_engine, registry_id ) );

   const auto alice = db_api.get_account_by_name( "alice" );
   BOOST_REQUIRE( alice.valid() );
   BOOST_CHECK( alice->get_id() == alice_id );
   BOOST_CHECK( !db_api.get_account_by_name( "nobody" ).valid() );

   BOOST_CHECK_EQUAL( db_api.get_balance( bob_id ).value, RLC(10).value );
   BOOST_CHECK_EQUAL( db_api.get_balance( account_id_type(999) ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( token_queries )
{ try {
   database_api db_api( db );

   BOOST_CHECK( db_api.owner_of( registry_id, 2 ) == alice_id );
   BOOST_CHECK_THROW( db_api.owner_of( registry_id, 42 ), fc::exception );
   BOOST_CHECK_THROW( db_api.owner_of( asset_registry_id_type(99), 1 ), fc::exception );

   const auto token = db_api.get_nft( registry_id, 3 );
   BOOST_REQUIRE( token.valid() );
   BOOST_CHECK( token->owner == alice_id );
   BOOST_CHECK( !db_api.get_nft( registry_id, 42 ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( user_escrows_are_sorted )
{ try {
   database_api db_api( db );

   const escrow_id_type first = create_escrow( alice_id, bob_id, registry_id, 1, RLC(1) );
   const escrow_id_type second = create_escrow( alice_id, carol_id, registry_id, 2, RLC(1) );

   // bob sells a token he bought through the first escrow
   approve_escrow( alice_id, first );
   approve_escrow( bob_id, first );
   set_approval_for_all( bob_id, registry_id, RELIC_ESCROW_ACCOUNT );
   const escrow_id_type third = create_escrow( bob_id, alice_id, registry_id, 1, RLC(2) );

   const vector<escrow_id_type> alice_escrows = db_api.get_user_escrows( alice_id );
   BOOST_REQUIRE_EQUAL( alice_escrows.size(), 3u );
   BOOST_CHECK( alice_escrows[0] == first );
   BOOST_CHECK( alice_escrows[1] == second );
   BOOST_CHECK( alice_escrows[2] == third );

   const vector<escrow_id_type> bob_escrows = db_api.get_user_escrows( bob_id );
   BOOST_REQUIRE_EQUAL( bob_escrows.size(), 2u );
   BOOST_CHECK( bob_escrows[0] == first );
   BOOST_CHECK( bob_escrows[1] == third );

   BOOST_CHECK( db_api.get_user_escrows( account_id_type(999) ).empty() );

   const auto completed = db_api.get_escrow( first );
   BOOST_REQUIRE( completed.valid() );
   BOOST_CHECK( completed->status == escrow_status::completed );
   BOOST_CHECK( !db_api.get_escrow( escrow_id_type(99) ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( marketplace_queries )
{ try {
   database_api db_api( db );

   const listing_id_type first = list_item( alice_id, registry_id, 1, RLC(2) );
   const listing_id_type second = list_item( alice_id, registry_id, 2, RLC(3) );
   const offer_id_type bob_offer = make_offer( bob_id, registry_id, 1, RLC(1) );
   const offer_id_type carol_offer = make_offer( carol_id, registry_id, 1, RLC(2) );
   const offer_id_type bob_other = make_offer( bob_id, registry_id, 3, RLC(1) );

   const vector<listing_id_type> listings = db_api.get_user_listings( alice_id );
   BOOST_REQUIRE_EQUAL( listings.size(), 2u );
   BOOST_CHECK( listings[0] == first );
   BOOST_CHECK( listings[1] == second );
   BOOST_CHECK( db_api.get_user_listings( bob_id ).empty() );

   const vector<offer_id_type> bob_offers = db_api.get_user_offers( bob_id );
   BOOST_REQUIRE_EQUAL( bob_offers.size(), 2u );
   BOOST_CHECK( bob_offers[0] == bob_offer );
   BOOST_CHECK( bob_offers[1] == bob_other );

   const vector<offer_id_type> token_offers = db_api.get_offers_for_asset( registry_id, 1 );
   BOOST_REQUIRE_EQUAL( token_offers.size(), 2u );
   BOOST_CHECK( token_offers[0] == bob_offer );
   BOOST_CHECK( token_offers[1] == carol_offer );
   BOOST_CHECK( db_api.get_offers_for_asset( registry_id, 2 ).empty() );

   const auto active = db_api.get_active_listing( registry_id, 1 );
   BOOST_REQUIRE( active.valid() );
   BOOST_CHECK( active->get_id() == first );

   BOOST_TEST_MESSAGE( "Settled records stay visible, the active listing goes away" );
   accept_offer( alice_id, carol_offer );
   BOOST_CHECK( !db_api.get_active_listing( registry_id, 1 ).valid() );
   BOOST_REQUIRE( db_api.get_listing( first ).valid() );
   BOOST_CHECK( !db_api.get_listing( first )->active );
   BOOST_CHECK( !db_api.get_offer( carol_offer )->active );
   BOOST_CHECK( db_api.get_offer( bob_offer )->active );
   BOOST_CHECK_EQUAL( db_api.get_offers_for_asset( registry_id, 1 ).size(), 2u );
   BOOST_CHECK( !db_api.get_offer( offer_id_type(99) ).valid() );

   const marketplace_statistics_object stats = db_api.get_marketplace_statistics();
   BOOST_CHECK_EQUAL( stats.total_listings, 2u );
   BOOST_CHECK_EQUAL( stats.total_sales, 1u );
   BOOST_CHECK_EQUAL( stats.total_volume.value, RLC(2).value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( royalty_query )
{ try {
   database_api db_api( db );

   BOOST_CHECK( !db_api.get_royalty( registry_id, 1, RLC(1) ).recipient.valid() );
   set_contract_royalty( alice_id, registry_id, carol_id, 300 );
   const royalty_info info = db_api.get_royalty( registry_id, 1, RLC(1) );
   BOOST_CHECK( *info.recipient == carol_id );
   BOOST_CHECK_EQUAL( info.amount.value, 3000000 );

   BOOST_CHECK_THROW( db_api.get_royalty( registry_id, 1, share_type(-1) ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( applied_operation_callback )
{ try {
   database_api db_api( db );

   vector<fc::variant> received;
   db_api.set_applied_operation_callback( [&received]( const fc::variant& v ) { received.push_back( v ); } );

   transfer( alice_id, bob_id, RLC(1) );
   BOOST_REQUIRE_EQUAL( received.size(), 1u );
   const operation_history_object oh = received[0].as<operation_history_object>( RELIC_MAX_NESTED_OBJECTS );
   BOOST_REQUIRE( oh.op.is_type<transfer_operation>() );
   BOOST_CHECK( oh.op.get<transfer_operation>().to == bob_id );

   RELIC_REQUIRE_THROW( transfer( alice_id, bob_id, RLC(100) ), insufficient_balance_exception );
   BOOST_CHECK_EQUAL( received.size(), 1u );

   db_api.cancel_all_subscriptions();
   transfer( alice_id, bob_id, RLC(1) );
   BOOST_CHECK_EQUAL( received.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
