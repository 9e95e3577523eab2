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

#include <relic/chain/asset_registry.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/nft_object.hpp>

#include "../common/database_fixture.hpp"

using namespace relic::chain;
using namespace relic::chain::test;

namespace {

/// a native registry whose tokens can not be moved
class frozen_asset_registry : public native_asset_registry
{
   public:
      frozen_asset_registry( database& db, asset_registry_id_type id ) : native_asset_registry( db, id ) {}

      virtual void safe_transfer_from( account_id_type operator_account, account_id_type from,
                                       account_id_type to, token_id_type token_id ) override
      {
         FC_THROW_EXCEPTION( custody_exception, "Registry ${r} is frozen", ("r", _id) );
      }
};

struct registry_database_fixture : database_fixture
{
   account_id_type artist_id;
   account_id_type alice_id;
   account_id_type bob_id;
   asset_registry_id_type registry_id;

   registry_database_fixture()
   {
      artist_id = create_account( "artist" ).get_id();
      alice_id = create_account( "alice" ).get_id();
      bob_id = create_account( "bob" ).get_id();
      registry_id = create_registry( artist_id, "ART" ).get_id();
   }

   void transfer_token( account_id_type operator_account, account_id_type from, account_id_type to,
                        token_id_type token_id )
   {
      nft_transfer_operation op;
      op.operator_account = operator_account;
      op.registry = registry_id;
      op.from = from;
      op.to = to;
      op.token_id = token_id;
      push_operation( op );
   }
};

}

BOOST_FIXTURE_TEST_SUITE( asset_registry_tests, registry_database_fixture )

BOOST_AUTO_TEST_CASE( create_registry_test )
{ try {
   const asset_registry_object& registry = registry_id(db);
   BOOST_CHECK( registry.issuer == artist_id );
   BOOST_CHECK_EQUAL( registry.symbol, "ART" );
   BOOST_CHECK( !registry.royalty.valid() );

   REQUIRE_EXCEPTION_WITH_TEXT( create_registry( alice_id, "ART" ), "already in use" );

   registry_royalty declared;
   declared.receiver = account_id_type(999);
   declared.bps = 100;
   REQUIRE_EXCEPTION_WITH_TEXT( create_registry( alice_id, "PIX", declared ), "Invalid royalty receiver" );

   declared.receiver = alice_id;
   const asset_registry_object& pix = create_registry( alice_id, "PIX", declared );
   BOOST_REQUIRE( pix.royalty.valid() );
   BOOST_CHECK( pix.royalty->receiver == alice_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mint_test )
{ try {
   const nft_object& token = mint( registry_id, alice_id, 1 );
   BOOST_CHECK( token.owner == alice_id );
   BOOST_CHECK( token.registry == registry_id );
   BOOST_CHECK_EQUAL( token.uri, "ipfs://token/1" );
   BOOST_CHECK( db.find_nft( registry_id, 1 ) == &token );
   BOOST_CHECK( db.find_nft( registry_id, 2 ) == nullptr );

   REQUIRE_EXCEPTION_WITH_TEXT( mint( registry_id, bob_id, 1 ), "Token already minted" );

   nft_mint_operation op;
   op.issuer = alice_id;
   op.registry = registry_id;
   op.to = alice_id;
   op.token_id = 2;
   RELIC_REQUIRE_THROW( push_operation( op ), unauthorized_caller_exception );

   BOOST_TEST_MESSAGE( "Contracts that refuse assets can not receive a token" );
   const account_id_type vault_id = create_account( "vault", true, false ).get_id();
   RELIC_REQUIRE_THROW( mint( registry_id, vault_id, 2 ), custody_exception );
   BOOST_CHECK( db.find_nft( registry_id, 2 ) == nullptr );

   REQUIRE_OP_VALIDATION_FAILURE( op, uri, std::string( RELIC_MAX_URI_LENGTH + 1, 'x' ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approve_test )
{ try {
   mint( registry_id, alice_id, 1 );

   approve( alice_id, registry_id, 1, bob_id );
   BOOST_CHECK( *db.find_nft( registry_id, 1 )->approved == bob_id );
   auto registry = db.get_asset_registry( registry_id );
   BOOST_CHECK( registry->is_approved_or_owner( bob_id, 1 ) );
   BOOST_CHECK( registry->is_approved_or_owner( alice_id, 1 ) );
   BOOST_CHECK( !registry->is_approved_or_owner( artist_id, 1 ) );

   approve( alice_id, registry_id, 1, optional<account_id_type>() );
   BOOST_CHECK( !db.find_nft( registry_id, 1 )->approved.valid() );
   BOOST_CHECK( !registry->is_approved_or_owner( bob_id, 1 ) );

   REQUIRE_EXCEPTION_WITH_TEXT( approve( bob_id, registry_id, 1, bob_id ),
                                "Approve caller is not token owner or approved for all" );
   REQUIRE_EXCEPTION_WITH_TEXT( approve( alice_id, registry_id, 1, alice_id ), "Approval to current owner" );
   RELIC_REQUIRE_THROW( approve( alice_id, registry_id, 5, bob_id ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approval_for_all_test )
{ try {
   mint( registry_id, alice_id, 1 );
   mint( registry_id, alice_id, 2 );

   set_approval_for_all( alice_id, registry_id, bob_id );
   auto registry = db.get_asset_registry( registry_id );
   BOOST_CHECK( registry->is_approved_for_all( alice_id, bob_id ) );
   BOOST_CHECK( !registry->is_approved_for_all( bob_id, alice_id ) );

   // setting it twice keeps a single record
   set_approval_for_all( alice_id, registry_id, bob_id );
   BOOST_CHECK_EQUAL( db.get_index_type<nft_operator_approval_index>().indices().size(), 1u );

   BOOST_TEST_MESSAGE( "An operator may approve and move any token of the owner" );
   approve( bob_id, registry_id, 2, artist_id );
   BOOST_CHECK( *db.find_nft( registry_id, 2 )->approved == artist_id );
   transfer_token( bob_id, alice_id, bob_id, 1 );
   BOOST_CHECK( owner_of( registry_id, 1 ) == bob_id );

   set_approval_for_all( alice_id, registry_id, bob_id, false );
   BOOST_CHECK( !registry->is_approved_for_all( alice_id, bob_id ) );
   BOOST_CHECK( db.get_index_type<nft_operator_approval_index>().indices().empty() );
   RELIC_REQUIRE_THROW( transfer_token( bob_id, alice_id, bob_id, 2 ), custody_exception );

   nft_set_approval_for_all_operation op;
   op.owner = alice_id;
   op.registry = registry_id;
   op.operator_account = alice_id;
   BOOST_CHECK_THROW( op.validate(), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_token_test )
{ try {
   mint( registry_id, alice_id, 1 );
   approve( alice_id, registry_id, 1, artist_id );

   RELIC_REQUIRE_THROW( transfer_token( bob_id, alice_id, bob_id, 1 ), custody_exception );
   REQUIRE_EXCEPTION_WITH_TEXT( transfer_token( alice_id, bob_id, alice_id, 1 ), "Transfer from incorrect owner" );

   const account_id_type vault_id = create_account( "vault", true, false ).get_id();
   REQUIRE_EXCEPTION_WITH_TEXT( transfer_token( alice_id, alice_id, vault_id, 1 ),
                                "Transfer to non receiver implementer" );
   BOOST_CHECK( owner_of( registry_id, 1 ) == alice_id );

   BOOST_TEST_MESSAGE( "Contracts that accept assets can hold tokens" );
   const account_id_type safe_id = create_account( "safe", true, true ).get_id();
   transfer_token( artist_id, alice_id, safe_id, 1 );
   BOOST_CHECK( owner_of( registry_id, 1 ) == safe_id );
   BOOST_CHECK( !db.find_nft( registry_id, 1 )->approved.valid() );

   RELIC_REQUIRE_THROW( transfer_token( artist_id, safe_id, bob_id, 1 ), custody_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( host_supplied_registry )
{ try {
   mint( registry_id, alice_id, 1 );
   approve( alice_id, registry_id, 1, RELIC_MARKETPLACE_ACCOUNT );
   whitelist( marketplace_engine, registry_id );
   fund( bob_id, RLC(5) );

   db.set_asset_registry_factory( registry_id, []( database& d, asset_registry_id_type id ) {
      return std::unique_ptr<asset_registry>( new frozen_asset_registry( d, id ) );
   });
   BOOST_CHECK( dynamic_cast<frozen_asset_registry*>( db.get_asset_registry( registry_id ).get() ) != nullptr );

   BOOST_TEST_MESSAGE( "Listing only checks ownership and approval" );
   const listing_id_type listing = list_item( alice_id, registry_id, 1, RLC(1) );
   BOOST_CHECK( owner_of( registry_id, 1 ) == alice_id );

   BOOST_TEST_MESSAGE( "A registry refusing the delivery leaves the buyer's funds untouched" );
   RELIC_REQUIRE_THROW( buy_item( bob_id, listing, RLC(1) ), custody_exception );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, RLC(5).value );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, 0 );
   BOOST_CHECK( listing(db).active );
   BOOST_CHECK( owner_of( registry_id, 1 ) == alice_id );

   BOOST_TEST_MESSAGE( "Removing the factory restores the native registry" );
   db.set_asset_registry_factory( registry_id, asset_registry_factory() );
   buy_item( bob_id, listing, RLC(1) );
   BOOST_CHECK( owner_of( registry_id, 1 ) == bob_id );
   BOOST_CHECK( !listing(db).active );

   BOOST_CHECK_THROW( db.set_asset_registry_factory( asset_registry_id_type(99), asset_registry_factory() ),
                      fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
