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

#include <fc/io/json.hpp>

#include <boost/preprocessor/stringize.hpp>
#include <boost/test/unit_test.hpp>

#include <relic/protocol/types.hpp>
#include <relic/protocol/transaction.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/escrow_object.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/marketplace_object.hpp>
#include <relic/chain/nft_object.hpp>
#include <relic/chain/royalty_object.hpp>

#include <iostream>

using namespace relic::db;

extern uint32_t RELIC_TESTING_GENESIS_TIMESTAMP;

/// one unit of the native currency
#define RLC(x) relic::protocol::share_type( int64_t(x) * int64_t(RELIC_BLOCKCHAIN_PRECISION) )

#define PUSH_TX \
   relic::chain::test::_push_transaction

// See below
#define REQUIRE_OP_VALIDATION_SUCCESS( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   op.validate(); \
   op.field = temp; \
}

#define RELIC_REQUIRE_THROW( expr, exc_type )            \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "RELIC_REQUIRE_THROW begin "           \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "RELIC_REQUIRE_THROW end "             \
         << req_throw_info << std::endl;                  \
}

#define RELIC_CHECK_THROW( expr, exc_type )              \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "RELIC_CHECK_THROW begin "             \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "RELIC_CHECK_THROW end "               \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   RELIC_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
   REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, fc::exception )

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
         std::string(exc_text) +                                  \
         std::string("\" but none thrown"));                      \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
            std::string(exc_text) +                               \
            std::string("\" but got \"") +                        \
            std::string(what) );                                  \
      }                                                           \
   }                                                              \
}                                                                 \

#define ACTOR(name) \
   const auto name = create_account(BOOST_PP_STRINGIZE(name)); \
   relic::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define GET_ACTOR(name) \
   const account_object& name = get_account(BOOST_PP_STRINGIZE(name)); \
   relic::chain::account_id_type name ## _id = name.get_id(); \
   (void)name ##_id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace relic { namespace chain {

namespace test {
processed_transaction _push_transaction( database& db, const transaction& tx );
} // namespace test

/**
 *  A fresh database per test case.  The engines are owned by "admin", fees go to "feesink"
 *  and disputes are settled by "arbiter".  The treasury funds the actors.
 */
struct database_fixture {
   genesis_state_type genesis_state;
   chain::database db;
   transaction trx;

   const std::string current_test_name;
   const std::string current_suite_name;

   database_fixture( const fc::time_point_sec& initial_timestamp = fc::time_point_sec( RELIC_TESTING_GENESIS_TIMESTAMP ) );
   virtual ~database_fixture();

   /// pushes a transaction holding a single operation
   processed_transaction push_operation( const operation& op );

   const account_object& create_account( const string& name, bool is_contract = false, bool accepts_assets = true );
   const account_object& get_account( const string& name )const;
   account_id_type       engine_owner()const;

   void       transfer( account_id_type from, account_id_type to, share_type amount );
   void       fund( account_id_type to, share_type amount );
   share_type get_balance( account_id_type account )const;

   const asset_registry_object& create_registry( account_id_type issuer, const string& symbol,
                                                 optional<registry_royalty> royalty = optional<registry_royalty>() );
   const nft_object& mint( asset_registry_id_type registry, account_id_type to, token_id_type token_id );
   void approve( account_id_type owner, asset_registry_id_type registry, token_id_type token_id,
                 optional<account_id_type> approved );
   void set_approval_for_all( account_id_type owner, asset_registry_id_type registry,
                              account_id_type operator_account, bool approved = true );
   account_id_type owner_of( asset_registry_id_type registry, token_id_type token_id );

   void whitelist( engine_type engine, asset_registry_id_type registry, bool whitelisted = true );
   void pause( engine_type engine, bool paused = true );
   void set_fee( engine_type engine, uint16_t fee_bps );

   escrow_id_type create_escrow( account_id_type seller, account_id_type buyer, asset_registry_id_type registry,
                                 token_id_type token_id, share_type price, uint32_t seconds_to_deadline = 86400 );
   operation_result approve_escrow( account_id_type who, escrow_id_type id );

   listing_id_type list_item( account_id_type seller, asset_registry_id_type registry, token_id_type token_id,
                              share_type price, uint32_t duration_seconds = 7*86400 );
   settlement_result buy_item( account_id_type buyer, listing_id_type id, share_type payment );
   offer_id_type make_offer( account_id_type buyer, asset_registry_id_type registry, token_id_type token_id,
                             share_type amount, uint32_t duration_seconds = 86400 );
   settlement_result accept_offer( account_id_type seller, offer_id_type id );

   void set_default_royalty( optional<account_id_type> recipient, uint16_t bps );
   void set_contract_royalty( account_id_type who, asset_registry_id_type registry,
                              optional<account_id_type> recipient, uint16_t bps );
   void set_token_royalty( account_id_type who, asset_registry_id_type registry, token_id_type token_id,
                           optional<account_id_type> recipient, uint16_t bps );

   /// moves the head time forward
   void advance_time( uint32_t seconds );
};

} }
