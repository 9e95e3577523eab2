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

#include <relic/chain/database.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/engine_settings_object.hpp>
#include <relic/chain/escrow_object.hpp>
#include <relic/chain/marketplace_object.hpp>
#include <relic/chain/nft_object.hpp>

#include <fc/api.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace relic { namespace app {

using namespace relic::chain;
using std::string;
using std::vector;

class database_api_impl;

/**
 * @brief The database_api class implements the query API of the settlement engines.
 *
 * This API is read-only; all modifications to the database must be performed via transactions
 * pushed to @ref relic::chain::database::push_transaction.
 */
class database_api
{
   public:
      database_api( relic::chain::database& db );
      ~database_api();

      /////////////
      // Objects //
      /////////////

      /**
       * @brief Get the objects corresponding to the provided IDs
       * @param ids IDs of the objects to retrieve
       * @return The objects retrieved, in the order they are mentioned in ids
       *
       * If any of the provided IDs does not map to an object, a null variant is returned in its position.
       */
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      ///////////////////
      // Subscriptions //
      ///////////////////

      /**
       * @brief Register a callback handle which is notified of every applied operation
       * @param cb The callback, it receives an operation_history_object as a variant
       *
       * Operations are reported in order after their transaction has been committed.  Virtual
       * operations, such as an escrow completion, are reported right after the operation that
       * caused them.
       */
      void set_applied_operation_callback( std::function<void(const variant&)> cb );
      void cancel_all_subscriptions();

      /////////////
      // Globals //
      /////////////

      time_point_sec get_head_time()const;

      /**
       * @brief Get the settings of an engine: owner, fee, pause flag and whitelist
       */
      engine_settings_object get_engine_settings( engine_type engine )const;

      bool is_whitelisted( engine_type engine, asset_registry_id_type registry )const;

      //////////////
      // Accounts //
      //////////////

      /**
       * @brief Get info of an account by name
       * @param name Name of the account to retrieve
       * @return The account holding the provided name
       */
      optional<account_object> get_account_by_name( string name )const;

      share_type get_balance( account_id_type account )const;

      ////////////
      // Tokens //
      ////////////

      /**
       * @brief Ask the registry who owns a token
       *
       * The question is answered by the registry serving @p registry, which throws for unknown tokens.
       */
      account_id_type owner_of( asset_registry_id_type registry, token_id_type token_id )const;

      optional<nft_object> get_nft( asset_registry_id_type registry, token_id_type token_id )const;

      /////////////
      // Escrows //
      /////////////

      optional<escrow_object> get_escrow( escrow_id_type id )const;

      /**
       * @brief Get the escrows an account takes part in
       * @param account The seller or buyer
       * @return escrow ids in ascending order, each id listed once
       */
      vector<escrow_id_type> get_user_escrows( account_id_type account )const;

      /////////////////
      // Marketplace //
      /////////////////

      optional<listing_object> get_listing( listing_id_type id )const;

      /**
       * @brief Get the listing that currently applies to a token
       * @return the active listing, which may already be expired, or nothing
       */
      optional<listing_object> get_active_listing( asset_registry_id_type registry, token_id_type token_id )const;

      optional<offer_object> get_offer( offer_id_type id )const;

      /// ids of all listings ever created by @p seller, in ascending order
      vector<listing_id_type> get_user_listings( account_id_type seller )const;
      /// ids of all offers ever made by @p buyer, in ascending order
      vector<offer_id_type>   get_user_offers( account_id_type buyer )const;
      /// ids of all offers ever made for a token, in ascending order
      vector<offer_id_type>   get_offers_for_asset( asset_registry_id_type registry, token_id_type token_id )const;

      marketplace_statistics_object get_marketplace_statistics()const;

      /////////////
      // Royalty //
      /////////////

      /**
       * @brief Compute the royalty that a sale of a token at @p sale_price would pay
       */
      royalty_info get_royalty( asset_registry_id_type registry, token_id_type token_id, share_type sale_price )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} }

FC_API(relic::app::database_api,
   // Objects
   (get_objects)

   // Subscriptions
   (set_applied_operation_callback)
   (cancel_all_subscriptions)

   // Globals
   (get_head_time)
   (get_engine_settings)
   (is_whitelisted)

   // Accounts
   (get_account_by_name)
   (get_balance)

   // Tokens
   (owner_of)
   (get_nft)

   // Escrows
   (get_escrow)
   (get_user_escrows)

   // Marketplace
   (get_listing)
   (get_active_listing)
   (get_offer)
   (get_user_listings)
   (get_user_offers)
   (get_offers_for_asset)
   (get_marketplace_statistics)

   // Royalty
   (get_royalty)
)
