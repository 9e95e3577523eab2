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

#include <relic/app/database_api.hpp>

#include <boost/signals2/connection.hpp>

namespace relic { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      explicit database_api_impl( relic::chain::database& db );
      virtual ~database_api_impl();

      // Objects
      fc::variants get_objects( const vector<object_id_type>& ids )const;

      // Subscriptions
      void set_applied_operation_callback( std::function<void(const variant&)> cb );
      void cancel_all_subscriptions();

      // Globals
      time_point_sec get_head_time()const;
      engine_settings_object get_engine_settings( engine_type engine )const;
      bool is_whitelisted( engine_type engine, asset_registry_id_type registry )const;

      // Accounts
      optional<account_object> get_account_by_name( string name )const;
      share_type get_balance( account_id_type account )const;

      // Tokens
      account_id_type owner_of( asset_registry_id_type registry, token_id_type token_id )const;
      optional<nft_object> get_nft( asset_registry_id_type registry, token_id_type token_id )const;

      // Escrows
      optional<escrow_object> get_escrow( escrow_id_type id )const;
      vector<escrow_id_type> get_user_escrows( account_id_type account )const;

      // Marketplace
      optional<listing_object> get_listing( listing_id_type id )const;
      optional<listing_object> get_active_listing( asset_registry_id_type registry, token_id_type token_id )const;
      optional<offer_object> get_offer( offer_id_type id )const;
      vector<listing_id_type> get_user_listings( account_id_type seller )const;
      vector<offer_id_type> get_user_offers( account_id_type buyer )const;
      vector<offer_id_type> get_offers_for_asset( asset_registry_id_type registry, token_id_type token_id )const;
      marketplace_statistics_object get_marketplace_statistics()const;

      // Royalty
      royalty_info get_royalty( asset_registry_id_type registry, token_id_type token_id, share_type sale_price )const;

   private:
      void on_applied_operation( const operation_history_object& op );

      std::function<void(const fc::variant&)> _applied_operation_callback;

      boost::signals2::scoped_connection _applied_operation_connection;

      relic::chain::database& _db;
};

} } // relic::app
