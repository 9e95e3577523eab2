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

#include <relic/chain/types.hpp>
#include <relic/protocol/royalty.hpp>

#include <functional>
#include <memory>

namespace relic { namespace chain {

   class database;
   class nft_object;
   class asset_registry_object;

   /**
    *  @brief The asset-ownership capability the settlement engines consume
    *
    *  A registry answers ownership and approval queries for its tokens and moves them on
    *  behalf of approved operators.  Every mutation must go through the database so that
    *  a failed transaction reverts it.  Implementations throw fc::exception on failure.
    */
   class asset_registry
   {
      public:
         virtual ~asset_registry(){}

         virtual asset_registry_id_type     id()const = 0;
         virtual account_id_type            registry_owner()const = 0;
         virtual account_id_type            owner_of( token_id_type token_id )const = 0;
         virtual optional<account_id_type>  get_approved( token_id_type token_id )const = 0;
         virtual bool                       is_approved_for_all( account_id_type owner,
                                                                 account_id_type operator_account )const = 0;

         /** caller must be the owner of the token or an operator approved for all of its tokens */
         virtual void approve( account_id_type caller, token_id_type token_id,
                               optional<account_id_type> approved ) = 0;
         virtual void set_approval_for_all( account_id_type owner, account_id_type operator_account,
                                            bool approved ) = 0;
         /**
          *  Moves the token and clears its per-token approval.  The operator must be the owner, the
          *  approved operator of the token or an operator approved for all tokens of @p from.
          *  Contract receivers that do not accept assets make the transfer fail.
          */
         virtual void safe_transfer_from( account_id_type operator_account, account_id_type from,
                                          account_id_type to, token_id_type token_id ) = 0;

         /** true when @p spender may move the token: it is the owner or an approved operator */
         bool is_approved_or_owner( account_id_type spender, token_id_type token_id )const;
   };

   /**
    *  @brief Optional capability of a registry: the royalty it declares for a sale
    *
    *  Probed with dynamic_cast.  An empty answer means the registry declares no royalty.
    */
   class royalty_info_provider
   {
      public:
         virtual ~royalty_info_provider(){}
         virtual optional<royalty_info> query_royalty( token_id_type token_id, share_type sale_price )const = 0;
   };

   /**
    *  @brief Registry backed by asset_registry_object, nft_object and nft_operator_approval_object
    */
   class native_asset_registry : public asset_registry
   {
      public:
         native_asset_registry( database& db, asset_registry_id_type id );

         virtual asset_registry_id_type     id()const override { return _id; }
         virtual account_id_type            registry_owner()const override;
         virtual account_id_type            owner_of( token_id_type token_id )const override;
         virtual optional<account_id_type>  get_approved( token_id_type token_id )const override;
         virtual bool                       is_approved_for_all( account_id_type owner,
                                                                 account_id_type operator_account )const override;

         virtual void approve( account_id_type caller, token_id_type token_id,
                               optional<account_id_type> approved ) override;
         virtual void set_approval_for_all( account_id_type owner, account_id_type operator_account,
                                            bool approved ) override;
         virtual void safe_transfer_from( account_id_type operator_account, account_id_type from,
                                          account_id_type to, token_id_type token_id ) override;

         /** issues a new token, the registry issuer only */
         void mint( account_id_type issuer, account_id_type to, token_id_type token_id, const string& uri );

      protected:
         const asset_registry_object& registry_object()const;
         const nft_object&            get_token( token_id_type token_id )const;

         database&               _db;
         asset_registry_id_type  _id;
   };

   /**
    *  @brief Native registry that answers royalty queries with the royalty declared at creation
    */
   class native_royalty_registry : public native_asset_registry, public royalty_info_provider
   {
      public:
         native_royalty_registry( database& db, asset_registry_id_type id )
         : native_asset_registry( db, id ) {}

         virtual optional<royalty_info> query_royalty( token_id_type token_id, share_type sale_price )const override;
   };

   typedef std::function< std::unique_ptr<asset_registry>( database&, asset_registry_id_type ) >
           asset_registry_factory;

} } // relic::chain
