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
#include <relic/protocol/base.hpp>

namespace relic { namespace protocol {

   /**
    *  Royalty a registry declares for all of its tokens, answered through its royalty query
    *  capability.  The settlement engines only trust answers up to RELIC_MAX_ROYALTY_BPS.
    */
   struct registry_royalty
   {
      account_id_type receiver;
      uint16_t        bps = 0;  ///< fraction of the sale price, the denominator is RELIC_100_PERCENT
   };

   /**
    * @brief Create a registry of unique tokens
    * @ingroup operations
    *
    * The issuer owns the registry: only it may mint, and it may set contract-level royalty
    * overrides for the registry's tokens.
    */
   struct asset_registry_create_operation : public base_operation
   {
      account_id_type             issuer;
      string                      name;
      string                      symbol;
      optional<registry_royalty>  royalty;  ///< Declared royalty, optional

      account_id_type caller()const { return issuer; }
      void            validate()const override;
   };

   /**
    * @brief Mint a new token into a registry
    * @ingroup operations
    */
   struct nft_mint_operation : public base_operation
   {
      account_id_type         issuer;     ///< Must be the issuer of the registry
      asset_registry_id_type  registry;
      account_id_type         to;
      token_id_type           token_id = 0;
      string                  uri;

      account_id_type caller()const { return issuer; }
      void            validate()const override;
   };

   /**
    * @brief Approve a single operator for a single token, or clear the approval
    * @ingroup operations
    */
   struct nft_approve_operation : public base_operation
   {
      account_id_type            owner;      ///< Token owner or an operator approved for all of its tokens
      asset_registry_id_type     registry;
      token_id_type              token_id = 0;
      optional<account_id_type>  approved;   ///< Cleared when not set

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Approve or revoke an operator for all tokens of an owner in a registry
    * @ingroup operations
    */
   struct nft_set_approval_for_all_operation : public base_operation
   {
      account_id_type         owner;
      asset_registry_id_type  registry;
      account_id_type         operator_account;
      bool                    approved = true;

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Safe transfer of a token
    * @ingroup operations
    *
    * The caller must be the owner or an approved operator.  Contract receivers that do not
    * accept assets make the transfer fail.
    */
   struct nft_transfer_operation : public base_operation
   {
      account_id_type         operator_account;
      asset_registry_id_type  registry;
      account_id_type         from;
      account_id_type         to;
      token_id_type           token_id = 0;

      account_id_type caller()const { return operator_account; }
      void            validate()const override;
   };

} } // relic::protocol

FC_REFLECT( relic::protocol::registry_royalty, (receiver)(bps) )
FC_REFLECT( relic::protocol::asset_registry_create_operation, (issuer)(name)(symbol)(royalty) )
FC_REFLECT( relic::protocol::nft_mint_operation, (issuer)(registry)(to)(token_id)(uri) )
FC_REFLECT( relic::protocol::nft_approve_operation, (owner)(registry)(token_id)(approved) )
FC_REFLECT( relic::protocol::nft_set_approval_for_all_operation, (owner)(registry)(operator_account)(approved) )
FC_REFLECT( relic::protocol::nft_transfer_operation, (operator_account)(registry)(from)(to)(token_id) )
