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
    * @brief Update the settings of an engine
    * @ingroup operations
    *
    * Only the engine owner may update its settings.  Members that are not set are left unchanged.
    */
   struct engine_update_operation : public base_operation
   {
      account_id_type            owner;               ///< Current owner of the engine
      engine_type                engine = escrow_engine;
      optional<uint16_t>         fee_bps;             ///< New fee, at most RELIC_MAX_FEE_BPS, optional
      optional<account_id_type>  fee_recipient;       ///< New fee recipient, optional
      optional<account_id_type>  dispute_resolver;    ///< New dispute resolver, escrow engine only, optional
      optional<account_id_type>  new_owner;           ///< Ownership transfer, optional

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Pause or resume an engine
    * @ingroup operations
    */
   struct engine_pause_operation : public base_operation
   {
      account_id_type  owner;
      engine_type      engine = escrow_engine;
      bool             paused = true;

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Add an asset registry to, or remove it from, the whitelist of an engine
    * @ingroup operations
    */
   struct engine_whitelist_operation : public base_operation
   {
      account_id_type         owner;
      engine_type             engine = escrow_engine;
      asset_registry_id_type  registry;
      bool                    whitelisted = true;

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Sweep the whole custody balance of a paused engine to its owner
    * @ingroup operations
    */
   struct engine_emergency_withdraw_operation : public base_operation
   {
      account_id_type  owner;
      engine_type      engine = escrow_engine;

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

} } // relic::protocol

FC_REFLECT( relic::protocol::engine_update_operation,
            (owner)(engine)(fee_bps)(fee_recipient)(dispute_resolver)(new_owner) )
FC_REFLECT( relic::protocol::engine_pause_operation, (owner)(engine)(paused) )
FC_REFLECT( relic::protocol::engine_whitelist_operation, (owner)(engine)(registry)(whitelisted) )
FC_REFLECT( relic::protocol::engine_emergency_withdraw_operation, (owner)(engine) )
