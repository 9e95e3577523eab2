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
    *  The royalty due on a sale.  No recipient means no royalty.
    */
   struct royalty_info
   {
      optional<account_id_type> recipient;
      share_type                amount;
   };

   /**
    * @brief Set or clear the royalty that applies when nothing more specific does
    * @ingroup operations
    *
    * Royalty overrides are cleared by setting zero bps or leaving the recipient unset.
    */
   struct royalty_set_default_operation : public base_operation
   {
      account_id_type            owner;       ///< Owner of the royalty engine
      optional<account_id_type>  recipient;
      uint16_t                   bps = 0;     ///< At most RELIC_MAX_ROYALTY_BPS

      account_id_type caller()const { return owner; }
      void            validate()const override;
   };

   /**
    * @brief Set or clear the royalty override of a registry
    * @ingroup operations
    *
    * Allowed for the royalty engine owner and for the owner of the registry.
    */
   struct royalty_set_contract_operation : public base_operation
   {
      account_id_type            who;
      asset_registry_id_type     registry;
      optional<account_id_type>  recipient;
      uint16_t                   bps = 0;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /**
    * @brief Set or clear the royalty override of a single token
    * @ingroup operations
    *
    * Allowed for the royalty engine owner, the owner of the registry and the owner of the token.
    */
   struct royalty_set_token_operation : public base_operation
   {
      account_id_type            who;
      asset_registry_id_type     registry;
      token_id_type              token_id = 0;
      optional<account_id_type>  recipient;
      uint16_t                   bps = 0;

      account_id_type caller()const { return who; }
      void            validate()const override;
   };

   /** recipient and bps of a royalty setter, shared by the three setters */
   void validate_royalty_setting( const optional<account_id_type>& recipient, uint16_t bps );

} } // relic::protocol

FC_REFLECT( relic::protocol::royalty_info, (recipient)(amount) )
FC_REFLECT( relic::protocol::royalty_set_default_operation, (owner)(recipient)(bps) )
FC_REFLECT( relic::protocol::royalty_set_contract_operation, (who)(registry)(recipient)(bps) )
FC_REFLECT( relic::protocol::royalty_set_token_operation, (who)(registry)(token_id)(recipient)(bps) )
