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
#include <relic/db/generic_index.hpp>
#include <relic/protocol/nft.hpp>

namespace relic { namespace chain {

   /**
    *  @brief a registry of unique tokens
    *  @ingroup object
    *  @ingroup protocol
    *
    *  Registries created through asset_registry_create_operation are served by the native
    *  registry.  The host may bind any registry id to an adapter of its own, in which case
    *  this object only records the registry's identity.
    */
   class asset_registry_object : public abstract_object<asset_registry_object, protocol_ids, asset_registry_object_type>
   {
      public:
         account_id_type             issuer;
         string                      name;
         string                      symbol;
         optional<registry_royalty>  royalty;
   };

   /**
    *  @brief a single token of a registry and its per-token approval
    *  @ingroup object
    *  @ingroup protocol
    */
   class nft_object : public abstract_object<nft_object, protocol_ids, nft_object_type>
   {
      public:
         asset_registry_id_type     registry;
         token_id_type              token_id = 0;
         account_id_type            owner;
         optional<account_id_type>  approved;
         string                     uri;
   };

   /**
    *  @brief an operator approved for every token an owner holds in a registry
    *  @ingroup object
    *  @ingroup implementation
    */
   class nft_operator_approval_object : public abstract_object<nft_operator_approval_object,
                                                               implementation_ids, impl_nft_operator_approval_object_type>
   {
      public:
         asset_registry_id_type  registry;
         account_id_type         owner;
         account_id_type         operator_account;
   };

   struct by_symbol;
   typedef multi_index_container<
      asset_registry_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_symbol>, member<asset_registry_object, string, &asset_registry_object::symbol> >
      >
   > asset_registry_multi_index_type;
   typedef generic_index<asset_registry_object, asset_registry_multi_index_type> asset_registry_index;

   struct by_registry_token;
   struct by_owner;
   typedef multi_index_container<
      nft_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_registry_token>,
            composite_key< nft_object,
               member< nft_object, asset_registry_id_type, &nft_object::registry >,
               member< nft_object, token_id_type, &nft_object::token_id >
            >
         >,
         ordered_unique< tag<by_owner>,
            composite_key< nft_object,
               member< nft_object, account_id_type, &nft_object::owner >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > nft_multi_index_type;
   typedef generic_index<nft_object, nft_multi_index_type> nft_index;

   struct by_registry_owner_operator;
   typedef multi_index_container<
      nft_operator_approval_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_registry_owner_operator>,
            composite_key< nft_operator_approval_object,
               member< nft_operator_approval_object, asset_registry_id_type, &nft_operator_approval_object::registry >,
               member< nft_operator_approval_object, account_id_type, &nft_operator_approval_object::owner >,
               member< nft_operator_approval_object, account_id_type,
                       &nft_operator_approval_object::operator_account >
            >
         >
      >
   > nft_operator_approval_multi_index_type;
   typedef generic_index<nft_operator_approval_object, nft_operator_approval_multi_index_type>
           nft_operator_approval_index;

} } // relic::chain

MAP_OBJECT_ID_TO_TYPE(relic::chain::asset_registry_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::nft_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::nft_operator_approval_object)

FC_REFLECT_DERIVED( relic::chain::asset_registry_object, (relic::db::object),
                    (issuer)(name)(symbol)(royalty) )
FC_REFLECT_DERIVED( relic::chain::nft_object, (relic::db::object),
                    (registry)(token_id)(owner)(approved)(uri) )
FC_REFLECT_DERIVED( relic::chain::nft_operator_approval_object, (relic::db::object),
                    (registry)(owner)(operator_account) )
