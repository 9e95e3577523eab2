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

namespace relic { namespace chain {
   class database;

   /**
    * @brief Tracks the native currency balance of a single account
    * @ingroup object
    * @ingroup implementation
    */
   class account_balance_object : public abstract_object<account_balance_object,
                                                         implementation_ids, impl_account_balance_object_type>
   {
      public:
         account_id_type   owner;
         share_type        balance;

         void adjust_balance( share_type delta )
         {
            balance += delta;
         }
   };

   /**
    * @brief This class represents an account on the object graph
    * @ingroup object
    * @ingroup protocol
    *
    * Accounts are the primary unit of authority.  Contract accounts model receivers that are
    * notified when an asset is delivered to them; @ref accepts_assets is their answer.
    */
   class account_object : public abstract_object<account_object, protocol_ids, account_object_type>
   {
      public:
         string            name;
         account_id_type   registrar;
         bool              is_contract = false;
         bool              accepts_assets = true;

         /// true when an asset delivered to this account is accepted by it
         bool can_receive_assets()const { return !is_contract || accepts_assets; }
   };

   struct by_owner;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< account_balance_object, account_id_type,
                                                &account_balance_object::owner > >
      >
   > account_balance_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

   struct by_name{};

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member<account_object, string, &account_object::name> >
      >
   > account_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_object, account_multi_index_type> account_index;

}}

MAP_OBJECT_ID_TO_TYPE(relic::chain::account_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::account_balance_object)

FC_REFLECT_DERIVED( relic::chain::account_object,
                    (relic::db::object),
                    (name)(registrar)(is_contract)(accepts_assets) )

FC_REFLECT_DERIVED( relic::chain::account_balance_object,
                    (relic::db::object),
                    (owner)(balance) )
