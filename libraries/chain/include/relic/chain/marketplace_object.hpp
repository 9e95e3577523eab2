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
#include <relic/db/object.hpp>
#include <relic/db/generic_index.hpp>

namespace relic { namespace chain {

   /**
    *  @brief a fixed price sale of a token
    *  @ingroup object
    *  @ingroup protocol
    *
    *  The token stays with the seller.  Listings are never removed; a sold, cancelled or
    *  replaced listing is only marked inactive.  At most one listing per token is active.
    */
   class listing_object : public abstract_object<listing_object, protocol_ids, listing_object_type>
   {
      public:
         account_id_type         seller;
         asset_registry_id_type  registry;
         token_id_type           token_id = 0;
         share_type              price;
         time_point_sec          created_at;
         time_point_sec          expires_at;
         bool                    active = true;

         bool is_open( time_point_sec now )const { return active && now <= expires_at; }
   };

   /**
    *  @brief a bid for a token, backed by funds held in marketplace custody
    *  @ingroup object
    *  @ingroup protocol
    */
   class offer_object : public abstract_object<offer_object, protocol_ids, offer_object_type>
   {
      public:
         account_id_type         buyer;
         asset_registry_id_type  registry;
         token_id_type           token_id = 0;
         share_type              amount;
         time_point_sec          created_at;
         time_point_sec          expires_at;
         bool                    active = true;

         bool is_open( time_point_sec now )const { return active && now <= expires_at; }
   };

   /**
    *  @brief running totals of the marketplace
    *  @ingroup object
    *  @ingroup implementation
    */
   class marketplace_statistics_object : public abstract_object<marketplace_statistics_object,
                                                                implementation_ids,
                                                                impl_marketplace_statistics_object_type>
   {
      public:
         uint64_t    total_listings = 0;
         uint64_t    total_sales = 0;
         share_type  total_volume;
   };

   struct by_asset;
   struct by_seller;
   struct by_active_asset;
   typedef multi_index_container<
      listing_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>,
            composite_key< listing_object,
               member< listing_object, asset_registry_id_type, &listing_object::registry >,
               member< listing_object, token_id_type, &listing_object::token_id >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_active_asset>,
            composite_key< listing_object,
               member< listing_object, bool, &listing_object::active >,
               member< listing_object, asset_registry_id_type, &listing_object::registry >,
               member< listing_object, token_id_type, &listing_object::token_id >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_seller>,
            composite_key< listing_object,
               member< listing_object, account_id_type, &listing_object::seller >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > listing_multi_index_type;
   typedef generic_index<listing_object, listing_multi_index_type> listing_index;

   struct by_buyer;
   typedef multi_index_container<
      offer_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>,
            composite_key< offer_object,
               member< offer_object, asset_registry_id_type, &offer_object::registry >,
               member< offer_object, token_id_type, &offer_object::token_id >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_buyer>,
            composite_key< offer_object,
               member< offer_object, account_id_type, &offer_object::buyer >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > offer_multi_index_type;
   typedef generic_index<offer_object, offer_multi_index_type> offer_index;

} } // relic::chain

MAP_OBJECT_ID_TO_TYPE(relic::chain::listing_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::offer_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::marketplace_statistics_object)

FC_REFLECT_DERIVED( relic::chain::listing_object, (relic::db::object),
                    (seller)(registry)(token_id)(price)(created_at)(expires_at)(active) )
FC_REFLECT_DERIVED( relic::chain::offer_object, (relic::db::object),
                    (buyer)(registry)(token_id)(amount)(created_at)(expires_at)(active) )
FC_REFLECT_DERIVED( relic::chain::marketplace_statistics_object, (relic::db::object),
                    (total_listings)(total_sales)(total_volume) )
