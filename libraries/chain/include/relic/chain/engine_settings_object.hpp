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

namespace relic { namespace chain {

   /**
    * @brief the owner-controlled settings of one engine
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one of these per engine_type, created by genesis, and the instance
    * number is the engine_type value.
    */
   class engine_settings_object : public abstract_object<engine_settings_object,
                                                         implementation_ids, impl_engine_settings_object_type>
   {
      public:
         engine_type                     engine = escrow_engine;
         account_id_type                 owner;
         optional<account_id_type>       custody_account;   ///< Holds assets and payments in transit
         uint16_t                        fee_bps = 0;
         account_id_type                 fee_recipient;
         account_id_type                 dispute_resolver;  ///< escrow engine only
         uint32_t                        dispute_window = RELIC_DEFAULT_DISPUTE_WINDOW;  ///< seconds
         bool                            paused = false;
         flat_set<asset_registry_id_type> whitelisted_registries;

         bool is_whitelisted( asset_registry_id_type r )const { return whitelisted_registries.count( r ) != 0; }
   };

   /**
    * @brief Maintains global state information
    * @ingroup object
    * @ingroup implementation
    *
    * This is an implementation detail.  The values here are updated as operations are applied
    * and tracked so that the engines share a single notion of time.
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object,
                                                                 implementation_ids,
                                                                 impl_dynamic_global_property_object_type>
   {
      public:
         time_point_sec    time;
         uint64_t          next_operation_sequence = 0;
   };

}}

MAP_OBJECT_ID_TO_TYPE(relic::chain::engine_settings_object)
MAP_OBJECT_ID_TO_TYPE(relic::chain::dynamic_global_property_object)

FC_REFLECT_DERIVED( relic::chain::engine_settings_object, (relic::db::object),
                    (engine)(owner)(custody_account)(fee_bps)(fee_recipient)(dispute_resolver)
                    (dispute_window)(paused)(whitelisted_registries) )

FC_REFLECT_DERIVED( relic::chain::dynamic_global_property_object, (relic::db::object),
                    (time)(next_operation_sequence) )
