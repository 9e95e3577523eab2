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

   /** The layer of the royalty cascade a record belongs to */
   enum royalty_scope
   {
      default_royalty  = 0,
      contract_royalty = 1,
      token_royalty    = 2
   };

   /**
    *  @brief an override of the royalty paid on sales
    *  @ingroup object
    *  @ingroup implementation
    *
    *  The default record ignores registry and token_id, a contract record ignores token_id.
    *  A record with zero bps is never stored.
    */
   class royalty_record_object : public abstract_object<royalty_record_object,
                                                        implementation_ids, impl_royalty_record_object_type>
   {
      public:
         royalty_scope           scope = default_royalty;
         asset_registry_id_type  registry;
         token_id_type           token_id = 0;
         account_id_type         recipient;
         uint16_t                bps = 0;
   };

   struct by_scope;
   typedef multi_index_container<
      royalty_record_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_scope>,
            composite_key< royalty_record_object,
               member< royalty_record_object, royalty_scope, &royalty_record_object::scope >,
               member< royalty_record_object, asset_registry_id_type, &royalty_record_object::registry >,
               member< royalty_record_object, token_id_type, &royalty_record_object::token_id >
            >
         >
      >
   > royalty_record_multi_index_type;
   typedef generic_index<royalty_record_object, royalty_record_multi_index_type> royalty_record_index;

} } // relic::chain

MAP_OBJECT_ID_TO_TYPE(relic::chain::royalty_record_object)

FC_REFLECT_ENUM( relic::chain::royalty_scope, (default_royalty)(contract_royalty)(token_royalty) )
FC_REFLECT_DERIVED( relic::chain::royalty_record_object, (relic::db::object),
                    (scope)(registry)(token_id)(recipient)(bps) )
