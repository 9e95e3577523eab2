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

      enum class escrow_status
      {
         active    = 0,
         completed = 1,
         cancelled = 2,
         disputed  = 3
      };

      /**
       * Holds a token and its payment until both parties approve, the escrow is cancelled,
       * or the dispute resolver settles it.  Escrow objects are kept after they reach a
       * terminal status.
       */
      class escrow_object : public abstract_object<escrow_object, protocol_ids, escrow_object_type> {
         public:
            account_id_type         seller;
            account_id_type         buyer;
            asset_registry_id_type  registry;
            token_id_type           token_id = 0;
            share_type              price;
            time_point_sec          created_at;
            time_point_sec          deadline;
            escrow_status           status = escrow_status::active;
            bool                    seller_approved = false;
            bool                    buyer_approved = false;

            bool is_approved()const { return seller_approved && buyer_approved; }
            bool is_participant( account_id_type a )const { return a == seller || a == buyer; }
      };

      struct by_seller;
      struct by_buyer;
      typedef multi_index_container<
         escrow_object,
         indexed_by<
            ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,

            ordered_unique< tag< by_seller >,
               composite_key< escrow_object,
                  member< escrow_object, account_id_type,  &escrow_object::seller >,
                  member< object, object_id_type, &object::id >
               >
            >,
            ordered_unique< tag< by_buyer >,
               composite_key< escrow_object,
                  member< escrow_object, account_id_type,  &escrow_object::buyer >,
                  member< object, object_id_type, &object::id >
               >
            >
         >
      > escrow_object_index_type;

      typedef generic_index< escrow_object, escrow_object_index_type > escrow_index;

   } }

MAP_OBJECT_ID_TO_TYPE(relic::chain::escrow_object)

FC_REFLECT_ENUM( relic::chain::escrow_status, (active)(completed)(cancelled)(disputed) )

FC_REFLECT_DERIVED( relic::chain::escrow_object, (relic::db::object),
                    (seller)(buyer)(registry)(token_id)(price)(created_at)(deadline)(status)
                    (seller_approved)(buyer_approved) )
