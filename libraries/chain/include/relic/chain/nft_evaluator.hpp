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
#include <relic/chain/evaluator.hpp>

namespace relic { namespace chain {

   class asset_registry_create_evaluator : public evaluator<asset_registry_create_evaluator>
   {
      public:
         typedef asset_registry_create_operation operation_type;

         void_result do_evaluate( const asset_registry_create_operation& o );
         object_id_type do_apply( const asset_registry_create_operation& o );
   };

   class nft_mint_evaluator : public evaluator<nft_mint_evaluator>
   {
      public:
         typedef nft_mint_operation operation_type;

         void_result do_evaluate( const nft_mint_operation& o );
         object_id_type do_apply( const nft_mint_operation& o );
   };

   class nft_approve_evaluator : public evaluator<nft_approve_evaluator>
   {
      public:
         typedef nft_approve_operation operation_type;

         void_result do_evaluate( const nft_approve_operation& o );
         void_result do_apply( const nft_approve_operation& o );
   };

   class nft_set_approval_for_all_evaluator : public evaluator<nft_set_approval_for_all_evaluator>
   {
      public:
         typedef nft_set_approval_for_all_operation operation_type;

         void_result do_evaluate( const nft_set_approval_for_all_operation& o );
         void_result do_apply( const nft_set_approval_for_all_operation& o );
   };

   class nft_transfer_evaluator : public evaluator<nft_transfer_evaluator>
   {
      public:
         typedef nft_transfer_operation operation_type;

         void_result do_evaluate( const nft_transfer_operation& o );
         void_result do_apply( const nft_transfer_operation& o );
   };

} } // relic::chain
