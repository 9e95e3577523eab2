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

   class listing_object;
   class offer_object;
   class engine_settings_object;

   class listing_create_evaluator : public evaluator<listing_create_evaluator>
   {
      public:
         typedef listing_create_operation operation_type;

         void_result do_evaluate( const listing_create_operation& o );
         object_id_type do_apply( const listing_create_operation& o );
   };

   class listing_update_evaluator : public evaluator<listing_update_evaluator>
   {
      public:
         typedef listing_update_operation operation_type;

         void_result do_evaluate( const listing_update_operation& o );
         void_result do_apply( const listing_update_operation& o );

         const listing_object* listing = nullptr;
   };

   class listing_cancel_evaluator : public evaluator<listing_cancel_evaluator>
   {
      public:
         typedef listing_cancel_operation operation_type;

         void_result do_evaluate( const listing_cancel_operation& o );
         void_result do_apply( const listing_cancel_operation& o );

         const listing_object* listing = nullptr;
   };

   class listing_buy_evaluator : public evaluator<listing_buy_evaluator>
   {
      public:
         typedef listing_buy_operation operation_type;

         void_result do_evaluate( const listing_buy_operation& o );
         settlement_result do_apply( const listing_buy_operation& o );

         const listing_object* listing = nullptr;
   };

   class offer_create_evaluator : public evaluator<offer_create_evaluator>
   {
      public:
         typedef offer_create_operation operation_type;

         void_result do_evaluate( const offer_create_operation& o );
         object_id_type do_apply( const offer_create_operation& o );
   };

   class offer_accept_evaluator : public evaluator<offer_accept_evaluator>
   {
      public:
         typedef offer_accept_operation operation_type;

         void_result do_evaluate( const offer_accept_operation& o );
         settlement_result do_apply( const offer_accept_operation& o );

         const offer_object* offer = nullptr;
   };

   class offer_cancel_evaluator : public evaluator<offer_cancel_evaluator>
   {
      public:
         typedef offer_cancel_operation operation_type;

         void_result do_evaluate( const offer_cancel_operation& o );
         void_result do_apply( const offer_cancel_operation& o );

         const offer_object* offer = nullptr;
   };

} } // relic::chain
