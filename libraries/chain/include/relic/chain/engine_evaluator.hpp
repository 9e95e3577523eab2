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

   class engine_settings_object;

   class engine_update_evaluator : public evaluator<engine_update_evaluator>
   {
      public:
         typedef engine_update_operation operation_type;

         void_result do_evaluate( const engine_update_operation& o );
         void_result do_apply( const engine_update_operation& o );

         const engine_settings_object* settings = nullptr;
   };

   class engine_pause_evaluator : public evaluator<engine_pause_evaluator>
   {
      public:
         typedef engine_pause_operation operation_type;

         void_result do_evaluate( const engine_pause_operation& o );
         void_result do_apply( const engine_pause_operation& o );

         const engine_settings_object* settings = nullptr;
   };

   class engine_whitelist_evaluator : public evaluator<engine_whitelist_evaluator>
   {
      public:
         typedef engine_whitelist_operation operation_type;

         void_result do_evaluate( const engine_whitelist_operation& o );
         void_result do_apply( const engine_whitelist_operation& o );

         const engine_settings_object* settings = nullptr;
   };

   class engine_emergency_withdraw_evaluator : public evaluator<engine_emergency_withdraw_evaluator>
   {
      public:
         typedef engine_emergency_withdraw_operation operation_type;

         void_result do_evaluate( const engine_emergency_withdraw_operation& o );
         void_result do_apply( const engine_emergency_withdraw_operation& o );

         const engine_settings_object* settings = nullptr;
   };

} } // relic::chain
