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
#include <relic/chain/account_evaluator.hpp>
#include <relic/chain/account_object.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/exceptions.hpp>

namespace relic { namespace chain {

void_result account_create_evaluator::do_evaluate( const account_create_operation& op )
{ try {
   const database& d = db();

   FC_ASSERT( d.find( op.registrar ) != nullptr, "Unknown registrar ${r}", ("r", op.registrar) );
   FC_ASSERT( d.find_account_by_name( op.name ) == nullptr,
              "Account '${a}' already exists.", ("a",op.name) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type account_create_evaluator::do_apply( const account_create_operation& o )
{ try {
   database& d = db();

   const auto& new_acnt_object = d.create<account_object>( [&o]( account_object& obj ){
         obj.registrar      = o.registrar;
         obj.name           = o.name;
         obj.is_contract    = o.is_contract;
         obj.accepts_assets = o.accepts_assets;
   });

   dlog( "Registered account ${a} as ${id}", ("a", o.name)("id", new_acnt_object.id) );
   return new_acnt_object.id;
} FC_CAPTURE_AND_RETHROW((o)) }

} } // relic::chain
