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
#include <relic/chain/nft_evaluator.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/asset_registry.hpp>
#include <relic/chain/database.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/nft_object.hpp>

namespace relic { namespace chain {

void_result asset_registry_create_evaluator::do_evaluate( const asset_registry_create_operation& op )
{ try {
   const database& d = db();

   FC_ASSERT( d.find( op.issuer ) != nullptr, "Unknown issuer ${i}", ("i", op.issuer) );

   const auto& registries_by_symbol = d.get_index_type<asset_registry_index>().indices().get<by_symbol>();
   FC_ASSERT( registries_by_symbol.find( op.symbol ) == registries_by_symbol.end(),
              "Registry symbol ${s} already in use", ("s", op.symbol) );

   if( op.royalty.valid() )
      FC_ASSERT( d.find( op.royalty->receiver ) != nullptr, "Invalid royalty receiver" );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type asset_registry_create_evaluator::do_apply( const asset_registry_create_operation& op )
{ try {
   const asset_registry_object& new_registry =
     db().create<asset_registry_object>( [&op]( asset_registry_object& r ) {
         r.issuer = op.issuer;
         r.name = op.name;
         r.symbol = op.symbol;
         r.royalty = op.royalty;
      });

   return new_registry.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_mint_evaluator::do_evaluate( const nft_mint_operation& op )
{ try {
   op.registry(db());
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type nft_mint_evaluator::do_apply( const nft_mint_operation& op )
{ try {
   database& d = db();

   // minting is only offered by the native registry
   native_asset_registry registry( d, op.registry );
   registry.mint( op.issuer, op.to, op.token_id, op.uri );

   return d.find_nft( op.registry, op.token_id )->id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_approve_evaluator::do_evaluate( const nft_approve_operation& op )
{ try {
   op.registry(db());
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_approve_evaluator::do_apply( const nft_approve_operation& op )
{ try {
   db().get_asset_registry( op.registry )->approve( op.owner, op.token_id, op.approved );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_set_approval_for_all_evaluator::do_evaluate( const nft_set_approval_for_all_operation& op )
{ try {
   op.registry(db());
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_set_approval_for_all_evaluator::do_apply( const nft_set_approval_for_all_operation& op )
{ try {
   db().get_asset_registry( op.registry )->set_approval_for_all( op.owner, op.operator_account, op.approved );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_transfer_evaluator::do_evaluate( const nft_transfer_operation& op )
{ try {
   op.registry(db());
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result nft_transfer_evaluator::do_apply( const nft_transfer_operation& op )
{ try {
   db().get_asset_registry( op.registry )->safe_transfer_from( op.operator_account, op.from, op.to, op.token_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // relic::chain
