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
#include <relic/chain/asset_registry.hpp>

#include <relic/chain/database.hpp>
#include <relic/chain/exceptions.hpp>
#include <relic/chain/nft_object.hpp>

namespace relic { namespace chain {

bool asset_registry::is_approved_or_owner( account_id_type spender, token_id_type token_id )const
{
   const account_id_type owner = owner_of( token_id );
   if( spender == owner )
      return true;
   const auto approved = get_approved( token_id );
   if( approved.valid() && *approved == spender )
      return true;
   return is_approved_for_all( owner, spender );
}

native_asset_registry::native_asset_registry( database& db, asset_registry_id_type id )
: _db(db), _id(id)
{
   FC_ASSERT( _db.find( _id ) != nullptr, "Unknown asset registry ${r}", ("r", _id) );
}

const asset_registry_object& native_asset_registry::registry_object()const
{
   return _id(_db);
}

const nft_object& native_asset_registry::get_token( token_id_type token_id )const
{
   const nft_object* token = _db.find_nft( _id, token_id );
   RELIC_ASSERT( token != nullptr, invalid_state_exception, "Invalid token ID ${t} in registry ${r}",
                 ("t", token_id)("r", _id) );
   return *token;
}

account_id_type native_asset_registry::registry_owner()const
{
   return registry_object().issuer;
}

account_id_type native_asset_registry::owner_of( token_id_type token_id )const
{
   return get_token( token_id ).owner;
}

optional<account_id_type> native_asset_registry::get_approved( token_id_type token_id )const
{
   return get_token( token_id ).approved;
}

bool native_asset_registry::is_approved_for_all( account_id_type owner, account_id_type operator_account )const
{
   const auto& idx = _db.get_index_type<nft_operator_approval_index>().indices().get<by_registry_owner_operator>();
   return idx.find( boost::make_tuple( _id, owner, operator_account ) ) != idx.end();
}

void native_asset_registry::approve( account_id_type caller, token_id_type token_id,
                                     optional<account_id_type> approved )
{ try {
   const nft_object& token = get_token( token_id );
   RELIC_ASSERT( caller == token.owner || is_approved_for_all( token.owner, caller ),
                 unauthorized_caller_exception, "Approve caller is not token owner or approved for all",
                 ("caller", caller)("owner", token.owner) );
   if( approved.valid() )
   {
      FC_ASSERT( *approved != token.owner, "Approval to current owner" );
      FC_ASSERT( _db.find( *approved ) != nullptr, "Invalid address" );
   }
   _db.modify( token, [&approved]( nft_object& t ) {
      t.approved = approved;
   });
} FC_CAPTURE_AND_RETHROW( (caller)(token_id)(approved) ) }

void native_asset_registry::set_approval_for_all( account_id_type owner, account_id_type operator_account,
                                                  bool approved )
{ try {
   FC_ASSERT( owner != operator_account, "Approve to caller" );
   FC_ASSERT( _db.find( operator_account ) != nullptr, "Invalid address" );

   const auto& idx = _db.get_index_type<nft_operator_approval_index>().indices().get<by_registry_owner_operator>();
   auto itr = idx.find( boost::make_tuple( _id, owner, operator_account ) );
   if( approved && itr == idx.end() )
   {
      _db.create<nft_operator_approval_object>( [&]( nft_operator_approval_object& a ) {
         a.registry = _id;
         a.owner = owner;
         a.operator_account = operator_account;
      });
   }
   else if( !approved && itr != idx.end() )
      _db.remove( *itr );
} FC_CAPTURE_AND_RETHROW( (owner)(operator_account)(approved) ) }

void native_asset_registry::safe_transfer_from( account_id_type operator_account, account_id_type from,
                                                account_id_type to, token_id_type token_id )
{ try {
   const nft_object& token = get_token( token_id );
   RELIC_ASSERT( token.owner == from, custody_exception, "Transfer from incorrect owner",
                 ("from", from)("owner", token.owner) );
   RELIC_ASSERT( is_approved_or_owner( operator_account, token_id ), custody_exception,
                 "Caller is not token owner or approved", ("operator", operator_account) );
   const account_object* receiver = _db.find( to );
   FC_ASSERT( receiver != nullptr, "Transfer to the zero address" );
   RELIC_ASSERT( receiver->can_receive_assets(), custody_exception, "Transfer to non receiver implementer",
                 ("to", to) );

   _db.modify( token, [to]( nft_object& t ) {
      t.owner = to;
      t.approved.reset();
   });
} FC_CAPTURE_AND_RETHROW( (operator_account)(from)(to)(token_id) ) }

void native_asset_registry::mint( account_id_type issuer, account_id_type to, token_id_type token_id,
                                  const string& uri )
{ try {
   RELIC_ASSERT( issuer == registry_object().issuer, unauthorized_caller_exception,
                 "Only the registry issuer may mint", ("issuer", issuer) );
   FC_ASSERT( _db.find_nft( _id, token_id ) == nullptr, "Token already minted", ("token_id", token_id) );
   const account_object* receiver = _db.find( to );
   FC_ASSERT( receiver != nullptr, "Mint to the zero address" );
   RELIC_ASSERT( receiver->can_receive_assets(), custody_exception, "Transfer to non receiver implementer",
                 ("to", to) );

   _db.create<nft_object>( [&]( nft_object& t ) {
      t.registry = _id;
      t.token_id = token_id;
      t.owner = to;
      t.uri = uri;
   });
} FC_CAPTURE_AND_RETHROW( (issuer)(to)(token_id) ) }

optional<royalty_info> native_royalty_registry::query_royalty( token_id_type token_id, share_type sale_price )const
{
   const auto& declared = registry_object().royalty;
   if( !declared.valid() )
      return optional<royalty_info>();
   royalty_info info;
   info.recipient = declared->receiver;
   info.amount = cut_fee( sale_price, declared->bps );
   return info;
}

} } // relic::chain
