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
#include <relic/chain/database.hpp>

#include <relic/chain/account_object.hpp>
#include <relic/chain/exceptions.hpp>

#include <fc/uint128.hpp>

namespace relic { namespace chain {

share_type cut_fee( share_type a, uint16_t p )
{
   if( a == 0 || p == 0 )
      return 0;
   if( p == RELIC_100_PERCENT )
      return a;

   fc::uint128_t r = a.value;
   r *= p;
   r /= RELIC_100_PERCENT;
   return static_cast<uint64_t>( r );
}

share_type database::get_balance( account_id_type owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return 0;
   return itr->balance;
}

void database::adjust_balance( account_id_type account, share_type delta )
{ try {
   if( delta == 0 )
      return;

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( account );
   if( itr == index.end() )
   {
      RELIC_ASSERT( delta > 0, insufficient_balance_exception,
                    "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                    ("a", account(*this).name)("r", -delta) );
      create<account_balance_object>( [account,delta]( account_balance_object& b ) {
         b.owner = account;
         b.balance = delta;
      });
   } else {
      if( delta < 0 )
         RELIC_ASSERT( itr->balance >= -delta, insufficient_balance_exception,
                       "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                       ("a", account(*this).name)("b", itr->balance)("r", -delta) );
      modify( *itr, [delta]( account_balance_object& b ) {
         b.adjust_balance( delta );
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(delta) ) }

void database::transfer_balance( account_id_type from, account_id_type to, share_type amount )
{ try {
   FC_ASSERT( amount >= 0, "Cannot transfer a negative amount" );
   if( amount == 0 || from == to )
      return;
   adjust_balance( from, -amount );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

} }
