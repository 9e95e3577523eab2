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
#include <relic/protocol/account.hpp>

namespace relic { namespace protocol {

/**
 * Names must comply with the following grammar (RFC 1035):
 * <domain> ::= <subdomain> | " "
 * <subdomain> ::= <label> | <subdomain> "." <label>
 * <label> ::= <letter> [ [ <ldh-str> ] <let-dig> ]
 * <ldh-str> ::= <let-dig-hyp> | <let-dig-hyp> <ldh-str>
 * <let-dig-hyp> ::= <let-dig> | "-"
 * <let-dig> ::= <letter> | <digit>
 *
 * In addition we require the following:
 *
 * - All letters are lowercase
 * - Each label is three characters or more
 * - Length is between (inclusive) RELIC_MIN_ACCOUNT_NAME_LENGTH and RELIC_MAX_ACCOUNT_NAME_LENGTH
 */
bool is_valid_name( const string& name )
{
   const size_t len = name.size();
   if( len < RELIC_MIN_ACCOUNT_NAME_LENGTH )
      return false;

   if( len > RELIC_MAX_ACCOUNT_NAME_LENGTH )
      return false;

   auto is_lower = []( char c ) { return c >= 'a' && c <= 'z'; };
   auto is_digit = []( char c ) { return c >= '0' && c <= '9'; };

   size_t begin = 0;
   while( true )
   {
      size_t end = name.find_first_of( '.', begin );
      if( end == std::string::npos )
         end = len;
      if( end - begin < 3 )
         return false;
      if( !is_lower( name[begin] ) )
         return false;
      if( !is_lower( name[end-1] ) && !is_digit( name[end-1] ) )
         return false;
      for( size_t i = begin+1; i < end-1; i++ )
      {
         const char c = name[i];
         if( !is_lower( c ) && !is_digit( c ) && c != '-' )
            return false;
      }
      if( end == len )
         break;
      begin = end+1;
   }
   return true;
}

/**
 *  Valid symbols can contain [A, Z], and '.'
 *  They must start with [A, Z]
 *  They must end with [A, Z]
 *  They can contain a maximum of one '.'
 */
bool is_valid_symbol( const string& symbol )
{
   if( symbol.size() < RELIC_MIN_REGISTRY_SYMBOL_LENGTH )
      return false;

   if( symbol.size() > RELIC_MAX_REGISTRY_SYMBOL_LENGTH )
      return false;

   auto is_upper = []( char c ) { return c >= 'A' && c <= 'Z'; };

   if( !is_upper( symbol.front() ) || !is_upper( symbol.back() ) )
      return false;

   bool dot_already_present = false;
   for( const auto c : symbol )
   {
      if( is_upper( c ) )
         continue;

      if( c == '.' )
      {
         if( dot_already_present )
            return false;

         dot_already_present = true;
         continue;
      }

      return false;
   }

   return true;
}

void account_create_operation::validate()const
{
   FC_ASSERT( is_valid_name( name ), "Invalid account name ${n}", ("n", name) );
   FC_ASSERT( is_contract || accepts_assets, "Only contract accounts may refuse assets" );
}

} } // relic::protocol
