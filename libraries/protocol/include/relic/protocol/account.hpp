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
#include <relic/protocol/base.hpp>

namespace relic { namespace protocol {

   /**
    *  A valid name is a dot-separated sequence of labels.  Each label is at least three
    *  characters long, starts with a lower-case letter, ends with a letter or digit and
    *  contains only lower-case letters, digits or hyphens.
    */
   bool is_valid_name( const string& s );

   /**
    *  Registry symbols are upper-case letters with at most one '.', starting and ending with a letter.
    */
   bool is_valid_symbol( const string& symbol );

   /**
    *  @ingroup operations
    *
    *  Registers a new account.  An account with @ref is_contract set models a contract
    *  address: assets sent to it are delivered through its receiver hook, which refuses
    *  them unless @ref accepts_assets is set.
    */
   struct account_create_operation : public base_operation
   {
      account_id_type registrar;             ///< Existing account that registers the new one
      string          name;
      bool            is_contract = false;
      bool            accepts_assets = true; ///< Only meaningful for contracts

      account_id_type caller()const { return registrar; }
      void            validate()const override;
   };

} } // relic::protocol

FC_REFLECT( relic::protocol::account_create_operation,
            (registrar)(name)(is_contract)(accepts_assets) )
