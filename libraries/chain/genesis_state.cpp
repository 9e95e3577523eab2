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
#include <relic/chain/genesis_state.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

namespace relic { namespace chain {

genesis_state_type load_genesis_from_file( const fc::path& genesis_file )
{ try {
   FC_ASSERT( fc::exists( genesis_file ), "Genesis file '${f}' does not exist", ("f", genesis_file.generic_string()) );
   ilog( "Loading genesis state from ${f}", ("f", genesis_file.generic_string()) );
   return fc::json::from_file( genesis_file ).as<genesis_state_type>( RELIC_MAX_NESTED_OBJECTS );
} FC_CAPTURE_AND_RETHROW( (genesis_file) ) }

} } // relic::chain
