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

#include <relic/chain/asset_registry.hpp>
#include <relic/chain/nft_object.hpp>

namespace relic { namespace chain {

std::unique_ptr<asset_registry> database::get_asset_registry( asset_registry_id_type id )
{ try {
   const asset_registry_object& registry = id(*this);

   auto itr = _registry_factories.find( id );
   if( itr != _registry_factories.end() )
   {
      auto result = itr->second( *this, id );
      FC_ASSERT( result != nullptr, "Registry factory of ${r} returned nothing", ("r", id) );
      return result;
   }

   if( registry.royalty.valid() )
      return std::make_unique<native_royalty_registry>( *this, id );
   return std::make_unique<native_asset_registry>( *this, id );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void database::set_asset_registry_factory( asset_registry_id_type id, asset_registry_factory factory )
{
   FC_ASSERT( find( id ) != nullptr, "Unknown asset registry ${r}", ("r", id) );
   if( factory )
      _registry_factories[id] = std::move( factory );
   else
      _registry_factories.erase( id );
}

} }
