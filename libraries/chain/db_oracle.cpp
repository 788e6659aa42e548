/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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

#include <honzon/chain/database.hpp>

#include <honzon/chain/price_feed_object.hpp>

namespace honzon { namespace chain {

void database::set_price_provider( unique_ptr<price_provider> provider )
{
   FC_ASSERT( provider, "price provider required" );
   _prices = std::move( provider );
}

void database::publish_price( asset_id_type asset_id, const price_type& price )
{ try {
   FC_ASSERT( find( asset_id ) != nullptr, "asset ${a} does not exist", ("a",asset_id) );

   auto& index = get_index_type<price_feed_index>().indices().get<by_asset>();
   auto itr = index.find( asset_id );
   if( itr == index.end() )
   {
      create<price_feed_object>( [asset_id, &price]( price_feed_object& f ) {
         f.asset_id = asset_id;
         f.price = price;
      });
      return;
   }
   modify( *itr, [&price]( price_feed_object& f ) {
      f.price = price;
   });
} FC_CAPTURE_AND_RETHROW( (asset_id)(price) ) }

optional<price_type> database::get_collateral_price()const
{
   return prices().get_relative_price( HONZON_NATIVE_ASSET, HONZON_STABLE_ASSET );
}

/////////////////////// database_price_provider ///////////////////////

optional<price_type> database_price_provider::get_price( asset_id_type asset )const
{
   if( asset == HONZON_STABLE_ASSET )
      return price_type::one();

   auto& index = _db.get_index_type<price_feed_index>().indices().get<by_asset>();
   auto itr = index.find( asset );
   if( itr == index.end() )
      return optional<price_type>();
   return itr->effective_price();
}

optional<price_type> database_price_provider::get_relative_price( asset_id_type base, asset_id_type quote )const
{
   if( base == quote )
      return price_type::one();

   auto base_price = get_price( base );
   auto quote_price = get_price( quote );
   if( !base_price.valid() || !quote_price.valid() )
      return optional<price_type>();
   return base_price->checked_div( *quote_price );
}

void database_price_provider::lock_price( asset_id_type asset )
{ try {
   auto& index = _db.get_index_type<price_feed_index>().indices().get<by_asset>();
   auto itr = index.find( asset );
   if( itr == index.end() || !itr->price.valid() )
   {
      wlog( "no feed to lock for asset ${a}", ("a",asset) );
      return;
   }
   HONZON_ASSERT( !itr->locked_price.valid(), price_locked, "price of ${a} is already locked", ("a",asset) );
   const price_type locked = *itr->price;
   _db.modify( *itr, [&locked]( price_feed_object& f ) {
      f.locked_price = locked;
   });
   ilog( "locked price of ${a} at ${p}", ("a",asset)("p",locked) );
} FC_CAPTURE_AND_RETHROW( (asset) ) }

} }
