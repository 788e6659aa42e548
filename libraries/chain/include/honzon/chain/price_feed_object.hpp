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

#pragma once
#include <honzon/chain/protocol/types.hpp>
#include <honzon/chain/protocol/fixed_point.hpp>
#include <honzon/db/generic_index.hpp>

namespace honzon { namespace chain {

   /**
    *  @brief latest price of an asset in stable currency
    *  @ingroup object
    *  @ingroup implementation
    *
    *  While @ref locked_price is set it overrides @ref price.
    */
   class price_feed_object : public abstract_object<price_feed_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_price_feed_object_type;

         asset_id_type           asset_id;
         optional<price_type>    price;
         optional<price_type>    locked_price;

         optional<price_type> effective_price()const { return locked_price.valid() ? locked_price : price; }
   };

   struct by_asset;
   typedef multi_index_container<
      price_feed_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_asset>, member< price_feed_object, asset_id_type, &price_feed_object::asset_id > >
      >
   > price_feed_multi_index_type;

   typedef generic_index<price_feed_object, price_feed_multi_index_type> price_feed_index;

} } // honzon::chain

FC_REFLECT_DERIVED( honzon::chain::price_feed_object, (honzon::db::object), (asset_id)(price)(locked_price) )
