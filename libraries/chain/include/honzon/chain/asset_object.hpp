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
#include <honzon/db/generic_index.hpp>

namespace honzon { namespace chain {

   /**
    *  @brief tracks the parameters and the issuance of an asset
    *  @ingroup object
    *
    *  The chain knows exactly two assets: the native collateral asset and the
    *  stable currency issued against it.
    */
   class asset_object : public honzon::db::abstract_object<asset_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = asset_object_type;

         /// Ticker symbol for this asset, i.e. "AUSD"
         string          symbol;
         /// Maximum number of digits after the decimal point (must be <= 12)
         uint8_t         precision = 0;
         /// Sum of every free and held balance of this asset
         balance_type    current_supply;

         asset_id_type   get_id()const { return id; }
   };

   struct by_symbol;
   typedef multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_symbol>, member<asset_object, string, &asset_object::symbol> >
      >
   > asset_object_multi_index_type;
   typedef generic_index<asset_object, asset_object_multi_index_type> asset_index;

} } // honzon::chain

FC_REFLECT_DERIVED( honzon::chain::asset_object, (honzon::db::object),
                    (symbol)
                    (precision)
                    (current_supply)
                  )
