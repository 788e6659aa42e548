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

namespace honzon { namespace chain {

   /**
    *  @class price_provider
    *  @brief source of asset prices for the CDP engine
    */
   class price_provider
   {
      public:
         virtual ~price_provider(){}

         /**
          *  @return how many units of @ref quote one unit of @ref base is worth,
          *  empty when either feed is missing
          */
         virtual optional<price_type> get_relative_price( asset_id_type base, asset_id_type quote )const = 0;

         /// freezes the current feed of @ref asset for good, later publications do not change it
         virtual void lock_price( asset_id_type asset ) = 0;
   };

   class database;

   /**
    *  @brief price_provider reading the price_feed_object of each asset
    *
    *  Prices are quoted in the stable asset, a relative price is the ratio of
    *  the two feeds. The stable asset itself is always worth 1.
    */
   class database_price_provider : public price_provider
   {
      public:
         explicit database_price_provider( database& db ):_db(db){}

         virtual optional<price_type> get_relative_price( asset_id_type base, asset_id_type quote )const override;
         virtual void lock_price( asset_id_type asset ) override;

      private:
         optional<price_type> get_price( asset_id_type asset )const;

         database& _db;
   };

} } // honzon::chain
