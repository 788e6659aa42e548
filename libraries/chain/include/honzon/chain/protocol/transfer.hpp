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
#include <honzon/chain/protocol/base.hpp>

namespace honzon { namespace chain {

   /**
    * @ingroup operations
    *
    * @brief Transfers an amount of one asset from one account to another
    *
    *  Only the free balance of @ref from may be spent, held balances stay
    *  where they are.
    */
   struct transfer_operation : public base_operation
   {
      /// Account to transfer asset from
      account_id_type  from;
      /// Account to transfer asset to
      account_id_type  to;
      asset_id_type    asset_id;
      balance_type     amount;

      account_id_type signer()const { return from; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Publishes the price of one unit of @ref asset_id expressed in the stable
    * currency. Only the oracle authority may publish.
    */
   struct price_feed_publish_operation : public base_operation
   {
      account_id_type  publisher;
      asset_id_type    asset_id;
      price_type       price;

      account_id_type signer()const { return publisher; }
      void            validate()const;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::transfer_operation, (from)(to)(asset_id)(amount) )
FC_REFLECT( honzon::chain::price_feed_publish_operation, (publisher)(asset_id)(price) )
