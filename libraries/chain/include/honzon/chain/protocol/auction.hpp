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
    * @brief Places a bid on a live auction
    *
    * The bid must exceed the current one. Whether it is accepted and how it
    * moves the end of the auction is decided by the auction's handler.
    */
   struct auction_bid_operation : public base_operation
   {
      account_id_type  bidder;
      auction_id_type  auction_id = 0;
      balance_type     value;

      account_id_type signer()const { return bidder; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Cancels a collateral auction after emergency shutdown, refunding the top
    * bidder and returning the collateral. Anyone may dispatch it.
    */
   struct cancel_collateral_auction_operation : public base_operation
   {
      account_id_type  caller;
      auction_id_type  auction_id = 0;

      account_id_type signer()const { return caller; }
   };

   struct auction_bid_placed_operation : public base_virtual_operation
   {
      auction_bid_placed_operation(){}
      auction_bid_placed_operation( auction_id_type id, account_id_type b, const balance_type& a )
         :auction_id(id),bidder(b),amount(a){}

      auction_id_type  auction_id = 0;
      account_id_type  bidder;
      balance_type     amount;
   };

   struct new_collateral_auction_operation : public base_virtual_operation
   {
      auction_id_type  auction_id = 0;
      balance_type     collateral_amount;
      balance_type     target_bid_price;
   };

   struct cancel_auction_operation : public base_virtual_operation
   {
      cancel_auction_operation(){}
      explicit cancel_auction_operation( auction_id_type id ):auction_id(id){}

      auction_id_type  auction_id = 0;
   };

   struct collateral_auction_dealt_operation : public base_virtual_operation
   {
      auction_id_type  auction_id = 0;
      balance_type     collateral_amount;
      account_id_type  winner;
      balance_type     payment_amount;
   };

   struct collateral_auction_aborted_operation : public base_virtual_operation
   {
      auction_id_type  auction_id = 0;
      balance_type     collateral_amount;
      balance_type     target_stable_amount;
      account_id_type  refund_recipient;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::auction_bid_operation, (bidder)(auction_id)(value) )
FC_REFLECT( honzon::chain::cancel_collateral_auction_operation, (caller)(auction_id) )
FC_REFLECT( honzon::chain::auction_bid_placed_operation, (auction_id)(bidder)(amount) )
FC_REFLECT( honzon::chain::new_collateral_auction_operation, (auction_id)(collateral_amount)(target_bid_price) )
FC_REFLECT( honzon::chain::cancel_auction_operation, (auction_id) )
FC_REFLECT( honzon::chain::collateral_auction_dealt_operation, (auction_id)(collateral_amount)(winner)(payment_amount) )
FC_REFLECT( honzon::chain::collateral_auction_aborted_operation, (auction_id)(collateral_amount)(target_stable_amount)(refund_recipient) )
