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
    * @brief Irreversibly halts debit issuance and collateral auctions
    *
    * Locks the collateral price at its current feed. Settlement of remaining
    * positions and cancellation of running auctions become possible.
    */
   struct emergency_shutdown_operation : public base_operation
   {
      account_id_type  authority;

      account_id_type signer()const { return authority; }
   };

   /**
    * @ingroup operations
    *
    * Allows stable currency holders to redeem collateral, once every position
    * is settled and no collateral is left in auction.
    */
   struct open_collateral_refund_operation : public base_operation
   {
      account_id_type  authority;

      account_id_type signer()const { return authority; }
   };

   /**
    * @ingroup operations
    *
    * Burns @ref amount stable currency of @ref owner and pays out the same
    * proportion of the treasury's collateral.
    */
   struct refund_collaterals_operation : public base_operation
   {
      account_id_type  owner;
      balance_type     amount;

      account_id_type signer()const { return owner; }
      void            validate()const;
   };

   struct shutdown_operation : public base_virtual_operation
   {
      shutdown_operation(){}
      explicit shutdown_operation( block_number_type n ):block_number(n){}

      block_number_type block_number = 0;
   };

   struct open_refund_operation : public base_virtual_operation
   {
      open_refund_operation(){}
      explicit open_refund_operation( block_number_type n ):block_number(n){}

      block_number_type block_number = 0;
   };

   struct refund_operation : public base_virtual_operation
   {
      account_id_type  who;
      balance_type     stable_amount;
      balance_type     refund_amount;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::emergency_shutdown_operation, (authority) )
FC_REFLECT( honzon::chain::open_collateral_refund_operation, (authority) )
FC_REFLECT( honzon::chain::refund_collaterals_operation, (owner)(amount) )
FC_REFLECT( honzon::chain::shutdown_operation, (block_number) )
FC_REFLECT( honzon::chain::open_refund_operation, (block_number) )
FC_REFLECT( honzon::chain::refund_operation, (who)(stable_amount)(refund_amount) )
