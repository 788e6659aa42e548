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
    * Sets the lot size used when collateral is split into several auctions.
    * Zero disables splitting.
    */
   struct set_expected_collateral_auction_size_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     size;

      account_id_type signer()const { return authority; }
   };

   /**
    * @ingroup operations
    *
    * Sets the amount of debit that the end of block offset leaves in the debit pool.
    */
   struct set_debit_offset_buffer_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     amount;

      account_id_type signer()const { return authority; }
   };

   /**
    * @ingroup operations
    *
    * Moves surplus stable currency from the CDP treasury to the governance treasury.
    */
   struct extract_surplus_to_treasury_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     amount;

      account_id_type signer()const { return authority; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Puts collateral owned by the treasury up for auction, the proceeds being
    * refunded to the treasury itself.
    */
   struct auction_collateral_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     amount;
      balance_type     target;
      bool             split = false;

      account_id_type signer()const { return authority; }
      void            validate()const;
   };

   struct expected_collateral_auction_size_updated_operation : public base_virtual_operation
   {
      expected_collateral_auction_size_updated_operation(){}
      explicit expected_collateral_auction_size_updated_operation( const balance_type& s ):new_size(s){}

      balance_type     new_size;
   };

   struct debit_offset_buffer_updated_operation : public base_virtual_operation
   {
      debit_offset_buffer_updated_operation(){}
      explicit debit_offset_buffer_updated_operation( const balance_type& a ):amount(a){}

      balance_type     amount;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::set_expected_collateral_auction_size_operation, (authority)(size) )
FC_REFLECT( honzon::chain::set_debit_offset_buffer_operation, (authority)(amount) )
FC_REFLECT( honzon::chain::extract_surplus_to_treasury_operation, (authority)(amount) )
FC_REFLECT( honzon::chain::auction_collateral_operation, (authority)(amount)(target)(split) )
FC_REFLECT( honzon::chain::expected_collateral_auction_size_updated_operation, (new_size) )
FC_REFLECT( honzon::chain::debit_offset_buffer_updated_operation, (amount) )
