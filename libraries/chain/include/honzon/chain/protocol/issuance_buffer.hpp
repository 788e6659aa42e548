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
    * Mints @ref amount stable currency into the surplus pool on behalf of the
    * issuance buffer.
    */
   struct fund_issuance_buffer_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     amount;

      account_id_type signer()const { return authority; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Burns @ref amount stable currency from the part of the surplus pool that no
    * bid has pledged.
    */
   struct defund_issuance_buffer_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     amount;

      account_id_type signer()const { return authority; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Sets the share of the oracle price the buffer pays for liquidated collateral,
    * one means no discount.
    */
   struct set_issuance_discount_operation : public base_operation
   {
      account_id_type  authority;
      rate_type        discount;

      account_id_type signer()const { return authority; }
   };

   /**
    * @ingroup operations
    *
    * Sets the total stable currency the buffer may issue to cover liquidated debit.
    */
   struct set_issuance_quota_operation : public base_operation
   {
      account_id_type  authority;
      balance_type     quota;

      account_id_type signer()const { return authority; }
   };

   struct issuance_buffer_funded_operation : public base_virtual_operation
   {
      issuance_buffer_funded_operation(){}
      explicit issuance_buffer_funded_operation( const balance_type& a ):amount(a){}

      balance_type     amount;
   };

   struct issuance_buffer_defunded_operation : public base_virtual_operation
   {
      issuance_buffer_defunded_operation(){}
      explicit issuance_buffer_defunded_operation( const balance_type& a ):amount(a){}

      balance_type     amount;
   };

   struct issuance_discount_updated_operation : public base_virtual_operation
   {
      issuance_discount_updated_operation(){}
      explicit issuance_discount_updated_operation( const rate_type& d ):discount(d){}

      rate_type        discount;
   };

   struct issuance_quota_updated_operation : public base_virtual_operation
   {
      issuance_quota_updated_operation(){}
      explicit issuance_quota_updated_operation( const balance_type& q ):quota(q){}

      balance_type     quota;
   };

   /**
    * @ingroup operations
    * @brief Virtual op recording liquidated collateral of @ref owner bought by the issuance buffer
    */
   struct collateral_bought_by_issuance_buffer_operation : public base_virtual_operation
   {
      account_id_type  owner;
      balance_type     collateral_amount;
      balance_type     debit_value;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::fund_issuance_buffer_operation, (authority)(amount) )
FC_REFLECT( honzon::chain::defund_issuance_buffer_operation, (authority)(amount) )
FC_REFLECT( honzon::chain::set_issuance_discount_operation, (authority)(discount) )
FC_REFLECT( honzon::chain::set_issuance_quota_operation, (authority)(quota) )
FC_REFLECT( honzon::chain::issuance_buffer_funded_operation, (amount) )
FC_REFLECT( honzon::chain::issuance_buffer_defunded_operation, (amount) )
FC_REFLECT( honzon::chain::issuance_discount_updated_operation, (discount) )
FC_REFLECT( honzon::chain::issuance_quota_updated_operation, (quota) )
FC_REFLECT( honzon::chain::collateral_bought_by_issuance_buffer_operation, (owner)(collateral_amount)(debit_value) )
