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
    * @brief Opens, modifies or closes the position of @ref owner
    *
    * A positive collateral adjustment moves collateral from the owner into the
    * loans account, a positive debit adjustment issues stable currency to the
    * owner. Negative adjustments do the reverse.
    */
   struct adjust_loan_operation : public base_operation
   {
      account_id_type  owner;
      amount_type      collateral_adjustment;
      amount_type      debit_adjustment;

      account_id_type signer()const { return owner; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Moves the whole position of @ref from onto @ref to. @ref from must have
    * authorized @ref to beforehand.
    */
   struct transfer_loan_from_operation : public base_operation
   {
      account_id_type  to;
      account_id_type  from;

      account_id_type signer()const { return to; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Allows @ref authorizee to take over the position of @ref authorizer. A deposit is
    * held from the authorizer until the authorization is withdrawn.
    */
   struct authorize_loan_operation : public base_operation
   {
      account_id_type  authorizer;
      account_id_type  authorizee;

      account_id_type signer()const { return authorizer; }
      void            validate()const;
   };

   struct unauthorize_loan_operation : public base_operation
   {
      account_id_type  authorizer;
      account_id_type  authorizee;

      account_id_type signer()const { return authorizer; }
      void            validate()const;
   };

   struct unauthorize_all_loans_operation : public base_operation
   {
      account_id_type  authorizer;

      account_id_type signer()const { return authorizer; }
   };

   /**
    * @ingroup operations
    *
    * Same as @ref adjust_loan_operation with the debit change given in stable
    * currency. The value is converted to debit at the current exchange rate, and
    * a repayment larger than the position's debit repays all of it.
    */
   struct adjust_loan_by_debit_value_operation : public base_operation
   {
      account_id_type  owner;
      amount_type      collateral_adjustment;
      amount_type      debit_value_adjustment;

      account_id_type signer()const { return owner; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Repays @ref amount debit of the position of @ref owner and borrows it again,
    * revalidating the position against the required collateral ratio and the
    * debit cap at the current exchange rate.
    */
   struct transfer_debit_operation : public base_operation
   {
      account_id_type  owner;
      balance_type     amount;

      account_id_type signer()const { return owner; }
      void            validate()const;
   };

   struct debit_transferred_operation : public base_virtual_operation
   {
      debit_transferred_operation(){}
      debit_transferred_operation( account_id_type o, const balance_type& a ):owner(o),amount(a){}

      account_id_type  owner;
      balance_type     amount;
   };

   struct loan_authorization_operation : public base_virtual_operation
   {
      loan_authorization_operation(){}
      loan_authorization_operation( account_id_type a, account_id_type b ):authorizer(a),authorizee(b){}

      account_id_type  authorizer;
      account_id_type  authorizee;
   };

   struct loan_unauthorization_operation : public base_virtual_operation
   {
      loan_unauthorization_operation(){}
      loan_unauthorization_operation( account_id_type a, account_id_type b ):authorizer(a),authorizee(b){}

      account_id_type  authorizer;
      account_id_type  authorizee;
   };

   struct loan_unauthorization_all_operation : public base_virtual_operation
   {
      loan_unauthorization_all_operation(){}
      explicit loan_unauthorization_all_operation( account_id_type a ):authorizer(a){}

      account_id_type  authorizer;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::adjust_loan_operation, (owner)(collateral_adjustment)(debit_adjustment) )
FC_REFLECT( honzon::chain::transfer_loan_from_operation, (to)(from) )
FC_REFLECT( honzon::chain::adjust_loan_by_debit_value_operation, (owner)(collateral_adjustment)(debit_value_adjustment) )
FC_REFLECT( honzon::chain::transfer_debit_operation, (owner)(amount) )
FC_REFLECT( honzon::chain::debit_transferred_operation, (owner)(amount) )
FC_REFLECT( honzon::chain::authorize_loan_operation, (authorizer)(authorizee) )
FC_REFLECT( honzon::chain::unauthorize_loan_operation, (authorizer)(authorizee) )
FC_REFLECT( honzon::chain::unauthorize_all_loans_operation, (authorizer) )
FC_REFLECT( honzon::chain::loan_authorization_operation, (authorizer)(authorizee) )
FC_REFLECT( honzon::chain::loan_unauthorization_operation, (authorizer)(authorizee) )
FC_REFLECT( honzon::chain::loan_unauthorization_all_operation, (authorizer) )
