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
    * @brief Virtual op recording a change of a position
    */
   struct position_updated_operation : public base_virtual_operation
   {
      position_updated_operation(){}
      position_updated_operation( account_id_type o, const amount_type& c, const amount_type& d )
         :owner(o),collateral_adjustment(c),debit_adjustment(d){}

      account_id_type  owner;
      amount_type      collateral_adjustment;
      amount_type      debit_adjustment;
   };

   /**
    * @ingroup operations
    * @brief Virtual op recording collateral and debit taken from a position by the engine
    */
   struct confiscate_collateral_and_debit_operation : public base_virtual_operation
   {
      confiscate_collateral_and_debit_operation(){}
      confiscate_collateral_and_debit_operation( account_id_type o, const balance_type& c, const balance_type& d )
         :owner(o),confiscated_collateral_amount(c),deduct_debit_amount(d){}

      account_id_type  owner;
      balance_type     confiscated_collateral_amount;
      balance_type     deduct_debit_amount;
   };

   /**
    * @ingroup operations
    * @brief Virtual op recording that the whole position of @ref from moved to @ref to
    */
   struct transfer_loan_operation : public base_virtual_operation
   {
      transfer_loan_operation(){}
      transfer_loan_operation( account_id_type f, account_id_type t ):from(f),to(t){}

      account_id_type  from;
      account_id_type  to;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::position_updated_operation, (owner)(collateral_adjustment)(debit_adjustment) )
FC_REFLECT( honzon::chain::confiscate_collateral_and_debit_operation, (owner)(confiscated_collateral_amount)(deduct_debit_amount) )
FC_REFLECT( honzon::chain::transfer_loan_operation, (from)(to) )
