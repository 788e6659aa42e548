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
    * @brief Updates the risk parameters of the collateral
    *
    * Fields left empty are not changed. Each changed field emits its own
    * *_updated virtual operation.
    */
   struct set_collateral_params_operation : public base_operation
   {
      account_id_type         authority;
      optional<param_update>  interest_rate_per_sec;
      optional<param_update>  liquidation_ratio;
      optional<param_update>  liquidation_penalty;
      optional<param_update>  required_collateral_ratio;
      optional<balance_type>  maximum_total_debit_value;

      account_id_type signer()const { return authority; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    *
    * Liquidates the position of @ref owner if it is unsafe. Anyone may dispatch it.
    */
   struct liquidate_cdp_operation : public base_operation
   {
      account_id_type  caller;
      account_id_type  owner;

      account_id_type signer()const { return caller; }
   };

   /**
    * @ingroup operations
    *
    * Settles the debit of @ref owner against its collateral after emergency shutdown.
    */
   struct settle_cdp_operation : public base_operation
   {
      account_id_type  caller;
      account_id_type  owner;

      account_id_type signer()const { return caller; }
   };

   struct liquidate_unsafe_cdp_operation : public base_virtual_operation
   {
      account_id_type  owner;
      balance_type     collateral_amount;
      balance_type     bad_debt_value;
      balance_type     target_amount;
   };

   struct settle_cdp_in_debit_operation : public base_virtual_operation
   {
      settle_cdp_in_debit_operation(){}
      explicit settle_cdp_in_debit_operation( account_id_type o ):owner(o){}

      account_id_type  owner;
   };

   struct liquidation_ratio_updated_operation : public base_virtual_operation
   {
      optional<ratio_type>  new_liquidation_ratio;
   };

   struct required_collateral_ratio_updated_operation : public base_virtual_operation
   {
      optional<ratio_type>  new_required_collateral_ratio;
   };

   struct interest_rate_per_sec_updated_operation : public base_virtual_operation
   {
      optional<rate_type>   new_interest_rate_per_sec;
   };

   struct liquidation_penalty_updated_operation : public base_virtual_operation
   {
      optional<rate_type>   new_liquidation_penalty;
   };

   struct maximum_total_debit_value_updated_operation : public base_virtual_operation
   {
      balance_type          new_total_debit_value;
   };

} } // honzon::chain

FC_REFLECT( honzon::chain::set_collateral_params_operation,
            (authority)
            (interest_rate_per_sec)
            (liquidation_ratio)
            (liquidation_penalty)
            (required_collateral_ratio)
            (maximum_total_debit_value)
          )
FC_REFLECT( honzon::chain::liquidate_cdp_operation, (caller)(owner) )
FC_REFLECT( honzon::chain::settle_cdp_operation, (caller)(owner) )
FC_REFLECT( honzon::chain::liquidate_unsafe_cdp_operation, (owner)(collateral_amount)(bad_debt_value)(target_amount) )
FC_REFLECT( honzon::chain::settle_cdp_in_debit_operation, (owner) )
FC_REFLECT( honzon::chain::liquidation_ratio_updated_operation, (new_liquidation_ratio) )
FC_REFLECT( honzon::chain::required_collateral_ratio_updated_operation, (new_required_collateral_ratio) )
FC_REFLECT( honzon::chain::interest_rate_per_sec_updated_operation, (new_interest_rate_per_sec) )
FC_REFLECT( honzon::chain::liquidation_penalty_updated_operation, (new_liquidation_penalty) )
FC_REFLECT( honzon::chain::maximum_total_debit_value_updated_operation, (new_total_debit_value) )
