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
#include <honzon/chain/balance_math.hpp>
#include <honzon/db/generic_index.hpp>

namespace honzon { namespace chain {

   /**
    *  Risk parameters of the collateral asset. Unset ratios fall back to the
    *  defaults in chain_parameters, an unset interest rate disables accrual.
    */
   struct risk_management_params
   {
      balance_type          maximum_total_debit_value;
      optional<rate_type>   interest_rate_per_sec;
      optional<ratio_type>  liquidation_ratio;
      optional<rate_type>   liquidation_penalty;
      optional<ratio_type>  required_collateral_ratio;
   };

   /**
    *  @brief state of the CDP engine
    *  @ingroup object
    *  @ingroup implementation
    */
   class cdp_engine_object : public abstract_object<cdp_engine_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_cdp_engine_object_type;

         /// empty until the update origin sets params, positions with debit are rejected meanwhile
         optional<risk_management_params>  collateral_params;

         /// debit value of one debit unit, grows with accrued interest
         exchange_rate_type                debit_exchange_rate = exchange_rate_type::one();

         /// unix time sampled by the last on_initialize, 0 before the first block
         uint64_t                          last_accumulation_secs = 0;

         /// owner of the position the keeper resumes from, empty to start over
         optional<account_id_type>         keeper_cursor;
   };

   /**
    *  @brief scalar counters of the CDP treasury
    *  @ingroup object
    *  @ingroup implementation
    *
    *  The surplus pool and the pooled collateral are balances of the treasury
    *  account and are not stored here.
    */
   class cdp_treasury_object : public abstract_object<cdp_treasury_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_cdp_treasury_object_type;

         /// unbacked debit awaiting offset against surplus
         balance_type      debit_pool;
         /// lot size used when splitting collateral auctions, 0 disables splitting
         balance_type      expected_collateral_auction_size;
         /// debit left in the pool by the end of block offset
         balance_type      debit_offset_buffer;
   };

   /**
    *  @brief emergency shutdown flags
    *  @ingroup object
    *  @ingroup implementation
    *
    *  Both flags only ever move from false to true.
    */
   class shutdown_state_object : public abstract_object<shutdown_state_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_shutdown_state_object_type;

         bool              is_shutdown = false;
         bool              can_refund  = false;
   };

   /**
    *  @brief state of the issuance buffer
    *  @ingroup object
    *  @ingroup implementation
    *
    *  The buffer buys liquidated collateral at a discount to the oracle price before
    *  it goes to auction, issuing stable currency into the surplus pool for it.
    *  The bought collateral is a balance of the issuance buffer account.
    */
   class issuance_buffer_object : public abstract_object<issuance_buffer_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_issuance_buffer_object_type;

         /// share of the oracle price paid for collateral, at most one
         rate_type         discount = rate_type::one();
         /// stable currency the buffer may issue in total
         balance_type      issuance_quota;
         /// stable currency issued so far
         balance_type      issuance_used;

         balance_type remaining_quota()const { return saturating_sub( issuance_quota, issuance_used ); }
   };

   typedef simple_index<cdp_engine_object>      cdp_engine_index;
   typedef simple_index<cdp_treasury_object>    cdp_treasury_index;
   typedef simple_index<shutdown_state_object>  shutdown_state_index;
   typedef simple_index<issuance_buffer_object> issuance_buffer_index;

} } // honzon::chain

FC_REFLECT( honzon::chain::risk_management_params,
            (maximum_total_debit_value)
            (interest_rate_per_sec)
            (liquidation_ratio)
            (liquidation_penalty)
            (required_collateral_ratio)
          )

FC_REFLECT_DERIVED( honzon::chain::cdp_engine_object, (honzon::db::object),
                    (collateral_params)
                    (debit_exchange_rate)
                    (last_accumulation_secs)
                    (keeper_cursor)
                  )

FC_REFLECT_DERIVED( honzon::chain::cdp_treasury_object, (honzon::db::object),
                    (debit_pool)
                    (expected_collateral_auction_size)
                    (debit_offset_buffer)
                  )

FC_REFLECT_DERIVED( honzon::chain::shutdown_state_object, (honzon::db::object), (is_shutdown)(can_refund) )

FC_REFLECT_DERIVED( honzon::chain::issuance_buffer_object, (honzon::db::object),
                    (discount)
                    (issuance_quota)
                    (issuance_used)
                  )
