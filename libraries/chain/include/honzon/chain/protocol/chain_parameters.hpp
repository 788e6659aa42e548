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
    *  Runtime parameters of the chain, stored in the global_property_object and
    *  initialized from the genesis state.
    */
   struct chain_parameters
   {
      uint8_t                 block_interval                  = HONZON_DEFAULT_BLOCK_INTERVAL; ///< interval in seconds between blocks

      account_id_type         update_origin                   = HONZON_COMMITTEE_ACCOUNT; ///< may tune collateral params and the treasury
      account_id_type         shutdown_origin                 = HONZON_COMMITTEE_ACCOUNT; ///< may trigger emergency shutdown and open refunds
      account_id_type         oracle_origin                   = HONZON_COMMITTEE_ACCOUNT; ///< may publish price feeds

      block_number_type       auction_time_to_close           = HONZON_DEFAULT_AUCTION_TIME_TO_CLOSE;
      block_number_type       auction_duration_soft_cap       = HONZON_DEFAULT_AUCTION_DURATION_SOFT_CAP;
      rate_type               minimum_increment_size          = rate_type::from_rational( HONZON_DEFAULT_MINIMUM_INCREMENT_NUMERATOR,
                                                                                          HONZON_DEFAULT_MINIMUM_INCREMENT_DENOMINATOR );
      uint32_t                max_auctions_count              = HONZON_DEFAULT_MAX_AUCTIONS_COUNT; ///< lots created by one split

      balance_type            minimum_debit_value             = HONZON_DEFAULT_MINIMUM_DEBIT_VALUE;
      balance_type            minimum_collateral_amount       = HONZON_DEFAULT_MINIMUM_COLLATERAL_AMOUNT;
      ratio_type              default_liquidation_ratio       = ratio_type::from_rational( HONZON_DEFAULT_LIQUIDATION_RATIO_NUMERATOR,
                                                                                           HONZON_DEFAULT_LIQUIDATION_RATIO_DENOMINATOR );
      exchange_rate_type      default_debit_exchange_rate     = exchange_rate_type::one();
      rate_type               default_liquidation_penalty     = rate_type::from_rational( HONZON_DEFAULT_LIQUIDATION_PENALTY_NUMERATOR,
                                                                                          HONZON_DEFAULT_LIQUIDATION_PENALTY_DENOMINATOR );

      balance_type            deposit_per_authorization       = HONZON_DEFAULT_DEPOSIT_PER_AUTHORIZATION;
      uint32_t                keeper_max_iterations           = HONZON_DEFAULT_KEEPER_MAX_ITERATIONS; ///< positions checked per block

      void validate()const;
   };

} }  // honzon::chain

FC_REFLECT( honzon::chain::chain_parameters,
            (block_interval)
            (update_origin)
            (shutdown_origin)
            (oracle_origin)
            (auction_time_to_close)
            (auction_duration_soft_cap)
            (minimum_increment_size)
            (max_auctions_count)
            (minimum_debit_value)
            (minimum_collateral_amount)
            (default_liquidation_ratio)
            (default_debit_exchange_rate)
            (default_liquidation_penalty)
            (deposit_per_authorization)
            (keeper_max_iterations)
          )
