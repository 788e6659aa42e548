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

#include <honzon/chain/genesis_state.hpp>
#include <honzon/chain/config.hpp>
#include <honzon/chain/exceptions.hpp>

#include <set>

namespace honzon { namespace chain {

void genesis_state_type::validate()const
{ try {
   initial_parameters.validate();
   FC_ASSERT( initial_timestamp.sec_since_epoch() % initial_parameters.block_interval == 0,
              "Genesis timestamp must be divisible by the block interval." );

   std::set<string> names = { HONZON_COMMITTEE_ACCOUNT_NAME, HONZON_LOANS_ACCOUNT_NAME,
                              HONZON_CDP_TREASURY_ACCOUNT_NAME, HONZON_TREASURY_ACCOUNT_NAME,
                              HONZON_ISSUANCE_BUFFER_ACCOUNT_NAME };
   for( const auto& account : initial_accounts )
   {
      FC_ASSERT( account.name.size() >= HONZON_MIN_ACCOUNT_NAME_LENGTH &&
                 account.name.size() <= HONZON_MAX_ACCOUNT_NAME_LENGTH, "invalid account name ${n}", ("n",account.name) );
      FC_ASSERT( names.insert( account.name ).second, "duplicate account ${n}", ("n",account.name) );
   }

   const std::set<string> symbols = { HONZON_NATIVE_SYMBOL, HONZON_STABLE_SYMBOL };
   for( const auto& balance : initial_account_balances )
   {
      FC_ASSERT( names.count( balance.owner_name ), "balance of unknown account ${n}", ("n",balance.owner_name) );
      FC_ASSERT( symbols.count( balance.asset_symbol ), "unknown asset ${s}", ("s",balance.asset_symbol) );
   }

   for( const auto& feed : initial_price_feeds )
   {
      FC_ASSERT( feed.asset_symbol == HONZON_NATIVE_SYMBOL, "only the collateral has a price feed" );
      FC_ASSERT( !feed.price.is_zero(), "price of ${s} must be positive", ("s",feed.asset_symbol) );
   }

   if( initial_collateral_params.valid() )
   {
      if( initial_collateral_params->interest_rate_per_sec.valid() )
         FC_ASSERT( *initial_collateral_params->interest_rate_per_sec <= rate_type::one() );
      if( initial_collateral_params->liquidation_penalty.valid() )
         FC_ASSERT( *initial_collateral_params->liquidation_penalty <= rate_type::one() );
   }
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type create_example_genesis()
{
   genesis_state_type genesis;
   // 2020-01-01T00:00:00, a multiple of every allowed block interval up to 30s
   genesis.initial_timestamp = time_point_sec( 1577836800 );

   genesis.initial_price_feeds.push_back( { HONZON_NATIVE_SYMBOL, price_type::one() } );

   risk_management_params params;
   params.maximum_total_debit_value = 10000;
   params.liquidation_ratio = ratio_type::from_rational( 3, 2 );
   params.liquidation_penalty = rate_type::from_rational( 1, 5 );
   params.required_collateral_ratio = ratio_type::from_rational( 2, 1 );
   genesis.initial_collateral_params = params;

   return genesis;
}

} } // namespace honzon::chain
