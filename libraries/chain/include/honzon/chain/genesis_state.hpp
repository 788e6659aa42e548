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

#include <honzon/chain/protocol/chain_parameters.hpp>
#include <honzon/chain/protocol/types.hpp>
#include <honzon/chain/cdp_object.hpp>

#include <string>
#include <vector>

namespace honzon { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string())
         : name(name)
      {}
      string name;
   };
   struct initial_account_balances_type {
      /// Must correspond to one of the initial accounts
      string owner_name;
      string asset_symbol;
      balance_type amount;
   };
   struct initial_price_feed_type {
      string asset_symbol;
      price_type price;
   };

   time_point_sec                           initial_timestamp;
   chain_parameters                         initial_parameters;

   /// created after the module accounts, in this order
   vector<initial_account_type>             initial_accounts;
   vector<initial_account_balances_type>    initial_account_balances;
   vector<initial_price_feed_type>          initial_price_feeds;

   optional<risk_management_params>         initial_collateral_params;
   balance_type                             initial_expected_collateral_auction_size;
   balance_type                             initial_debit_offset_buffer;

   void validate()const;
};

/// genesis with the module accounts, a price feed of 1 and default risk params
genesis_state_type create_example_genesis();

} } // namespace honzon::chain

FC_REFLECT(honzon::chain::genesis_state_type::initial_account_type, (name))

FC_REFLECT(honzon::chain::genesis_state_type::initial_account_balances_type, (owner_name)(asset_symbol)(amount))

FC_REFLECT(honzon::chain::genesis_state_type::initial_price_feed_type, (asset_symbol)(price))

FC_REFLECT(honzon::chain::genesis_state_type,
           (initial_timestamp)(initial_parameters)(initial_accounts)(initial_account_balances)(initial_price_feeds)
           (initial_collateral_params)(initial_expected_collateral_auction_size)(initial_debit_offset_buffer))
