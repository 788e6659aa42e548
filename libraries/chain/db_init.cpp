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

#include <honzon/chain/database.hpp>

#include <honzon/chain/account_object.hpp>
#include <honzon/chain/asset_object.hpp>
#include <honzon/chain/auction_object.hpp>
#include <honzon/chain/cdp_object.hpp>
#include <honzon/chain/global_property_object.hpp>
#include <honzon/chain/loan_object.hpp>
#include <honzon/chain/price_feed_object.hpp>

#include <honzon/chain/auction_evaluator.hpp>
#include <honzon/chain/cdp_engine_evaluator.hpp>
#include <honzon/chain/cdp_treasury_evaluator.hpp>
#include <honzon/chain/emergency_shutdown_evaluator.hpp>
#include <honzon/chain/honzon_evaluator.hpp>
#include <honzon/chain/issuance_buffer_evaluator.hpp>
#include <honzon/chain/transfer_evaluator.hpp>

namespace honzon { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<transfer_evaluator>();
   register_evaluator<price_feed_publish_evaluator>();
   register_evaluator<adjust_loan_evaluator>();
   register_evaluator<transfer_loan_from_evaluator>();
   register_evaluator<authorize_loan_evaluator>();
   register_evaluator<unauthorize_loan_evaluator>();
   register_evaluator<unauthorize_all_loans_evaluator>();
   register_evaluator<liquidate_cdp_evaluator>();
   register_evaluator<settle_cdp_evaluator>();
   register_evaluator<set_collateral_params_evaluator>();
   register_evaluator<emergency_shutdown_evaluator>();
   register_evaluator<open_collateral_refund_evaluator>();
   register_evaluator<refund_collaterals_evaluator>();
   register_evaluator<auction_bid_evaluator>();
   register_evaluator<set_expected_collateral_auction_size_evaluator>();
   register_evaluator<set_debit_offset_buffer_evaluator>();
   register_evaluator<extract_surplus_to_treasury_evaluator>();
   register_evaluator<auction_collateral_evaluator>();
   register_evaluator<cancel_collateral_auction_evaluator>();
   register_evaluator<adjust_loan_by_debit_value_evaluator>();
   register_evaluator<transfer_debit_evaluator>();
   register_evaluator<fund_issuance_buffer_evaluator>();
   register_evaluator<defund_issuance_buffer_evaluator>();
   register_evaluator<set_issuance_discount_evaluator>();
   register_evaluator<set_issuance_quota_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( HONZON_MAX_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<asset_index> >();
   add_index< primary_index<auction_index> >();
   add_index< primary_index<collateral_auction_index> >();

   //Implementation object indexes
   add_index< primary_index<global_property_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<account_hold_index> >();
   add_index< primary_index<position_index> >();
   add_index< primary_index<total_positions_index> >();
   add_index< primary_index<loan_authorization_index> >();
   add_index< primary_index<cdp_engine_index> >();
   add_index< primary_index<cdp_treasury_index> >();
   add_index< primary_index<auction_manager_index> >();
   add_index< primary_index<shutdown_state_index> >();
   add_index< primary_index<price_feed_index> >();
   add_index< primary_index<issuance_buffer_index> >();
}

void database::initialize_auction_handler()
{
   auction_handler handler;
   handler.on_new_bid = [this]( block_number_type now, auction_id_type id,
                                const auction_bid_type& new_bid, const optional<auction_bid_type>& last_bid )
   {
      return collateral_auction_on_new_bid( now, id, new_bid, last_bid );
   };
   handler.on_auction_ended = [this]( auction_id_type id, const optional<auction_bid_type>& winner )
   {
      collateral_auction_on_ended( id, winner );
   };
   set_auction_handler( handler );
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( genesis_state.initial_timestamp != time_point_sec(), "Must initialize genesis timestamp." );
   FC_ASSERT( genesis_state.initial_timestamp.sec_since_epoch() % genesis_state.initial_parameters.block_interval == 0,
              "Genesis timestamp must be divisible by the block interval." );

   _undo_db.disable();

   // Create module accounts
   const account_object& committee_account =
      create<account_object>( []( account_object& a ) { a.name = HONZON_COMMITTEE_ACCOUNT_NAME; } );
   FC_ASSERT( committee_account.get_id() == HONZON_COMMITTEE_ACCOUNT );
   FC_ASSERT( create<account_object>( []( account_object& a ) {
                 a.name = HONZON_LOANS_ACCOUNT_NAME;
              }).get_id() == HONZON_LOANS_ACCOUNT );
   FC_ASSERT( create<account_object>( []( account_object& a ) {
                 a.name = HONZON_CDP_TREASURY_ACCOUNT_NAME;
              }).get_id() == HONZON_CDP_TREASURY_ACCOUNT );
   FC_ASSERT( create<account_object>( []( account_object& a ) {
                 a.name = HONZON_TREASURY_ACCOUNT_NAME;
              }).get_id() == HONZON_TREASURY_ACCOUNT );
   FC_ASSERT( create<account_object>( []( account_object& a ) {
                 a.name = HONZON_ISSUANCE_BUFFER_ACCOUNT_NAME;
              }).get_id() == HONZON_ISSUANCE_BUFFER_ACCOUNT );

   // Create the collateral and the stable asset
   FC_ASSERT( create<asset_object>( []( asset_object& a ) {
                 a.symbol = HONZON_NATIVE_SYMBOL;
                 a.precision = HONZON_NATIVE_PRECISION;
              }).get_id() == HONZON_NATIVE_ASSET );
   FC_ASSERT( create<asset_object>( []( asset_object& a ) {
                 a.symbol = HONZON_STABLE_SYMBOL;
                 a.precision = HONZON_STABLE_PRECISION;
              }).get_id() == HONZON_STABLE_ASSET );

   // Create global properties
   create<global_property_object>( [&genesis_state]( global_property_object& p ) {
      p.parameters = genesis_state.initial_parameters;
   });
   create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.head_block_number = 0;
      p.time = genesis_state.initial_timestamp;
   });

   // Create module singletons
   create<total_positions_object>( []( total_positions_object& ){} );
   create<cdp_engine_object>( [&genesis_state]( cdp_engine_object& e ) {
      e.collateral_params = genesis_state.initial_collateral_params;
      e.debit_exchange_rate = genesis_state.initial_parameters.default_debit_exchange_rate;
      e.last_accumulation_secs = genesis_state.initial_timestamp.sec_since_epoch();
   });
   create<cdp_treasury_object>( [&genesis_state]( cdp_treasury_object& t ) {
      t.expected_collateral_auction_size = genesis_state.initial_expected_collateral_auction_size;
      t.debit_offset_buffer = genesis_state.initial_debit_offset_buffer;
   });
   create<auction_manager_object>( []( auction_manager_object& ){} );
   create<shutdown_state_object>( []( shutdown_state_object& ){} );
   create<issuance_buffer_object>( []( issuance_buffer_object& ){} );

   // Create initial accounts
   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( get_index_type<account_index>().indices().get<by_name>().count( account.name ) == 0,
                 "duplicate account ${n}", ("n", account.name) );
      create<account_object>( [&account]( account_object& a ) { a.name = account.name; } );
   }

   // Create initial balances
   for( const auto& balance : genesis_state.initial_account_balances )
   {
      const auto& owner = get_account_by_name( balance.owner_name );
      const auto& asset = get_asset_by_symbol( balance.asset_symbol );
      assets().mint( owner.get_id(), asset.get_id(), balance.amount );
   }

   // Publish initial prices
   for( const auto& feed : genesis_state.initial_price_feeds )
      publish_price( get_asset_by_symbol( feed.asset_symbol ).get_id(), feed.price );

   _undo_db.enable();

   ilog( "initialized genesis with ${a} accounts and ${b} balances",
         ("a", genesis_state.initial_accounts.size())("b", genesis_state.initial_account_balances.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
