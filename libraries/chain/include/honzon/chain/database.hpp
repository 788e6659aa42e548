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
#include <honzon/chain/global_property_object.hpp>
#include <honzon/chain/account_object.hpp>
#include <honzon/chain/asset_object.hpp>
#include <honzon/chain/loan_object.hpp>
#include <honzon/chain/cdp_object.hpp>
#include <honzon/chain/auction_object.hpp>
#include <honzon/chain/price_feed_object.hpp>
#include <honzon/chain/genesis_state.hpp>
#include <honzon/chain/evaluator.hpp>
#include <honzon/chain/fungible_assets.hpp>
#include <honzon/chain/price_provider.hpp>
#include <honzon/chain/auction_handler.hpp>
#include <honzon/chain/balance_math.hpp>

#include <honzon/db/object_database.hpp>
#include <honzon/db/object.hpp>
#include <fc/signals.hpp>

#include <honzon/chain/protocol/protocol.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace honzon { namespace chain {

   using honzon::db::abstract_object;
   using honzon::db::object;
   class op_evaluator;
   class transaction_evaluation_state;

   namespace detail { struct applied_operations_restorer; }

   /**
    *  Result of evaluating the safety of a position. When @ref status is
    *  checks_failed, @ref error carries the exception that prevented the check.
    */
   struct cdp_status
   {
      enum status_type
      {
         safe,
         unsafe,
         checks_failed
      };

      status_type          status = safe;
      fc::exception_ptr    error;
   };

   /**
    *   @class database
    *   @brief tracks the state of the CDP system in an extensible manner
    *
    *   The database hosts the loans, CDP engine, CDP treasury, auction and
    *   auction manager modules. Their state lives in objects so that every
    *   mutation is covered by undo sessions, their logic is split by module
    *   into the db_*.cpp files.
    */
   class database : public db::object_database
   {
      public:
         //////////////////// db_management.cpp ////////////////////

         database();
         ~database();

         /**
          * @brief Initialize a fresh database from a genesis state
          *
          * The undo history is disabled while the genesis objects are created
          * and enabled afterwards, the genesis block is block 0 and the first
          * block generated is block 1.
          */
         void open( const genesis_state_type& genesis_state );
         void open( std::function<genesis_state_type()> genesis_loader );
         void close();

         //////////////////// db_block.cpp ////////////////////

         /**
          *  Applies every operation of @ref trx in order. If any of them throws the
          *  state is restored as if the transaction had never been pushed and the
          *  exception propagates.
          */
         processed_transaction push_transaction( const transaction& trx );

         /**
          *  Ends the current block and starts the next one: runs the end of block
          *  hooks, signals applied_block, advances the head block number and time
          *  by one block interval and runs the begin of block hooks.
          */
         void generate_block();
         void generate_blocks( uint32_t block_count );

         /**
          *  This method is used to track applied operations during the evaluation of a block, these
          *  operations include the dispatched operations and the virtual operations pushed
          *  by the modules while applying them.
          */
         uint32_t push_applied_operation( const operation& op );
         const vector<operation>& get_applied_operations()const { return _applied_ops; }
         void clear_applied_operations() { _applied_ops.clear(); }

         /**
          *  This signal is emitted after the end of block hooks of a block have run,
          *  with the number of the block that just ended.
          */
         fc::signal<void(block_number_type)>  applied_block;

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const chain_parameters&                get_chain_parameters()const;
         const cdp_engine_object&               get_cdp_engine()const;
         const cdp_treasury_object&             get_cdp_treasury()const;
         const auction_manager_object&          get_auction_manager()const;
         const shutdown_state_object&           get_shutdown_state()const;
         const issuance_buffer_object&          get_issuance_buffer()const;
         const total_positions_object&          get_total_positions()const;

         block_number_type head_block_num()const;
         time_point_sec    head_block_time()const;
         bool              is_shutdown()const;

         const account_object& get_account_by_name( const string& name )const;
         const asset_object&   get_asset_by_symbol( const string& symbol )const;

         //////////////////// db_balance.cpp ////////////////////

         /// balance provider used by every module, backed by account_balance_object by default
         fungible_assets&       assets() { return *_assets; }
         const fungible_assets& assets()const { return *_assets; }
         void                   set_fungible_assets( unique_ptr<fungible_assets> provider );

         /**
          * @brief Retrieve a particular account's free balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
         balance_type get_balance( account_id_type owner, asset_id_type asset_id )const;
         balance_type get_balance_on_hold( hold_reason reason, account_id_type owner, asset_id_type asset_id )const;

         /**
          * @brief Adjust a particular account's free balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param asset_id asset to adjust
          * @param delta signed amount to add, the result may not be negative
          */
         void adjust_balance( account_id_type account, asset_id_type asset_id, const amount_type& delta );
         void adjust_hold( hold_reason reason, account_id_type account, asset_id_type asset_id, const amount_type& delta );
         void adjust_supply( asset_id_type asset_id, const amount_type& delta );

         //////////////////// db_oracle.cpp ////////////////////

         price_provider&       prices() { return *_prices; }
         const price_provider& prices()const { return *_prices; }
         void                  set_price_provider( unique_ptr<price_provider> provider );

         void publish_price( asset_id_type asset_id, const price_type& price );
         /// price of one collateral unit in stable currency
         optional<price_type> get_collateral_price()const;

         //////////////////// db_loans.cpp ////////////////////

         const position_object* find_position( account_id_type owner )const;
         /// position of @ref owner, zero when it has none
         std::pair<balance_type, balance_type> get_position( account_id_type owner )const;

         /**
          *  Adjusts the position of @ref who, moving collateral between the owner and the
          *  loans account and issuing or burning stable currency for the debit change.
          *  Transactional.
          */
         void adjust_position( account_id_type who, const amount_type& collateral_adjustment,
                               const amount_type& debit_adjustment );
         /// moves collateral to the treasury and debit to the debit pool, transactional
         void confiscate_collateral_and_debit( account_id_type who, const balance_type& collateral_confiscate,
                                               const balance_type& debit_decrease );
         /// merges the position of @ref from into @ref to, transactional
         void transfer_loan( account_id_type from, account_id_type to );
         /**
          *  Repays @ref amount debit of @ref who and borrows it again at the current
          *  exchange rate. The position must carry at least @ref amount debit and
          *  must pass the required collateral ratio and the debit cap afterwards.
          *  Transactional.
          */
         void transfer_debit( account_id_type who, const balance_type& amount );


         //////////////////// db_cdp_engine.cpp ////////////////////

         /// params of the collateral, throws invalid_collateral_type when unset
         const risk_management_params& get_collateral_params()const;
         ratio_type           get_liquidation_ratio()const;
         optional<ratio_type> get_required_collateral_ratio()const;
         rate_type            get_liquidation_penalty()const;
         optional<rate_type>  get_interest_rate_per_sec()const;
         exchange_rate_type   get_debit_exchange_rate()const;

         balance_type get_debit_value( const balance_type& debit )const;
         /// debit worth @ref debit_value, rounded down, throws convert_debit_balance_failed
         balance_type convert_to_debit_balance( const balance_type& debit_value )const;
         ratio_type   calculate_collateral_ratio( const balance_type& collateral, const balance_type& debit,
                                                  const price_type& price )const;

         void       check_position_valid( const balance_type& collateral, const balance_type& debit,
                                          bool check_required_ratio )const;
         void       check_debit_cap( const balance_type& total_debit )const;
         cdp_status check_cdp_status( const balance_type& collateral, const balance_type& debit )const;
         cdp_status check_cdp_status( account_id_type who )const;

         /// @ref adjust_position with the debit change in stable currency, a repayment is capped at the debit
         void adjust_position_by_debit_value( account_id_type who, const amount_type& collateral_adjustment,
                                              const amount_type& debit_value_adjustment );

         void liquidate_unsafe_cdp( account_id_type who );
         void settle_cdp_has_debit( account_id_type who );

         void set_collateral_params( const optional<param_update>& interest_rate_per_sec,
                                     const optional<param_update>& liquidation_ratio,
                                     const optional<param_update>& liquidation_penalty,
                                     const optional<param_update>& required_collateral_ratio,
                                     const optional<balance_type>& maximum_total_debit_value );

         /// accrues interest for the seconds elapsed since the last block and samples the block time
         void cdp_engine_on_initialize();

         /**
          *  Keeper run at the end of every block. Visits at most keeper_max_iterations
          *  positions in owner order, starting at the cursor left by the previous block.
          *  Before shutdown unsafe positions are liquidated, after shutdown positions
          *  with debit are settled. A position that cannot be handled is skipped.
          */
         void cdp_engine_on_finalize();

         //////////////////// db_cdp_treasury.cpp ////////////////////

         balance_type get_surplus_pool()const;
         balance_type get_debit_pool()const;
         balance_type get_total_collaterals()const;
         /// collateral of the treasury that is not locked in a collateral auction
         balance_type get_total_collaterals_not_in_auction()const;
         ratio_type   get_debit_proportion( const balance_type& amount )const;

         void on_system_debit( const balance_type& amount );
         void on_system_surplus( const balance_type& amount );
         void issue_debit( account_id_type who, const balance_type& debit, bool backed );
         void burn_debit( account_id_type who, const balance_type& debit );
         void deposit_surplus( account_id_type from, const balance_type& amount );
         void withdraw_surplus( account_id_type to, const balance_type& amount );
         void deposit_collateral( account_id_type from, const balance_type& amount );
         void withdraw_collateral( account_id_type to, const balance_type& amount );

         /// bid revenue entering the surplus pool
         void pay_surplus( const balance_type& amount );
         /// bid revenue leaving the surplus pool when a bid is outbid or cancelled
         void refund_surplus( const balance_type& amount );

         void create_collateral_auctions( const balance_type& amount, const balance_type& target,
                                          account_id_type refund_recipient, bool split );

         void set_expected_collateral_auction_size( const balance_type& size );
         void set_debit_offset_buffer( const balance_type& amount );
         void extract_surplus_to_treasury( const balance_type& amount );

         /// burns surplus against the debit pool, leaving the debit offset buffer
         void offset_surplus_and_debit();

         //////////////////// db_issuance_buffer.cpp ////////////////////

         void fund_issuance_buffer( const balance_type& amount );
         /// burns surplus that no bid has pledged
         void defund_issuance_buffer( const balance_type& amount );
         void set_issuance_discount( const rate_type& discount );
         void set_issuance_quota( const balance_type& quota );

         /**
          *  Offers @ref collateral liquidated from @ref who, now held by the treasury, to
          *  the issuance buffer at the discounted collateral price. The buffer buys
          *  as much as its remaining quota allows while covering at most @ref target,
          *  and pays with stable currency issued into the surplus pool.
          *
          *  @return collateral bought and stable currency issued, both zero when the
          *  buffer takes nothing
          */
         std::pair<balance_type, balance_type> sell_collateral_to_issuance_buffer( account_id_type who,
                                                                                  const balance_type& collateral,
                                                                                  const balance_type& target );

         //////////////////// db_auction.cpp ////////////////////

         const auction_object* find_auction( auction_id_type id )const;
         const auction_object& get_auction( auction_id_type id )const;

         auction_id_type new_auction( block_number_type start, optional<block_number_type> end );
         void            place_auction_bid( account_id_type bidder, auction_id_type id, const balance_type& value );
         void            update_auction( auction_id_type id, const optional<auction_bid_type>& bid,
                                         block_number_type start, optional<block_number_type> end );
         void            remove_auction( auction_id_type id );

         /// removes every auction ending at @ref now and hands it to the handler
         void            sweep_ended_auctions( block_number_type now );

         const auction_handler& get_auction_handler()const { return _auction_handler; }
         void                   set_auction_handler( const auction_handler& handler ) { _auction_handler = handler; }

         //////////////////// db_auction_manager.cpp ////////////////////

         const collateral_auction_object* find_collateral_auction( auction_id_type id )const;
         const collateral_auction_object& get_collateral_auction( auction_id_type id )const;
         balance_type get_total_collateral_in_auction()const;
         balance_type get_total_target_in_auction()const;
         /// stable currency minted into the surplus pool for the current top bids
         balance_type get_surplus_pledged_to_bids()const;

         auction_id_type new_collateral_auction( account_id_type refund_recipient, const balance_type& amount,
                                                 const balance_type& target );
         void            cancel_collateral_auction( auction_id_type id );

         auction_bid_outcome collateral_auction_on_new_bid( block_number_type now, auction_id_type id,
                                                            const auction_bid_type& new_bid,
                                                            const optional<auction_bid_type>& last_bid );
         void                collateral_auction_on_ended( auction_id_type id, const optional<auction_bid_type>& winner );

         block_number_type   get_auction_time_to_close( block_number_type start, block_number_type now )const;

         //////////////////// db_emergency_shutdown.cpp ////////////////////

         void emergency_shutdown();
         void open_collateral_refund();
         void refund_collaterals( account_id_type who, const balance_type& amount );

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

      protected:
         //////////////////// db_block.cpp ////////////////////

         void on_initialize();
         void on_finalize();

      private:
         friend struct detail::applied_operations_restorer;

         void initialize_auction_handler();

         //////////////////// db_loans.cpp ////////////////////

         /// writes the position and the totals, the caller moves the funds
         void update_loan( account_id_type who, const amount_type& collateral_adjustment,
                           const amount_type& debit_adjustment );
         void inc_consumers( account_id_type who );
         void dec_consumers( account_id_type who );

         vector< unique_ptr<op_evaluator> > _operation_evaluators;
         vector<operation>                  _applied_ops;

         unique_ptr<fungible_assets>        _assets;
         unique_ptr<price_provider>         _prices;
         auction_handler                    _auction_handler;

         bool                               _opened = false;
   };

} }

FC_REFLECT_ENUM( honzon::chain::cdp_status::status_type, (safe)(unsafe)(checks_failed) )
