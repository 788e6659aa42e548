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
#include <honzon/chain/db_with.hpp>

#include <honzon/chain/cdp_object.hpp>
#include <honzon/chain/loan_object.hpp>

namespace honzon { namespace chain {

namespace {

   /// applies a tri-state update to an optional parameter
   struct param_update_visitor
   {
      typedef void result_type;

      optional<fixed_point>& target;

      explicit param_update_visitor( optional<fixed_point>& t ):target(t){}

      void operator()( const void_t& )const { target.reset(); }
      void operator()( const fixed_point& v )const { target = v; }
   };

   optional<fixed_point> updated_value( const param_update& update )
   {
      optional<fixed_point> result;
      update.visit( param_update_visitor( result ) );
      return result;
   }

   void validate_rate( const optional<fixed_point>& rate )
   {
      if( rate.valid() )
         HONZON_ASSERT( *rate <= rate_type::one(), invalid_rate, "rate ${r} exceeds 1", ("r",*rate) );
   }

}

const risk_management_params& database::get_collateral_params()const
{
   const auto& engine = get_cdp_engine();
   HONZON_ASSERT( engine.collateral_params.valid(), invalid_collateral_type,
                  "collateral params have not been set", ("asset",HONZON_NATIVE_ASSET) );
   return *engine.collateral_params;
}

ratio_type database::get_liquidation_ratio()const
{
   const auto& params = get_collateral_params();
   if( params.liquidation_ratio.valid() )
      return *params.liquidation_ratio;
   return get_chain_parameters().default_liquidation_ratio;
}

optional<ratio_type> database::get_required_collateral_ratio()const
{
   return get_collateral_params().required_collateral_ratio;
}

rate_type database::get_liquidation_penalty()const
{
   const auto& params = get_collateral_params();
   if( params.liquidation_penalty.valid() )
      return *params.liquidation_penalty;
   return get_chain_parameters().default_liquidation_penalty;
}

optional<rate_type> database::get_interest_rate_per_sec()const
{
   const auto& engine = get_cdp_engine();
   if( !engine.collateral_params.valid() )
      return optional<rate_type>();
   return engine.collateral_params->interest_rate_per_sec;
}

exchange_rate_type database::get_debit_exchange_rate()const
{
   return get_cdp_engine().debit_exchange_rate;
}

balance_type database::get_debit_value( const balance_type& debit )const
{
   return get_debit_exchange_rate().saturating_mul_int( debit );
}

balance_type database::convert_to_debit_balance( const balance_type& debit_value )const
{
   const exchange_rate_type rate = get_debit_exchange_rate();
   const auto reciprocal = rate.reciprocal();
   HONZON_ASSERT( reciprocal.valid(), convert_debit_balance_failed,
                  "exchange rate ${r} has no reciprocal", ("r",rate)("value",debit_value) );
   return reciprocal->saturating_mul_int( debit_value );
}

ratio_type database::calculate_collateral_ratio( const balance_type& collateral, const balance_type& debit,
                                                 const price_type& price )const
{
   const balance_type locked_collateral_value = price.saturating_mul_int( collateral );
   const balance_type debit_value = get_debit_value( debit );

   auto ratio = ratio_type::checked_from_rational( locked_collateral_value, debit_value );
   if( !ratio.valid() )
      return ratio_type::max_value();
   return *ratio;
}

void database::check_position_valid( const balance_type& collateral, const balance_type& debit,
                                     bool check_required_ratio )const
{
   if( debit == 0 )
   {
      if( collateral != 0 )
         HONZON_ASSERT( collateral >= get_chain_parameters().minimum_collateral_amount, collateral_amount_below_minimum,
                        "collateral ${c} below minimum ${m}",
                        ("c",collateral)("m",get_chain_parameters().minimum_collateral_amount) );
      return;
   }

   const auto feed_price = get_collateral_price();
   HONZON_ASSERT( feed_price.valid(), invalid_feed_price, "no price for ${a}", ("a",HONZON_NATIVE_ASSET) );

   const balance_type debit_value = get_debit_value( debit );
   const ratio_type collateral_ratio = calculate_collateral_ratio( collateral, debit, *feed_price );

   if( check_required_ratio )
   {
      const auto required_ratio = get_required_collateral_ratio();
      if( required_ratio.valid() )
         HONZON_ASSERT( collateral_ratio >= *required_ratio, below_required_collateral_ratio,
                        "collateral ratio ${r} is below ${req}", ("r",collateral_ratio)("req",*required_ratio) );
   }

   const ratio_type liquidation_ratio = get_liquidation_ratio();
   HONZON_ASSERT( collateral_ratio >= liquidation_ratio, below_liquidation_ratio,
                  "collateral ratio ${r} is below ${l}", ("r",collateral_ratio)("l",liquidation_ratio) );

   const balance_type& minimum_debit_value = get_chain_parameters().minimum_debit_value;
   HONZON_ASSERT( debit_value >= minimum_debit_value, remain_debit_value_too_small,
                  "debit value ${d} below minimum ${m}", ("d",debit_value)("m",minimum_debit_value) );
}

void database::check_debit_cap( const balance_type& total_debit )const
{
   const balance_type& hard_cap = get_collateral_params().maximum_total_debit_value;
   const balance_type total_debit_value = get_debit_value( total_debit );
   HONZON_ASSERT( total_debit_value <= hard_cap, exceed_debit_value_hard_cap,
                  "total debit value ${v} exceeds ${cap}", ("v",total_debit_value)("cap",hard_cap) );
}

cdp_status database::check_cdp_status( const balance_type& collateral, const balance_type& debit )const
{
   cdp_status result;
   if( debit == 0 )
      return result;

   if( !get_cdp_engine().collateral_params.valid() )
   {
      result.status = cdp_status::checks_failed;
      result.error = fc::exception_ptr( new invalid_collateral_type(
                        FC_LOG_MESSAGE( error, "collateral params have not been set", ("asset",HONZON_NATIVE_ASSET) ) ) );
      return result;
   }

   const auto feed_price = get_collateral_price();
   if( !feed_price.valid() )
   {
      result.status = cdp_status::checks_failed;
      result.error = fc::exception_ptr( new invalid_feed_price(
                        FC_LOG_MESSAGE( error, "no price for ${a}", ("a",HONZON_NATIVE_ASSET) ) ) );
      return result;
   }

   if( calculate_collateral_ratio( collateral, debit, *feed_price ) < get_liquidation_ratio() )
      result.status = cdp_status::unsafe;
   return result;
}

cdp_status database::check_cdp_status( account_id_type who )const
{
   const auto position = get_position( who );
   return check_cdp_status( position.first, position.second );
}

void database::adjust_position_by_debit_value( account_id_type who, const amount_type& collateral_adjustment,
                                                const amount_type& debit_value_adjustment )
{ try {
   HONZON_ASSERT( amount_in_range( debit_value_adjustment ), amount_convert_failed,
                  "adjustment out of the signed amount range", ("d",debit_value_adjustment) );

   const balance_type debit_abs = convert_to_debit_balance( amount_abs( debit_value_adjustment ) );
   if( debit_value_adjustment < 0 )
   {
      const balance_type repaid = std::min( debit_abs, get_position( who ).second );
      adjust_position( who, collateral_adjustment, -to_amount( repaid ) );
   }
   else
   {
      adjust_position( who, collateral_adjustment, to_amount( debit_abs ) );
   }
} FC_CAPTURE_AND_RETHROW( (who)(collateral_adjustment)(debit_value_adjustment) ) }

void database::liquidate_unsafe_cdp( account_id_type who )
{ try {
   HONZON_ASSERT( !is_shutdown(), already_shutdown, "liquidation is disabled after shutdown", ("who",who) );

   const auto position = get_position( who );
   const balance_type collateral = position.first;
   const balance_type debit = position.second;

   const cdp_status status = check_cdp_status( collateral, debit );
   HONZON_ASSERT( status.status == cdp_status::unsafe, must_be_unsafe,
                  "position of ${who} is not unsafe", ("who",who)("status",status.status) );

   with_transactional_scope( *this, [&]() {
      const balance_type bad_debt_value = get_debit_value( debit );
      const rate_type liquidation_penalty = get_liquidation_penalty();
      const balance_type target_stable_amount = liquidation_penalty.saturating_mul_acc_int( bad_debt_value );

      confiscate_collateral_and_debit( who, collateral, debit );

      try
      {
         with_transactional_scope( *this, [&]() {
            balance_type collateral_left = collateral;
            balance_type target_left = target_stable_amount;
            if( target_left != 0 )
            {
               const auto bought = sell_collateral_to_issuance_buffer( who, collateral, target_stable_amount );
               collateral_left -= bought.first;
               target_left -= bought.second;
            }

            if( target_left == 0 )
            {
               if( collateral_left != 0 )
                  withdraw_collateral( who, collateral_left );
            }
            else if( collateral_left != 0 )
            {
               create_collateral_auctions( collateral_left, target_left, who, true );
            }
         });
      }
      catch( const fc::exception& e )
      {
         // the confiscated collateral stays in the treasury for governance to auction
         elog( "failed to handle ${c} liquidated collateral of ${who}: ${e}",
               ("c",collateral)("who",who)("e",e.to_detail_string()) );
      }

      liquidate_unsafe_cdp_operation vop;
      vop.owner = who;
      vop.collateral_amount = collateral;
      vop.bad_debt_value = bad_debt_value;
      vop.target_amount = target_stable_amount;
      push_applied_operation( vop );

      ilog( "liquidated ${who}: collateral ${c}, bad debt ${d}, target ${t}",
            ("who",who)("c",collateral)("d",bad_debt_value)("t",target_stable_amount) );
   });
} FC_CAPTURE_AND_RETHROW( (who) ) }

void database::settle_cdp_has_debit( account_id_type who )
{ try {
   HONZON_ASSERT( is_shutdown(), must_after_shutdown, "settlement requires emergency shutdown", ("who",who) );

   const auto position = get_position( who );
   const balance_type collateral = position.first;
   const balance_type debit = position.second;
   HONZON_ASSERT( debit != 0, no_debit_value, "${who} has no debit", ("who",who) );

   const auto settle_price = prices().get_relative_price( HONZON_STABLE_ASSET, HONZON_NATIVE_ASSET );
   HONZON_ASSERT( settle_price.valid(), invalid_feed_price, "no price for ${a}", ("a",HONZON_NATIVE_ASSET) );

   const balance_type bad_debt_value = get_debit_value( debit );
   const balance_type confiscate_amount = std::min( settle_price->saturating_mul_int( bad_debt_value ), collateral );
   const balance_type refund_amount = collateral - confiscate_amount;

   with_transactional_scope( *this, [&]() {
      confiscate_collateral_and_debit( who, confiscate_amount, debit );

      if( refund_amount != 0 )
      {
         update_loan( who, -to_amount( refund_amount ), amount_type(0) );
         assets().transfer( HONZON_LOANS_ACCOUNT, who, HONZON_NATIVE_ASSET, refund_amount );
      }

      push_applied_operation( settle_cdp_in_debit_operation( who ) );
   });
} FC_CAPTURE_AND_RETHROW( (who) ) }

void database::set_collateral_params( const optional<param_update>& interest_rate_per_sec,
                                      const optional<param_update>& liquidation_ratio,
                                      const optional<param_update>& liquidation_penalty,
                                      const optional<param_update>& required_collateral_ratio,
                                      const optional<balance_type>& maximum_total_debit_value )
{ try {
   const auto& engine = get_cdp_engine();
   risk_management_params params;
   if( engine.collateral_params.valid() )
      params = *engine.collateral_params;

   vector<operation> events;

   if( interest_rate_per_sec.valid() )
   {
      params.interest_rate_per_sec = updated_value( *interest_rate_per_sec );
      validate_rate( params.interest_rate_per_sec );
      interest_rate_per_sec_updated_operation vop;
      vop.new_interest_rate_per_sec = params.interest_rate_per_sec;
      events.emplace_back( vop );
   }
   if( liquidation_ratio.valid() )
   {
      params.liquidation_ratio = updated_value( *liquidation_ratio );
      liquidation_ratio_updated_operation vop;
      vop.new_liquidation_ratio = params.liquidation_ratio;
      events.emplace_back( vop );
   }
   if( liquidation_penalty.valid() )
   {
      params.liquidation_penalty = updated_value( *liquidation_penalty );
      validate_rate( params.liquidation_penalty );
      liquidation_penalty_updated_operation vop;
      vop.new_liquidation_penalty = params.liquidation_penalty;
      events.emplace_back( vop );
   }
   if( required_collateral_ratio.valid() )
   {
      params.required_collateral_ratio = updated_value( *required_collateral_ratio );
      required_collateral_ratio_updated_operation vop;
      vop.new_required_collateral_ratio = params.required_collateral_ratio;
      events.emplace_back( vop );
   }
   if( maximum_total_debit_value.valid() )
   {
      params.maximum_total_debit_value = *maximum_total_debit_value;
      maximum_total_debit_value_updated_operation vop;
      vop.new_total_debit_value = params.maximum_total_debit_value;
      events.emplace_back( vop );
   }

   modify( engine, [&params]( cdp_engine_object& e ) {
      e.collateral_params = params;
   });
   for( const auto& vop : events )
      push_applied_operation( vop );
} FC_CAPTURE_AND_RETHROW( (interest_rate_per_sec)(liquidation_ratio)(liquidation_penalty)
                          (required_collateral_ratio)(maximum_total_debit_value) ) }

void database::cdp_engine_on_initialize()
{ try {
   const auto& engine = get_cdp_engine();
   const uint64_t now_secs = head_block_time().sec_since_epoch();
   const uint64_t interval_secs = now_secs > engine.last_accumulation_secs ? now_secs - engine.last_accumulation_secs : 0;

   const auto interest_rate = get_interest_rate_per_sec();
   const balance_type total_debits = get_total_positions().debit;

   if( !is_shutdown() && interest_rate.valid() && total_debits != 0 && interval_secs != 0 )
   {
      const rate_type rate_to_accumulate = interest_rate->saturating_add( rate_type::one() )
                                                        .saturating_pow( interval_secs )
                                                        .saturating_sub( rate_type::one() );
      if( !rate_to_accumulate.is_zero() )
      {
         const exchange_rate_type debit_exchange_rate = engine.debit_exchange_rate;
         const exchange_rate_type increment = debit_exchange_rate.saturating_mul( rate_to_accumulate );
         const balance_type issued = increment.saturating_mul_int( total_debits );
         try
         {
            with_transactional_scope( *this, [&]() {
               on_system_surplus( issued );
               const exchange_rate_type new_rate = debit_exchange_rate.saturating_add( increment );
               modify( engine, [&new_rate]( cdp_engine_object& e ) {
                  e.debit_exchange_rate = new_rate;
               });
            });
            dlog( "accrued ${i} interest over ${s} seconds", ("i",issued)("s",interval_secs) );
         }
         catch( const fc::exception& e )
         {
            wlog( "failed to issue ${i} interest: ${e}", ("i",issued)("e",e.to_detail_string()) );
         }
      }
   }

   modify( engine, [now_secs]( cdp_engine_object& e ) {
      e.last_accumulation_secs = now_secs;
   });
} FC_CAPTURE_AND_RETHROW() }

void database::cdp_engine_on_finalize()
{ try {
   const uint32_t max_iterations = get_chain_parameters().keeper_max_iterations;
   if( max_iterations == 0 )
      return;

   const auto& engine = get_cdp_engine();
   const auto& idx = get_index_type<position_index>().indices().get<by_owner>();
   auto itr = engine.keeper_cursor.valid() ? idx.lower_bound( *engine.keeper_cursor ) : idx.begin();

   // handling a position may remove it, collect the owners first
   vector<account_id_type> owners;
   while( itr != idx.end() && owners.size() < max_iterations )
   {
      owners.push_back( itr->owner );
      ++itr;
   }
   optional<account_id_type> next_cursor;
   if( itr != idx.end() )
      next_cursor = itr->owner;

   const bool shutdown = is_shutdown();
   uint32_t handled = 0;
   for( const account_id_type& who : owners )
   {
      const auto position = get_position( who );
      try
      {
         if( !shutdown && check_cdp_status( position.first, position.second ).status == cdp_status::unsafe )
         {
            liquidate_unsafe_cdp( who );
            ++handled;
         }
         else if( shutdown && position.second != 0 )
         {
            settle_cdp_has_debit( who );
            ++handled;
         }
      }
      catch( const fc::exception& e )
      {
         wlog( "keeper skipped the position of ${who}: ${e}", ("who",who)("e",e.to_detail_string()) );
      }
   }

   modify( engine, [&next_cursor]( cdp_engine_object& e ) {
      e.keeper_cursor = next_cursor;
   });
   if( handled != 0 )
      dlog( "keeper handled ${h} of ${n} positions", ("h",handled)("n",owners.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
