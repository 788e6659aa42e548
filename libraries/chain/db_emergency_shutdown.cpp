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

void database::emergency_shutdown()
{ try {
   const auto& state = get_shutdown_state();
   HONZON_ASSERT( !state.is_shutdown, already_shutdown, "shutdown already happened", ("block",head_block_num()) );

   with_transactional_scope( *this, [&]() {
      modify( state, []( shutdown_state_object& s ) {
         s.is_shutdown = true;
      });
      // settlement and refunds value collateral at the price of the shutdown block
      prices().lock_price( HONZON_NATIVE_ASSET );

      push_applied_operation( shutdown_operation( head_block_num() ) );
   });

   wlog( "emergency shutdown at block ${n}", ("n",head_block_num()) );
} FC_CAPTURE_AND_RETHROW() }

void database::open_collateral_refund()
{ try {
   const auto& state = get_shutdown_state();
   HONZON_ASSERT( state.is_shutdown, must_after_shutdown, "refunds open only after shutdown", ("block",head_block_num()) );
   HONZON_ASSERT( get_total_collateral_in_auction() == 0, exist_potential_surplus,
                  "${c} collateral is still in auction", ("c",get_total_collateral_in_auction()) );
   HONZON_ASSERT( get_total_positions().debit == 0, exist_unhandled_debit,
                  "${d} debit is not settled", ("d",get_total_positions().debit) );

   modify( state, []( shutdown_state_object& s ) {
      s.can_refund = true;
   });
   push_applied_operation( open_refund_operation( head_block_num() ) );

   ilog( "collateral refund open at block ${n}", ("n",head_block_num()) );
} FC_CAPTURE_AND_RETHROW() }

void database::refund_collaterals( account_id_type who, const balance_type& amount )
{ try {
   HONZON_ASSERT( get_shutdown_state().can_refund, can_not_refund, "collateral refund is not open", ("who",who) );

   // the proportion is taken against the issuance before the burn
   const ratio_type proportion = get_debit_proportion( amount );
   const balance_type refund_amount = proportion.saturating_mul_int( get_total_collaterals() );

   with_transactional_scope( *this, [&]() {
      burn_debit( who, amount );
      withdraw_collateral( who, refund_amount );

      refund_operation vop;
      vop.who = who;
      vop.stable_amount = amount;
      vop.refund_amount = refund_amount;
      push_applied_operation( vop );
   });
} FC_CAPTURE_AND_RETHROW( (who)(amount) ) }

} }
