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

#include <honzon/chain/account_object.hpp>
#include <honzon/chain/loan_object.hpp>

namespace honzon { namespace chain {

const position_object* database::find_position( account_id_type owner )const
{
   const auto& idx = get_index_type<position_index>().indices().get<by_owner>();
   auto itr = idx.find( owner );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

std::pair<balance_type, balance_type> database::get_position( account_id_type owner )const
{
   const position_object* position = find_position( owner );
   if( position == nullptr )
      return std::make_pair( balance_type(0), balance_type(0) );
   return std::make_pair( position->collateral, position->debit );
}

void database::adjust_position( account_id_type who, const amount_type& collateral_adjustment,
                                const amount_type& debit_adjustment )
{ try {
   HONZON_ASSERT( amount_in_range( collateral_adjustment ) && amount_in_range( debit_adjustment ),
                  amount_convert_failed, "adjustment out of the signed amount range",
                  ("c",collateral_adjustment)("d",debit_adjustment) );

   with_transactional_scope( *this, [&]() {
      update_loan( who, collateral_adjustment, debit_adjustment );

      const balance_type collateral_delta = amount_abs( collateral_adjustment );
      if( collateral_adjustment > 0 )
         assets().transfer( who, HONZON_LOANS_ACCOUNT, HONZON_NATIVE_ASSET, collateral_delta );
      else if( collateral_adjustment < 0 )
         assets().transfer( HONZON_LOANS_ACCOUNT, who, HONZON_NATIVE_ASSET, collateral_delta );

      const balance_type debit_delta = amount_abs( debit_adjustment );
      if( debit_adjustment > 0 )
      {
         check_debit_cap( get_total_positions().debit );
         issue_debit( who, get_debit_value( debit_delta ), true );
      }
      else if( debit_adjustment < 0 )
      {
         burn_debit( who, get_debit_value( debit_delta ) );
      }

      const auto position = get_position( who );
      check_position_valid( position.first, position.second,
                            collateral_adjustment < 0 || debit_adjustment > 0 );

      push_applied_operation( position_updated_operation( who, collateral_adjustment, debit_adjustment ) );
   });
} FC_CAPTURE_AND_RETHROW( (who)(collateral_adjustment)(debit_adjustment) ) }

void database::confiscate_collateral_and_debit( account_id_type who, const balance_type& collateral_confiscate,
                                                const balance_type& debit_decrease )
{ try {
   const amount_type collateral_adjustment = to_amount( collateral_confiscate );
   const amount_type debit_adjustment = to_amount( debit_decrease );

   with_transactional_scope( *this, [&]() {
      update_loan( who, -collateral_adjustment, -debit_adjustment );
      deposit_collateral( HONZON_LOANS_ACCOUNT, collateral_confiscate );
      on_system_debit( get_debit_value( debit_decrease ) );

      push_applied_operation( confiscate_collateral_and_debit_operation( who, collateral_confiscate, debit_decrease ) );
   });
} FC_CAPTURE_AND_RETHROW( (who)(collateral_confiscate)(debit_decrease) ) }

void database::transfer_loan( account_id_type from, account_id_type to )
{ try {
   FC_ASSERT( from != to, "cannot transfer a loan to its owner" );

   with_transactional_scope( *this, [&]() {
      const auto loan = get_position( from );
      const amount_type collateral = to_amount( loan.first );
      const amount_type debit = to_amount( loan.second );

      update_loan( from, -collateral, -debit );
      update_loan( to, collateral, debit );

      const auto merged = get_position( to );
      check_position_valid( merged.first, merged.second, true );

      push_applied_operation( transfer_loan_operation( from, to ) );
   });
} FC_CAPTURE_AND_RETHROW( (from)(to) ) }

void database::transfer_debit( account_id_type who, const balance_type& amount )
{ try {
   const amount_type debit = to_amount( amount );

   with_transactional_scope( *this, [&]() {
      // the repayment is funded with freshly issued stable currency, burned again at the end
      const balance_type value = get_debit_value( amount );
      issue_debit( who, value, true );
      adjust_position( who, amount_type(0), -debit );
      adjust_position( who, amount_type(0), debit );
      burn_debit( who, value );

      push_applied_operation( debit_transferred_operation( who, amount ) );
   });
} FC_CAPTURE_AND_RETHROW( (who)(amount) ) }

void database::update_loan( account_id_type who, const amount_type& collateral_adjustment,
                            const amount_type& debit_adjustment )
{
   const position_object* position = find_position( who );
   const auto old_position = get_position( who );
   const auto& totals = get_total_positions();

   // every checked step runs before the first write
   const balance_type new_collateral = apply_delta( old_position.first, collateral_adjustment );
   const balance_type new_debit = apply_delta( old_position.second, debit_adjustment );
   const balance_type new_total_collateral = apply_delta( totals.collateral, collateral_adjustment );
   const balance_type new_total_debit = apply_delta( totals.debit, debit_adjustment );
   const bool now_empty = new_collateral == 0 && new_debit == 0;

   if( position == nullptr )
   {
      if( !now_empty )
      {
         inc_consumers( who );
         create<position_object>( [&]( position_object& p ) {
            p.owner = who;
            p.collateral = new_collateral;
            p.debit = new_debit;
         });
      }
   }
   else if( now_empty )
   {
      remove( *position );
      dec_consumers( who );
   }
   else
   {
      modify( *position, [&]( position_object& p ) {
         p.collateral = new_collateral;
         p.debit = new_debit;
      });
   }

   modify( totals, [&]( total_positions_object& t ) {
      t.collateral = new_total_collateral;
      t.debit = new_total_debit;
   });
}

void database::inc_consumers( account_id_type who )
{
   const account_object& account = get( who );
   modify( account, []( account_object& a ) {
      ++a.consumers;
   });
}

void database::dec_consumers( account_id_type who )
{
   const account_object& account = get( who );
   FC_ASSERT( account.consumers > 0, "account ${a} has no consumers", ("a",who) );
   modify( account, []( account_object& a ) {
      --a.consumers;
   });
}

} }
