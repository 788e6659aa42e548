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

namespace honzon { namespace chain {

balance_type database::get_surplus_pool()const
{
   return assets().balance( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET );
}

balance_type database::get_debit_pool()const
{
   return get_cdp_treasury().debit_pool;
}

balance_type database::get_total_collaterals()const
{
   return assets().balance( HONZON_CDP_TREASURY_ACCOUNT, HONZON_NATIVE_ASSET );
}

balance_type database::get_total_collaterals_not_in_auction()const
{
   return saturating_sub( get_total_collaterals(), get_total_collateral_in_auction() );
}

ratio_type database::get_debit_proportion( const balance_type& amount )const
{
   const balance_type issuance = assets().total_issuance( HONZON_STABLE_ASSET );
   auto proportion = ratio_type::checked_from_rational( amount, issuance );
   if( !proportion.valid() )
      return ratio_type::max_value();
   return *proportion;
}

void database::on_system_debit( const balance_type& amount )
{ try {
   const auto& treasury = get_cdp_treasury();
   HONZON_ASSERT( max_balance() - treasury.debit_pool >= amount, debit_pool_overflow,
                  "debit pool ${p} cannot absorb ${a}", ("p",treasury.debit_pool)("a",amount) );
   const balance_type new_pool = treasury.debit_pool + amount;
   modify( treasury, [&new_pool]( cdp_treasury_object& t ) {
      t.debit_pool = new_pool;
   });
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::on_system_surplus( const balance_type& amount )
{ try {
   assets().mint( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::issue_debit( account_id_type who, const balance_type& debit, bool backed )
{ try {
   with_transactional_scope( *this, [&]() {
      // unbacked debit is owed by the system
      if( !backed )
         on_system_debit( debit );
      assets().mint( who, HONZON_STABLE_ASSET, debit );
   });
} FC_CAPTURE_AND_RETHROW( (who)(debit)(backed) ) }

void database::burn_debit( account_id_type who, const balance_type& debit )
{ try {
   assets().burn( who, HONZON_STABLE_ASSET, debit );
} FC_CAPTURE_AND_RETHROW( (who)(debit) ) }

void database::deposit_surplus( account_id_type from, const balance_type& amount )
{ try {
   assets().transfer( from, HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (from)(amount) ) }

void database::withdraw_surplus( account_id_type to, const balance_type& amount )
{ try {
   assets().transfer( HONZON_CDP_TREASURY_ACCOUNT, to, HONZON_STABLE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database::deposit_collateral( account_id_type from, const balance_type& amount )
{ try {
   assets().transfer( from, HONZON_CDP_TREASURY_ACCOUNT, HONZON_NATIVE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (from)(amount) ) }

void database::withdraw_collateral( account_id_type to, const balance_type& amount )
{ try {
   const balance_type available = get_total_collaterals_not_in_auction();
   HONZON_ASSERT( available >= amount, collateral_not_enough,
                  "only ${c} collateral is not in auction, ${a} requested", ("c",available)("a",amount) );
   assets().transfer( HONZON_CDP_TREASURY_ACCOUNT, to, HONZON_NATIVE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database::pay_surplus( const balance_type& amount )
{ try {
   on_system_surplus( amount );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::refund_surplus( const balance_type& amount )
{ try {
   const balance_type surplus = get_surplus_pool();
   HONZON_ASSERT( surplus >= amount, surplus_pool_not_enough,
                  "surplus pool ${s} cannot refund ${a}", ("s",surplus)("a",amount) );
   assets().burn( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::create_collateral_auctions( const balance_type& amount, const balance_type& target,
                                           account_id_type refund_recipient, bool split )
{ try {
   HONZON_ASSERT( !is_shutdown(), already_shutdown, "no new collateral auctions after shutdown", ("amount",amount) );

   const balance_type available = get_total_collaterals_not_in_auction();
   HONZON_ASSERT( amount <= available, collateral_not_enough,
                  "only ${c} collateral is not in auction, ${a} requested", ("c",available)("a",amount) );

   const balance_type lot_size = get_cdp_treasury().expected_collateral_auction_size;
   const balance_type max_auctions_count = get_chain_parameters().max_auctions_count;

   balance_type lots_count = 1;
   if( split && lot_size != 0 && max_auctions_count != 0 && amount > lot_size )
   {
      lots_count = amount / lot_size;
      if( amount % lot_size != 0 )
         lots_count += 1;
      lots_count = std::min( lots_count, max_auctions_count );
   }

   with_transactional_scope( *this, [&]() {
      balance_type unhandled_amount = amount;
      balance_type unhandled_target = target;
      for( balance_type i = 0; i < lots_count; ++i )
      {
         balance_type lot_amount = unhandled_amount;
         balance_type lot_target = unhandled_target;
         if( i + 1 < lots_count )
         {
            lot_amount = lot_size;
            fixed_point::wide_type share = fixed_point::wide_type( target ) * fixed_point::wide_type( lot_amount )
                                           / fixed_point::wide_type( amount );
            lot_target = balance_type( share );
         }

         new_collateral_auction( refund_recipient, lot_amount, lot_target );

         unhandled_amount -= lot_amount;
         unhandled_target -= lot_target;
      }
   });

   ilog( "created ${n} collateral auctions for ${a} collateral, target ${t}",
         ("n",lots_count)("a",amount)("t",target) );
} FC_CAPTURE_AND_RETHROW( (amount)(target)(refund_recipient)(split) ) }

void database::set_expected_collateral_auction_size( const balance_type& size )
{ try {
   modify( get_cdp_treasury(), [&size]( cdp_treasury_object& t ) {
      t.expected_collateral_auction_size = size;
   });
   push_applied_operation( expected_collateral_auction_size_updated_operation( size ) );
} FC_CAPTURE_AND_RETHROW( (size) ) }

void database::set_debit_offset_buffer( const balance_type& amount )
{ try {
   modify( get_cdp_treasury(), [&amount]( cdp_treasury_object& t ) {
      t.debit_offset_buffer = amount;
   });
   push_applied_operation( debit_offset_buffer_updated_operation( amount ) );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::extract_surplus_to_treasury( const balance_type& amount )
{ try {
   // surplus backing a top bid must stay until the bid is refunded or settled
   const balance_type surplus = saturating_sub( get_surplus_pool(), get_surplus_pledged_to_bids() );
   HONZON_ASSERT( surplus >= amount, surplus_pool_not_enough,
                  "surplus pool ${s} cannot pay ${a}", ("s",surplus)("a",amount) );
   assets().transfer( HONZON_CDP_TREASURY_ACCOUNT, HONZON_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, amount );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::offset_surplus_and_debit()
{ try {
   const auto& treasury = get_cdp_treasury();
   const balance_type free_surplus = saturating_sub( get_surplus_pool(), get_surplus_pledged_to_bids() );
   const balance_type offset_amount = std::min( free_surplus,
                                                saturating_sub( treasury.debit_pool, treasury.debit_offset_buffer ) );
   if( offset_amount == 0 )
      return;

   const balance_type new_pool = treasury.debit_pool - offset_amount;
   with_transactional_scope( *this, [&]() {
      assets().burn( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, offset_amount );
      modify( treasury, [&new_pool]( cdp_treasury_object& t ) {
         t.debit_pool = new_pool;
      });
   });
   dlog( "offset ${m} surplus against debit", ("m",offset_amount) );
} FC_CAPTURE_AND_RETHROW() }

} }
