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

void database::fund_issuance_buffer( const balance_type& amount )
{ try {
   pay_surplus( amount );
   push_applied_operation( issuance_buffer_funded_operation( amount ) );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::defund_issuance_buffer( const balance_type& amount )
{ try {
   const balance_type free_surplus = saturating_sub( get_surplus_pool(), get_surplus_pledged_to_bids() );
   HONZON_ASSERT( free_surplus >= amount, surplus_pool_not_enough,
                  "only ${s} surplus is not pledged, ${a} requested", ("s",free_surplus)("a",amount) );
   refund_surplus( amount );
   push_applied_operation( issuance_buffer_defunded_operation( amount ) );
} FC_CAPTURE_AND_RETHROW( (amount) ) }

void database::set_issuance_discount( const rate_type& discount )
{ try {
   HONZON_ASSERT( discount <= rate_type::one(), invalid_rate, "discount ${d} exceeds 1", ("d",discount) );
   modify( get_issuance_buffer(), [&discount]( issuance_buffer_object& b ) {
      b.discount = discount;
   });
   push_applied_operation( issuance_discount_updated_operation( discount ) );
} FC_CAPTURE_AND_RETHROW( (discount) ) }

void database::set_issuance_quota( const balance_type& quota )
{ try {
   modify( get_issuance_buffer(), [&quota]( issuance_buffer_object& b ) {
      b.issuance_quota = quota;
   });
   push_applied_operation( issuance_quota_updated_operation( quota ) );
} FC_CAPTURE_AND_RETHROW( (quota) ) }

std::pair<balance_type, balance_type> database::sell_collateral_to_issuance_buffer( account_id_type who,
                                                                                   const balance_type& collateral,
                                                                                   const balance_type& target )
{ try {
   const auto nothing = std::make_pair( balance_type(0), balance_type(0) );

   const issuance_buffer_object& buffer = get_issuance_buffer();
   const balance_type remaining_quota = buffer.remaining_quota();
   if( remaining_quota == 0 || collateral == 0 || target == 0 )
      return nothing;

   const auto feed_price = get_collateral_price();
   HONZON_ASSERT( feed_price.valid(), invalid_feed_price, "no price for ${a}", ("a",HONZON_NATIVE_ASSET) );
   const price_type discounted_price = feed_price->saturating_mul( buffer.discount );
   const auto reciprocal = discounted_price.reciprocal();
   if( !reciprocal.valid() )
      return nothing;

   // the quota caps the collateral bought, the target caps what is paid for it
   const balance_type affordable = std::min( collateral, reciprocal->saturating_mul_int( remaining_quota ) );
   const balance_type covered = std::min( target, discounted_price.saturating_mul_int( affordable ) );
   const balance_type bought = std::min( collateral, reciprocal->saturating_mul_int( covered ) );
   if( bought == 0 || covered == 0 )
      return nothing;

   const balance_type new_used = checked_add( buffer.issuance_used, covered );
   with_transactional_scope( *this, [&]() {
      withdraw_collateral( HONZON_ISSUANCE_BUFFER_ACCOUNT, bought );
      pay_surplus( covered );
      modify( buffer, [&new_used]( issuance_buffer_object& b ) {
         b.issuance_used = new_used;
      });

      collateral_bought_by_issuance_buffer_operation vop;
      vop.owner = who;
      vop.collateral_amount = bought;
      vop.debit_value = covered;
      push_applied_operation( vop );
   });

   ilog( "issuance buffer bought ${c} collateral of ${who} for ${v}", ("c",bought)("who",who)("v",covered) );
   return std::make_pair( bought, covered );
} FC_CAPTURE_AND_RETHROW( (who)(collateral)(target) ) }

} }
