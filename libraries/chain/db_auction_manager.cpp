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

#include <honzon/chain/auction_object.hpp>

namespace honzon { namespace chain {

const collateral_auction_object* database::find_collateral_auction( auction_id_type id )const
{
   const auto& idx = get_index_type<collateral_auction_index>().indices().get<by_auction_id>();
   auto itr = idx.find( id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const collateral_auction_object& database::get_collateral_auction( auction_id_type id )const
{
   const collateral_auction_object* item = find_collateral_auction( id );
   HONZON_ASSERT( item != nullptr, collateral_auction_not_exist, "collateral auction ${id} does not exist", ("id",id) );
   return *item;
}

balance_type database::get_total_collateral_in_auction()const
{
   return get_auction_manager().total_collateral_in_auction;
}

balance_type database::get_total_target_in_auction()const
{
   return get_auction_manager().total_target_in_auction;
}

balance_type database::get_surplus_pledged_to_bids()const
{
   balance_type pledged;
   for( const collateral_auction_object& item : get_index_type<collateral_auction_index>().indices() )
   {
      const auction_object* auction = find_auction( item.auction_id );
      if( auction == nullptr || !auction->bid.valid() )
         continue;
      pledged = saturating_add( pledged, item.payment_amount( auction->bid->second ) );
   }
   return pledged;
}

block_number_type database::get_auction_time_to_close( block_number_type start, block_number_type now )const
{
   const auto& params = get_chain_parameters();
   if( uint64_t( now ) < uint64_t( start ) + params.auction_duration_soft_cap )
      return params.auction_time_to_close;
   // past the soft cap every bid extends the auction by half as much
   return params.auction_time_to_close / 2;
}

auction_id_type database::new_collateral_auction( account_id_type refund_recipient, const balance_type& amount,
                                                  const balance_type& target )
{ try {
   HONZON_ASSERT( amount != 0, invalid_auction_amount, "collateral auction of nothing", ("amount",amount) );

   const auto& manager = get_auction_manager();
   HONZON_ASSERT( max_balance() - manager.total_collateral_in_auction >= amount, invalid_auction_amount,
                  "collateral in auction would overflow", ("amount",amount) );
   HONZON_ASSERT( max_balance() - manager.total_target_in_auction >= target, invalid_auction_amount,
                  "target in auction would overflow", ("target",target) );
   const balance_type new_total_collateral = manager.total_collateral_in_auction + amount;
   const balance_type new_total_target = manager.total_target_in_auction + target;

   auction_id_type id = 0;
   with_transactional_scope( *this, [&]() {
      const block_number_type start = head_block_num();
      id = new_auction( start, optional<block_number_type>() );

      create<collateral_auction_object>( [&]( collateral_auction_object& c ) {
         c.auction_id = id;
         c.refund_recipient = refund_recipient;
         c.initial_amount = amount;
         c.amount = amount;
         c.target = target;
         c.start_time = start;
      });
      modify( manager, [&]( auction_manager_object& m ) {
         m.total_collateral_in_auction = new_total_collateral;
         m.total_target_in_auction = new_total_target;
      });

      new_collateral_auction_operation vop;
      vop.auction_id = id;
      vop.collateral_amount = amount;
      vop.target_bid_price = target;
      push_applied_operation( vop );
   });

   ilog( "new collateral auction ${id}: ${a} collateral, target ${t}", ("id",id)("a",amount)("t",target) );
   return id;
} FC_CAPTURE_AND_RETHROW( (refund_recipient)(amount)(target) ) }

auction_bid_outcome database::collateral_auction_on_new_bid( block_number_type now, auction_id_type id,
                                                             const auction_bid_type& new_bid,
                                                             const optional<auction_bid_type>& last_bid )
{ try {
   auction_bid_outcome reject;

   const collateral_auction_object* item = find_collateral_auction( id );
   if( item == nullptr )
   {
      wlog( "bid on unknown collateral auction ${id}", ("id",id) );
      return reject;
   }

   const account_id_type& bidder = new_bid.first;
   const price_type new_price = item->price_per_unit( new_bid.second );

   optional<price_type> last_price;
   if( last_bid.valid() )
      last_price = item->price_per_unit( last_bid->second );

   if( !item->always_forward() )
   {
      price_type minimum_price;
      if( last_price.valid() )
      {
         if( item->in_reverse_stage( *last_price ) )
            minimum_price = *last_price;
         else
            minimum_price = last_price->saturating_add(
                               last_price->saturating_mul( get_chain_parameters().minimum_increment_size ) );
      }
      else
      {
         minimum_price = item->target_price().saturating_mul( price_type::from_rational( 1, 2 ) );
      }

      if( new_price < minimum_price )
      {
         wlog( "bid ${b} on auction ${id} is below ${m} per unit",
               ("b",new_bid.second)("id",id)("m",minimum_price) );
         return reject;
      }
   }

   // the last payment depends on the amount before this bid shrinks it
   balance_type last_payment;
   if( last_price.valid() )
      last_payment = item->payment_amount( last_bid->second );

   const balance_type payment = item->payment_amount( new_bid.second );
   const bool shrink = item->in_reverse_stage( new_price );
   balance_type new_amount = item->amount;
   if( shrink )
      new_amount = price_type::from_rational( item->target, new_bid.second ).saturating_mul_int( item->initial_amount );

   try
   {
      with_transactional_scope( *this, [&]() {
         assets().hold( collateral_auction_hold, bidder, HONZON_STABLE_ASSET, payment );
         pay_surplus( payment );
      });
   }
   catch( const fc::exception& e )
   {
      wlog( "${b} cannot pay ${p} for auction ${id}: ${e}",
            ("b",bidder)("p",payment)("id",id)("e",e.to_string()) );
      return reject;
   }

   if( shrink && new_amount != item->amount )
      modify( *item, [&new_amount]( collateral_auction_object& c ) {
         c.amount = new_amount;
      });

   if( last_bid.valid() )
   {
      assets().release( collateral_auction_hold, last_bid->first, HONZON_STABLE_ASSET, last_payment,
                        best_effort_precision );
      refund_surplus( last_payment );
   }

   auction_bid_outcome outcome;
   outcome.accept_bid = true;
   outcome.change_end = true;
   outcome.new_end = now + get_auction_time_to_close( item->start_time, now );
   return outcome;
} FC_CAPTURE_AND_RETHROW( (now)(id)(new_bid)(last_bid) ) }

void database::collateral_auction_on_ended( auction_id_type id, const optional<auction_bid_type>& winner )
{ try {
   const collateral_auction_object* found = find_collateral_auction( id );
   if( found == nullptr )
   {
      wlog( "ended auction ${id} has no collateral auction", ("id",id) );
      return;
   }
   const collateral_auction_object item = *found;

   const auto& manager = get_auction_manager();
   const balance_type new_total_collateral = checked_sub( manager.total_collateral_in_auction, item.initial_amount );
   const balance_type new_total_target = checked_sub( manager.total_target_in_auction, item.target );
   modify( manager, [&]( auction_manager_object& m ) {
      m.total_collateral_in_auction = new_total_collateral;
      m.total_target_in_auction = new_total_target;
   });
   remove( *found );

   try
   {
      with_transactional_scope( *this, [&]() {
         if( winner.valid() )
         {
            const account_id_type& bidder = winner->first;
            const balance_type payment = item.payment_amount( winner->second );

            // the payment already entered the surplus pool when the bid was placed
            const balance_type released = assets().release( collateral_auction_hold, bidder, HONZON_STABLE_ASSET,
                                                            payment, best_effort_precision );
            assets().burn( bidder, HONZON_STABLE_ASSET, released );

            withdraw_collateral( bidder, item.amount );
            if( item.initial_amount > item.amount )
               withdraw_collateral( item.refund_recipient, item.initial_amount - item.amount );

            collateral_auction_dealt_operation vop;
            vop.auction_id = id;
            vop.collateral_amount = item.amount;
            vop.winner = bidder;
            vop.payment_amount = payment;
            push_applied_operation( vop );

            ilog( "collateral auction ${id} dealt to ${w}: ${a} collateral for ${p}",
                  ("id",id)("w",bidder)("a",item.amount)("p",payment) );
         }
         else
         {
            withdraw_collateral( item.refund_recipient, item.initial_amount );

            collateral_auction_aborted_operation vop;
            vop.auction_id = id;
            vop.collateral_amount = item.initial_amount;
            vop.target_stable_amount = item.target;
            vop.refund_recipient = item.refund_recipient;
            push_applied_operation( vop );

            ilog( "collateral auction ${id} aborted, ${a} collateral returned to ${r}",
                  ("id",id)("a",item.initial_amount)("r",item.refund_recipient) );
         }
      });
   }
   catch( const fc::exception& e )
   {
      elog( "failed to pay out collateral auction ${id}: ${e}", ("id",id)("e",e.to_detail_string()) );
   }
} FC_CAPTURE_AND_RETHROW( (id)(winner) ) }

void database::cancel_collateral_auction( auction_id_type id )
{ try {
   HONZON_ASSERT( is_shutdown(), must_after_shutdown, "auctions can only be cancelled after shutdown", ("id",id) );

   const collateral_auction_object& item = get_collateral_auction( id );
   const auction_object* auction = find_auction( id );

   optional<auction_bid_type> bid;
   balance_type payment;
   if( auction != nullptr && auction->bid.valid() )
   {
      bid = auction->bid;
      const price_type price = item.price_per_unit( bid->second );
      HONZON_ASSERT( !item.in_reverse_stage( price ), in_reverse_stage,
                     "auction ${id} is in reverse stage", ("id",id)("price",price) );
      payment = item.payment_amount( bid->second );
   }

   const account_id_type refund_recipient = item.refund_recipient;
   const balance_type initial_amount = item.initial_amount;
   const auto& manager = get_auction_manager();
   const balance_type new_total_collateral = checked_sub( manager.total_collateral_in_auction, item.initial_amount );
   const balance_type new_total_target = checked_sub( manager.total_target_in_auction, item.target );

   with_transactional_scope( *this, [&]() {
      if( bid.valid() )
      {
         refund_surplus( payment );
         assets().release( collateral_auction_hold, bid->first, HONZON_STABLE_ASSET, payment, exact_precision );
      }

      modify( manager, [&]( auction_manager_object& m ) {
         m.total_collateral_in_auction = new_total_collateral;
         m.total_target_in_auction = new_total_target;
      });
      remove( item );
      if( auction != nullptr )
         remove( *auction );

      withdraw_collateral( refund_recipient, initial_amount );

      push_applied_operation( cancel_auction_operation( id ) );
   });

   ilog( "cancelled collateral auction ${id}", ("id",id) );
} FC_CAPTURE_AND_RETHROW( (id) ) }

} }
