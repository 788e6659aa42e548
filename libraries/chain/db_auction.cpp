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
#include <honzon/chain/global_property_object.hpp>

namespace honzon { namespace chain {

const auction_object* database::find_auction( auction_id_type id )const
{
   const auto& idx = get_index_type<auction_index>().indices().get<by_auction_id>();
   auto itr = idx.find( id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const auction_object& database::get_auction( auction_id_type id )const
{
   const auction_object* auction = find_auction( id );
   HONZON_ASSERT( auction != nullptr, auction_not_exist, "auction ${id} does not exist", ("id",id) );
   return *auction;
}

auction_id_type database::new_auction( block_number_type start, optional<block_number_type> end )
{ try {
   const auto& gpo = get_global_properties();
   const auction_id_type id = gpo.next_auction_id;
   HONZON_ASSERT( id != HONZON_MAX_AUCTION_ID, no_available_auction_id, "auction id space exhausted", ("id",id) );

   modify( gpo, []( global_property_object& p ) {
      ++p.next_auction_id;
   });
   create<auction_object>( [&]( auction_object& a ) {
      a.auction_id = id;
      a.start = start;
      a.end = end;
   });
   return id;
} FC_CAPTURE_AND_RETHROW( (start)(end) ) }

void database::place_auction_bid( account_id_type bidder, auction_id_type id, const balance_type& value )
{ try {
   const block_number_type now = head_block_num();

   with_transactional_scope( *this, [&]() {
      const auction_object& auction = get_auction( id );
      HONZON_ASSERT( now >= auction.start, auction_not_started,
                     "auction ${id} starts at block ${s}", ("id",id)("s",auction.start) );

      if( auction.bid.valid() )
         HONZON_ASSERT( value > auction.bid->second, invalid_bid_price,
                        "bid ${v} does not exceed ${b}", ("v",value)("b",auction.bid->second) );
      else
         HONZON_ASSERT( value > 0, invalid_bid_price, "bid must be positive", ("v",value) );

      const auction_bid_type new_bid( bidder, value );
      const optional<auction_bid_type> last_bid = auction.bid;

      auction_bid_outcome outcome;
      if( _auction_handler.on_new_bid )
         outcome = _auction_handler.on_new_bid( now, id, new_bid, last_bid );
      HONZON_ASSERT( outcome.accept_bid, bid_not_accepted, "bid of ${v} on auction ${id} rejected", ("v",value)("id",id) );

      const auction_object& updated = get_auction( id );
      modify( updated, [&]( auction_object& a ) {
         if( outcome.change_end )
            a.end = outcome.new_end;
         a.bid = new_bid;
      });

      push_applied_operation( auction_bid_placed_operation( id, bidder, value ) );
   });
} FC_CAPTURE_AND_RETHROW( (bidder)(id)(value) ) }

void database::update_auction( auction_id_type id, const optional<auction_bid_type>& bid,
                               block_number_type start, optional<block_number_type> end )
{ try {
   const auction_object& auction = get_auction( id );
   modify( auction, [&]( auction_object& a ) {
      a.bid = bid;
      a.start = start;
      a.end = end;
   });
} FC_CAPTURE_AND_RETHROW( (id)(bid)(start)(end) ) }

void database::remove_auction( auction_id_type id )
{ try {
   remove( get_auction( id ) );
} FC_CAPTURE_AND_RETHROW( (id) ) }

void database::sweep_ended_auctions( block_number_type now )
{ try {
   const auto& idx = get_index_type<auction_index>().indices().get<by_end>();

   vector< pair<auction_id_type, optional<auction_bid_type>> > ended;
   for( auto itr = idx.lower_bound( boost::make_tuple( now ) );
        itr != idx.end() && itr->end_key() == now; ++itr )
      ended.emplace_back( itr->auction_id, itr->bid );

   for( const auto& item : ended )
   {
      remove_auction( item.first );
      if( !_auction_handler.on_auction_ended )
         continue;
      try
      {
         with_transactional_scope( *this, [&]() {
            _auction_handler.on_auction_ended( item.first, item.second );
         });
      }
      catch( const fc::exception& e )
      {
         elog( "failed to settle auction ${id}: ${e}", ("id",item.first)("e",e.to_detail_string()) );
      }
   }
} FC_CAPTURE_AND_RETHROW( (now) ) }

} }
