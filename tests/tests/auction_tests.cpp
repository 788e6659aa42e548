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

#include <boost/test/unit_test.hpp>

#include <honzon/chain/database.hpp>
#include <honzon/chain/exceptions.hpp>

#include <honzon/chain/auction_object.hpp>
#include <honzon/chain/global_property_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

namespace {

/// accepts every bid and records the calls, ending each auction @ref extension blocks after a bid
struct recording_handler
{
   vector<std::pair<auction_id_type, auction_bid_type>>           bids;
   vector<std::pair<auction_id_type, optional<auction_bid_type>>> ended;
   block_number_type                                              extension = 10;
   bool                                                           accept = true;

   auction_handler bind()
   {
      auction_handler h;
      h.on_new_bid = [this]( block_number_type now, auction_id_type id, const auction_bid_type& new_bid,
                             const optional<auction_bid_type>& )
      {
         auction_bid_outcome outcome;
         if( !accept )
            return outcome;
         bids.emplace_back( id, new_bid );
         outcome.accept_bid = true;
         outcome.change_end = true;
         outcome.new_end = now + extension;
         return outcome;
      };
      h.on_auction_ended = [this]( auction_id_type id, const optional<auction_bid_type>& winner )
      {
         ended.emplace_back( id, winner );
      };
      return h;
   }
};

struct generic_auction_fixture : public database_fixture
{
   generic_auction_fixture()
      : collateral_handler( db->get_auction_handler() )
   {
      db->set_auction_handler( recorder.bind() );
   }

   ~generic_auction_fixture()
   {
      db->set_auction_handler( collateral_handler );
   }

   auction_handler   collateral_handler;
   recording_handler recorder;
};

}

BOOST_FIXTURE_TEST_SUITE( auction_tests, generic_auction_fixture )

BOOST_AUTO_TEST_CASE( new_auction_ids )
{
   try {
      const block_number_type now = db->head_block_num();
      BOOST_CHECK_EQUAL( db->new_auction( now, optional<block_number_type>() ), 0u );
      BOOST_CHECK_EQUAL( db->new_auction( now + 5, now + 10 ), 1u );
      BOOST_CHECK_EQUAL( db->get_global_properties().next_auction_id, 2u );

      const auction_object& second = db->get_auction( 1 );
      BOOST_CHECK_EQUAL( second.start, now + 5 );
      BOOST_REQUIRE( second.end.valid() );
      BOOST_CHECK_EQUAL( *second.end, now + 10 );
      BOOST_CHECK( !second.bid.valid() );

      HONZON_REQUIRE_THROW( db->get_auction( 2 ), auction_not_exist );

      db->modify( db->get_global_properties(), []( global_property_object& p ) {
         p.next_auction_id = HONZON_MAX_AUCTION_ID;
      });
      HONZON_REQUIRE_THROW( db->new_auction( now, optional<block_number_type>() ), no_available_auction_id );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( bid_rules )
{
   try {
      ACTORS( (bob)(carol) );
      const block_number_type now = db->head_block_num();
      const auction_id_type live = db->new_auction( now, optional<block_number_type>() );
      const auction_id_type later = db->new_auction( now + 3, optional<block_number_type>() );

      HONZON_REQUIRE_THROW( bid( bob_id, 42, 10 ), auction_not_exist );
      HONZON_REQUIRE_THROW( bid( bob_id, later, 10 ), auction_not_started );
      HONZON_REQUIRE_THROW( db->place_auction_bid( bob_id, live, 0 ), invalid_bid_price );

      db->clear_applied_operations();
      bid( bob_id, live, 10 );
      BOOST_REQUIRE( db->get_auction( live ).bid.valid() );
      BOOST_CHECK( db->get_auction( live ).bid->first == bob_id );
      BOOST_CHECK( db->get_auction( live ).bid->second == 10 );
      BOOST_CHECK_EQUAL( *db->get_auction( live ).end, now + 10 );
      BOOST_CHECK_EQUAL( count_applied<auction_bid_placed_operation>(), 1u );
      BOOST_REQUIRE_EQUAL( recorder.bids.size(), 1u );

      HONZON_REQUIRE_THROW( bid( carol_id, live, 10 ), invalid_bid_price );

      recorder.accept = false;
      HONZON_REQUIRE_THROW( bid( carol_id, live, 11 ), bid_not_accepted );
      BOOST_CHECK( db->get_auction( live ).bid->first == bob_id );

      recorder.accept = true;
      generate_blocks( 3 );
      bid( carol_id, later, 1 );
      BOOST_CHECK_EQUAL( recorder.bids.size(), 2u );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( end_of_block_sweep )
{
   try {
      ACTOR( bob );
      const block_number_type now = db->head_block_num();
      const auction_id_type a = db->new_auction( now, now + 2 );
      const auction_id_type b = db->new_auction( now, now + 2 );
      const auction_id_type c = db->new_auction( now, now + 3 );
      const auction_id_type open = db->new_auction( now, optional<block_number_type>() );

      bid( bob_id, b, 5 );
      // the bid moved b to now + 10
      BOOST_CHECK_EQUAL( *db->get_auction( b ).end, now + 10 );

      generate_blocks_until( now + 3 );
      BOOST_CHECK( db->find_auction( a ) == nullptr );
      BOOST_CHECK( db->find_auction( b ) != nullptr );
      BOOST_CHECK( db->find_auction( c ) != nullptr );
      BOOST_REQUIRE_EQUAL( recorder.ended.size(), 1u );
      BOOST_CHECK_EQUAL( recorder.ended[0].first, a );
      BOOST_CHECK( !recorder.ended[0].second.valid() );

      generate_blocks_until( now + 11 );
      BOOST_CHECK( db->find_auction( c ) == nullptr );
      BOOST_CHECK( db->find_auction( b ) == nullptr );
      BOOST_CHECK( db->find_auction( open ) != nullptr );
      BOOST_REQUIRE_EQUAL( recorder.ended.size(), 3u );
      BOOST_CHECK_EQUAL( recorder.ended[2].first, b );
      BOOST_REQUIRE( recorder.ended[2].second.valid() );
      BOOST_CHECK( recorder.ended[2].second->first == bob_id );

      // explicit removal does not consult the handler
      db->remove_auction( open );
      BOOST_CHECK( db->find_auction( open ) == nullptr );
      BOOST_CHECK_EQUAL( recorder.ended.size(), 3u );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( failing_handler_does_not_stop_the_sweep )
{
   try {
      const block_number_type now = db->head_block_num();
      const auction_id_type a = db->new_auction( now, now + 1 );
      const auction_id_type b = db->new_auction( now, now + 1 );

      vector<auction_id_type> settled;
      auction_handler h = recorder.bind();
      h.on_auction_ended = [&settled, a]( auction_id_type id, const optional<auction_bid_type>& )
      {
         FC_ASSERT( id != a, "cannot settle ${id}", ("id",id) );
         settled.push_back( id );
      };
      db->set_auction_handler( h );

      generate_blocks( 2 );
      BOOST_CHECK( db->find_auction( a ) == nullptr );
      BOOST_CHECK( db->find_auction( b ) == nullptr );
      BOOST_REQUIRE_EQUAL( settled.size(), 1u );
      BOOST_CHECK_EQUAL( settled[0], b );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
