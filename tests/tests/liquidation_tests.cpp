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
#include <honzon/chain/cdp_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

BOOST_FIXTURE_TEST_SUITE( liquidation_tests, database_fixture )

/**
 * An unsafe position is liquidated, its collateral is auctioned into reverse
 * stage and the auction revenue pays back the bad debt.
 */
BOOST_AUTO_TEST_CASE( liquidation_round_trip )
{
   try {
      ACTORS( (alice)(bob)(carol)(dan) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );
      fund( carol_id, HONZON_STABLE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      publish_price( price( 9, 10 ) );

      liquidate_cdp_operation liquidate;
      liquidate.caller = dan_id;
      liquidate.owner = alice_id;
      push_op( liquidate );

      const auto& auctions = db->get_index_type<collateral_auction_index>().indices();
      BOOST_REQUIRE_EQUAL( auctions.size(), 1u );
      const auction_id_type id = auctions.begin()->auction_id;
      BOOST_CHECK( db->get_collateral_auction( id ).target == 240 );
      BOOST_CHECK( db->get_debit_pool() == 200 );

      // the first bid must reach half of 240 / 300 per unit
      HONZON_REQUIRE_THROW( bid( bob_id, id, 100 ), bid_not_accepted );
      BOOST_CHECK( stable_balance( bob_id ) == 1000 );

      // 240 for 300 is exactly the target price
      bid( bob_id, id, 240 );
      BOOST_CHECK( db->get_collateral_auction( id ).amount == 300 );
      BOOST_CHECK( auction_hold( bob_id ) == 240 );
      BOOST_CHECK( db->get_surplus_pool() == 240 );

      // the surplus backs bob's bid and is not offset
      generate_block();
      BOOST_CHECK( db->get_surplus_pool() == 240 );
      BOOST_CHECK( db->get_debit_pool() == 200 );

      // 240 now buys 240 collateral
      bid( carol_id, id, 300 );
      BOOST_CHECK( db->get_collateral_auction( id ).amount == 240 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( stable_balance( bob_id ) == 1000 );
      BOOST_CHECK( auction_hold( carol_id ) == 240 );
      BOOST_CHECK( stable_balance( carol_id ) == 760 );
      BOOST_CHECK( db->get_surplus_pool() == 240 );
      const block_number_type end = *db->get_auction( id ).end;
      BOOST_CHECK_EQUAL( end, 102u );

      generate_blocks_until( end + 1 );

      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( native_balance( carol_id ) == 240 );
      BOOST_CHECK( auction_hold( carol_id ) == 0 );
      BOOST_CHECK( stable_balance( carol_id ) == 760 );
      // the collateral left over in reverse stage goes back to alice
      BOOST_CHECK( native_balance( alice_id ) == 760 );
      BOOST_CHECK( stable_balance( alice_id ) == 200 );
      BOOST_CHECK( db->get_total_collaterals() == 0 );

      // revenue offsets the bad debt, the penalty stays as surplus
      BOOST_CHECK( db->get_debit_pool() == 0 );
      BOOST_CHECK( db->get_surplus_pool() == 40 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( pledged_surplus_cannot_be_extracted )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      publish_price( price( 9, 10 ) );
      db->liquidate_unsafe_cdp( alice_id );

      const auction_id_type id = db->get_index_type<collateral_auction_index>().indices().begin()->auction_id;
      bid( bob_id, id, 150 );
      fund( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, 10 );
      BOOST_CHECK( db->get_surplus_pool() == 160 );
      BOOST_CHECK( db->get_surplus_pledged_to_bids() == 150 );

      HONZON_REQUIRE_THROW( db->extract_surplus_to_treasury( 11 ), surplus_pool_not_enough );
      db->extract_surplus_to_treasury( 10 );
      BOOST_CHECK( db->get_surplus_pool() == 150 );
      BOOST_CHECK( stable_balance( HONZON_TREASURY_ACCOUNT ) == 10 );

      // nothing is free to offset either
      generate_block();
      BOOST_CHECK( db->get_debit_pool() == 200 );
      BOOST_CHECK( db->get_surplus_pool() == 150 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( liquidation_auction_waits_for_bids )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      publish_price( price( 9, 10 ) );
      db->liquidate_unsafe_cdp( alice_id );
      BOOST_CHECK( native_balance( alice_id ) == 700 );

      // an auction without bids has no end, so it stays open
      generate_blocks( 200 );
      BOOST_CHECK_EQUAL( db->get_index_type<collateral_auction_index>().indices().size(), 1u );
      BOOST_CHECK( db->get_debit_pool() == 200 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 300 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

/**
 * Only the surplus above what the live top bid pledged is burned against the
 * debit pool at the end of a block.
 */
BOOST_AUTO_TEST_CASE( offset_spares_surplus_pledged_to_live_bid )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      publish_price( price( 9, 10 ) );
      db->liquidate_unsafe_cdp( alice_id );

      const auction_id_type id = db->get_index_type<collateral_auction_index>().indices().begin()->auction_id;
      bid( bob_id, id, 240 );
      fund( HONZON_CDP_TREASURY_ACCOUNT, HONZON_STABLE_ASSET, 50 );
      BOOST_CHECK( db->get_surplus_pool() == 290 );
      BOOST_CHECK( db->get_surplus_pledged_to_bids() == 240 );
      BOOST_CHECK( db->get_debit_pool() == 200 );

      generate_block();
      BOOST_CHECK( db->get_debit_pool() == 150 );
      BOOST_CHECK( db->get_surplus_pool() == 240 );
      BOOST_CHECK( db->get_surplus_pledged_to_bids() == 240 );
      BOOST_CHECK( auction_hold( bob_id ) == 240 );

      // nothing free is left for the next block
      generate_block();
      BOOST_CHECK( db->get_debit_pool() == 150 );
      BOOST_CHECK( db->get_surplus_pool() == 240 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
