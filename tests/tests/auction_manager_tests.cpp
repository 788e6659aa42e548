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

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

namespace {

struct collateral_auction_fixture : public database_fixture
{
   /// moves @ref amount collateral into the treasury and auctions it
   auction_id_type start_auction( account_id_type recipient, const balance_type& amount, const balance_type& target )
   {
      fund( HONZON_CDP_TREASURY_ACCOUNT, HONZON_NATIVE_ASSET, amount );
      return db->new_collateral_auction( recipient, amount, target );
   }

   const collateral_auction_object& item( auction_id_type id )const { return db->get_collateral_auction( id ); }
   optional<block_number_type> end_of( auction_id_type id )const { return db->get_auction( id ).end; }
};

}

BOOST_FIXTURE_TEST_SUITE( auction_manager_tests, collateral_auction_fixture )

BOOST_AUTO_TEST_CASE( new_auction_bookkeeping )
{
   try {
      ACTOR( alice );
      db->clear_applied_operations();

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      BOOST_CHECK_EQUAL( id, 0u );
      BOOST_CHECK( item( id ).initial_amount == 10 );
      BOOST_CHECK( item( id ).amount == 10 );
      BOOST_CHECK( item( id ).target == 100 );
      BOOST_CHECK( item( id ).refund_recipient == alice_id );
      BOOST_CHECK_EQUAL( item( id ).start_time, db->head_block_num() );
      BOOST_CHECK( !end_of( id ).valid() );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 10 );
      BOOST_CHECK( db->get_total_target_in_auction() == 100 );
      BOOST_CHECK_EQUAL( count_applied<new_collateral_auction_operation>(), 1u );

      BOOST_CHECK_EQUAL( start_auction( alice_id, 5, 0 ), 1u );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 15 );

      HONZON_REQUIRE_THROW( db->new_collateral_auction( alice_id, 0, 100 ), invalid_auction_amount );
      HONZON_REQUIRE_THROW( db->new_collateral_auction( alice_id, max_balance(), 100 ), invalid_auction_amount );
      HONZON_REQUIRE_THROW( db->new_collateral_auction( alice_id, 1, max_balance() ), invalid_auction_amount );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 15 );
      BOOST_CHECK( db->get_total_target_in_auction() == 100 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( forward_auction_settles )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );
      fund( carol_id, HONZON_STABLE_ASSET, 500 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );

      bid( bob_id, id, 50 );
      BOOST_CHECK( db->get_surplus_pool() == 50 );
      BOOST_CHECK( auction_hold( bob_id ) == 50 );
      BOOST_CHECK( stable_balance( bob_id ) == 450 );
      BOOST_CHECK( item( id ).amount == 10 );
      BOOST_CHECK( *end_of( id ) == 101 );

      generate_block();
      bid( carol_id, id, 100 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( stable_balance( bob_id ) == 500 );
      BOOST_CHECK( auction_hold( carol_id ) == 100 );
      BOOST_CHECK( db->get_surplus_pool() == 100 );
      BOOST_CHECK( item( id ).amount == 10 );
      BOOST_CHECK( *end_of( id ) == 102 );

      generate_blocks_until( 102 );
      BOOST_REQUIRE( db->find_collateral_auction( id ) != nullptr );
      db->clear_applied_operations();
      generate_block();

      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( db->find_auction( id ) == nullptr );
      BOOST_CHECK( native_balance( carol_id ) == 10 );
      BOOST_CHECK( auction_hold( carol_id ) == 0 );
      BOOST_CHECK( stable_balance( carol_id ) == 400 );
      BOOST_CHECK( native_balance( alice_id ) == 0 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 0 );
      BOOST_CHECK( db->get_total_target_in_auction() == 0 );
      BOOST_CHECK( db->get_total_collaterals() == 0 );
      BOOST_CHECK( db->get_surplus_pool() == 100 );
      BOOST_CHECK_EQUAL( count_applied<collateral_auction_dealt_operation>(), 1u );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( reverse_stage_shrinks_amount )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );
      fund( carol_id, HONZON_STABLE_ASSET, 500 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      bid( bob_id, id, 50 );
      generate_block();
      bid( carol_id, id, 100 );
      generate_block();

      bid( bob_id, id, 200 );
      BOOST_CHECK( item( id ).amount == 5 );
      BOOST_CHECK( item( id ).initial_amount == 10 );
      BOOST_CHECK( auction_hold( carol_id ) == 0 );
      BOOST_CHECK( stable_balance( carol_id ) == 500 );
      BOOST_CHECK( auction_hold( bob_id ) == 100 );
      BOOST_CHECK( db->get_surplus_pool() == 100 );
      BOOST_CHECK( *end_of( id ) == 103 );

      // in reverse stage the price may stay, but the bid value must still rise
      HONZON_REQUIRE_THROW( bid( carol_id, id, 200 ), invalid_bid_price );

      generate_blocks_until( 104 );
      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( native_balance( bob_id ) == 5 );
      BOOST_CHECK( native_balance( alice_id ) == 5 );
      BOOST_CHECK( stable_balance( bob_id ) == 400 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( db->get_total_collaterals() == 0 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( always_forward_auction )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );
      fund( carol_id, HONZON_STABLE_ASSET, 1000 );

      const auction_id_type id = start_auction( alice_id, 100, 0 );
      BOOST_CHECK( item( id ).always_forward() );

      bid( bob_id, id, 2 );
      BOOST_CHECK( auction_hold( bob_id ) == 200 );
      BOOST_CHECK( db->get_surplus_pool() == 200 );

      // no minimum increment without a target
      bid( carol_id, id, 3 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( auction_hold( carol_id ) == 300 );
      BOOST_CHECK( db->get_surplus_pool() == 300 );
      BOOST_CHECK( item( id ).amount == 100 );

      generate_blocks_until( 102 );
      BOOST_CHECK( native_balance( carol_id ) == 100 );
      BOOST_CHECK( stable_balance( carol_id ) == 700 );
      BOOST_CHECK( native_balance( alice_id ) == 0 );
      BOOST_CHECK( stable_balance( bob_id ) == 1000 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( minimum_bid_price )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );
      fund( carol_id, HONZON_STABLE_ASSET, 500 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );

      // the first bid must reach half of the target price
      HONZON_REQUIRE_THROW( bid( bob_id, id, 49 ), bid_not_accepted );
      BOOST_CHECK( !db->get_auction( id ).bid.valid() );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );

      bid( bob_id, id, 60 );

      // later forward bids must add 5% of the last price
      HONZON_REQUIRE_THROW( bid( carol_id, id, 62 ), bid_not_accepted );
      bid( carol_id, id, 63 );
      BOOST_CHECK( auction_hold( carol_id ) == 63 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( db->get_surplus_pool() == 63 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unpaid_bid_is_rejected )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );
      fund( carol_id, HONZON_STABLE_ASSET, 70 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      bid( bob_id, id, 60 );

      HONZON_REQUIRE_THROW( bid( carol_id, id, 80 ), bid_not_accepted );
      BOOST_CHECK( stable_balance( carol_id ) == 70 );
      BOOST_CHECK( auction_hold( carol_id ) == 0 );
      BOOST_CHECK( auction_hold( bob_id ) == 60 );
      BOOST_CHECK( db->get_surplus_pool() == 60 );
      BOOST_CHECK( db->get_auction( id ).bid->first == bob_id );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( auction_without_bids_is_aborted )
{
   try {
      ACTOR( alice );
      const auction_id_type id = start_auction( alice_id, 10, 100 );
      const balance_type surplus = db->get_surplus_pool();
      const balance_type debit_pool = db->get_debit_pool();

      // collateral auctions only end once bid on, give this one an end
      db->update_auction( id, optional<auction_bid_type>(), db->head_block_num(), db->head_block_num() + 1 );
      db->clear_applied_operations();
      generate_blocks( 2 );

      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( native_balance( alice_id ) == 10 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 0 );
      BOOST_CHECK( db->get_surplus_pool() == surplus );
      BOOST_CHECK( db->get_debit_pool() == debit_pool );
      BOOST_REQUIRE_EQUAL( count_applied<collateral_auction_aborted_operation>(), 1u );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( soft_cap_halves_extension )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );
      fund( carol_id, HONZON_STABLE_ASSET, 1000 );

      BOOST_CHECK_EQUAL( db->get_auction_time_to_close( 1, 1 ), 100u );
      BOOST_CHECK_EQUAL( db->get_auction_time_to_close( 1, 2000 ), 100u );
      BOOST_CHECK_EQUAL( db->get_auction_time_to_close( 1, 2001 ), 50u );

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      BOOST_REQUIRE_EQUAL( db->head_block_num(), 1u );
      bid( bob_id, id, 50 );
      BOOST_CHECK( *end_of( id ) == 101 );

      // keep the auction open past the soft cap
      db->update_auction( id, db->get_auction( id ).bid, item( id ).start_time, optional<block_number_type>() );
      generate_blocks_until( 2001 );

      bid( carol_id, id, 60 );
      BOOST_CHECK( *end_of( id ) == 2051 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( cancel_after_shutdown )
{
   try {
      ACTORS( (alice)(bob) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      bid( bob_id, id, 80 );
      BOOST_CHECK( db->get_surplus_pool() == 80 );

      cancel_collateral_auction_operation op;
      op.caller = bob_id;
      op.auction_id = id;
      HONZON_REQUIRE_THROW( push_op( op ), must_after_shutdown );

      emergency_shutdown();
      db->clear_applied_operations();
      push_op( op );

      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( db->find_auction( id ) == nullptr );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( stable_balance( bob_id ) == 500 );
      BOOST_CHECK( db->get_surplus_pool() == 0 );
      BOOST_CHECK( native_balance( alice_id ) == 10 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 0 );
      BOOST_CHECK( db->get_total_target_in_auction() == 0 );
      BOOST_CHECK_EQUAL( count_applied<cancel_auction_operation>(), 1u );

      HONZON_REQUIRE_THROW( push_op( op ), collateral_auction_not_exist );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( cancel_in_reverse_stage )
{
   try {
      ACTORS( (alice)(bob) );
      fund( bob_id, HONZON_STABLE_ASSET, 500 );

      const auction_id_type id = start_auction( alice_id, 10, 100 );
      bid( bob_id, id, 150 );
      BOOST_CHECK( item( id ).amount == 6 );

      emergency_shutdown();
      HONZON_REQUIRE_THROW( db->cancel_collateral_auction( id ), in_reverse_stage );
      BOOST_CHECK( db->find_collateral_auction( id ) != nullptr );
      BOOST_CHECK( auction_hold( bob_id ) == 100 );

      // the auction still settles normally
      generate_blocks_until( 102 );
      BOOST_CHECK( native_balance( bob_id ) == 6 );
      BOOST_CHECK( native_balance( alice_id ) == 4 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( forward_payment_is_the_bid )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( bob_id, HONZON_STABLE_ASSET, 1000 );
      fund( carol_id, HONZON_STABLE_ASSET, 1000 );

      // 3 units do not divide the bids evenly
      const auction_id_type id = start_auction( alice_id, 3, 90 );

      bid( bob_id, id, 50 );
      BOOST_CHECK( auction_hold( bob_id ) == 50 );
      BOOST_CHECK( stable_balance( bob_id ) == 950 );
      BOOST_CHECK( db->get_surplus_pool() == 50 );

      bid( carol_id, id, 70 );
      BOOST_CHECK( item( id ).amount == 3 );
      BOOST_CHECK( auction_hold( bob_id ) == 0 );
      BOOST_CHECK( stable_balance( bob_id ) == 1000 );
      BOOST_CHECK( auction_hold( carol_id ) == 70 );
      BOOST_CHECK( db->get_surplus_pool() == 70 );

      generate_blocks_until( *end_of( id ) + 1 );
      BOOST_CHECK( db->find_collateral_auction( id ) == nullptr );
      BOOST_CHECK( native_balance( carol_id ) == 3 );
      BOOST_CHECK( auction_hold( carol_id ) == 0 );
      BOOST_CHECK( stable_balance( carol_id ) == 930 );
      BOOST_CHECK( db->get_surplus_pool() == 70 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
