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

#include <honzon/chain/account_object.hpp>
#include <honzon/chain/loan_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

BOOST_FIXTURE_TEST_SUITE( loans_tests, database_fixture )

BOOST_AUTO_TEST_CASE( adjust_position_round_trip )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      db->clear_applied_operations();

      adjust_loan( alice_id, 300, 100 );
      BOOST_CHECK( collateral_of( alice_id ) == 300 );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( native_balance( alice_id ) == 700 );
      BOOST_CHECK( stable_balance( alice_id ) == 100 );
      BOOST_CHECK( native_balance( HONZON_LOANS_ACCOUNT ) == 300 );
      BOOST_CHECK( db->get_total_positions().collateral == 300 );
      BOOST_CHECK( db->get_total_positions().debit == 100 );
      BOOST_CHECK_EQUAL( alice_id( *db ).consumers, 1u );
      BOOST_CHECK_EQUAL( count_applied<position_updated_operation>(), 1u );

      // a second adjustment on the same position keeps a single consumer
      adjust_loan( alice_id, 100, 0 );
      BOOST_CHECK( collateral_of( alice_id ) == 400 );
      BOOST_CHECK_EQUAL( alice_id( *db ).consumers, 1u );

      adjust_loan( alice_id, -400, -100 );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( native_balance( alice_id ) == 1000 );
      BOOST_CHECK( stable_balance( alice_id ) == 0 );
      BOOST_CHECK_EQUAL( alice_id( *db ).consumers, 0u );
      BOOST_CHECK( db->get_total_positions().collateral == 0 );
      BOOST_CHECK( db->get_total_positions().debit == 0 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( adjust_position_rejections )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 100 );

      // 300 / 201 is below the liquidation ratio of 1.5
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 0, 101 ), below_liquidation_ratio );
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, -151, 0 ), below_liquidation_ratio );
      // more collateral than the free balance
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 701, 0 ), insufficient_balance );
      // repaying more than was issued
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 0, -101 ), fc::exception );

      BOOST_CHECK( collateral_of( alice_id ) == 300 );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( stable_balance( alice_id ) == 100 );

      // a debit value of 1 is below the minimum of 2
      HONZON_REQUIRE_THROW( adjust_loan( bob_id, 10, 1 ), remain_debit_value_too_small );
      BOOST_CHECK( db->find_position( bob_id ) == nullptr );
      BOOST_CHECK_EQUAL( bob_id( *db ).consumers, 0u );

      // the whole debit cap is 10000
      fund( bob_id, HONZON_NATIVE_ASSET, 100000 );
      HONZON_REQUIRE_THROW( adjust_loan( bob_id, 100000, 9901 ), exceed_debit_value_hard_cap );
      adjust_loan( bob_id, 100000, 9900 );
      BOOST_CHECK( db->get_total_positions().debit == 10000 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( adjustment_out_of_range )
{
   try {
      ACTOR( alice );
      const amount_type too_large = amount_type( 1 ) << 127;

      HONZON_REQUIRE_THROW( db->adjust_position( alice_id, too_large, 0 ), amount_convert_failed );
      HONZON_REQUIRE_THROW( db->adjust_position( alice_id, 0, too_large ), amount_convert_failed );

      adjust_loan_operation op;
      op.owner = alice_id;
      op.collateral_adjustment = 1;
      op.debit_adjustment = 0;
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE( op, debit_adjustment, too_large );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( collateral_minimum )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );

      db->modify( db->get_global_properties(), []( global_property_object& p ) {
         p.parameters.minimum_collateral_amount = 50;
      });

      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 49, 0 ), collateral_amount_below_minimum );
      adjust_loan( alice_id, 50, 0 );
      // positions with debit are bound by the ratios only
      adjust_loan( alice_id, 0, 20 );
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, -10, -20 ), collateral_amount_below_minimum );
      adjust_loan( alice_id, -50, -20 );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_loan_merges_positions )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 100 );
      adjust_loan( bob_id, 200, 50 );
      db->clear_applied_operations();

      db->transfer_loan( alice_id, bob_id );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( collateral_of( bob_id ) == 500 );
      BOOST_CHECK( debit_of( bob_id ) == 150 );
      BOOST_CHECK_EQUAL( alice_id( *db ).consumers, 0u );
      BOOST_CHECK_EQUAL( bob_id( *db ).consumers, 1u );
      BOOST_CHECK_EQUAL( count_applied<transfer_loan_operation>(), 1u );
      // issued stable currency stays where it was
      BOOST_CHECK( stable_balance( alice_id ) == 100 );

      BOOST_CHECK_THROW( db->transfer_loan( bob_id, bob_id ), fc::exception );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_loan_to_unsafe_merge )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      adjust_loan( bob_id, 150, 100 );
      publish_price( price( 9, 10 ) );

      // 405 / 300 is below 1.5
      HONZON_REQUIRE_THROW( db->transfer_loan( alice_id, bob_id ), below_liquidation_ratio );
      BOOST_CHECK( collateral_of( alice_id ) == 300 );
      BOOST_CHECK( collateral_of( bob_id ) == 150 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
