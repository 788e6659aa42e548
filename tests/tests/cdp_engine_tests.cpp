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
#include <honzon/chain/auction_object.hpp>
#include <honzon/chain/cdp_object.hpp>
#include <honzon/chain/global_property_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

namespace {

   param_update set_to( const fixed_point& v ) { return param_update( v ); }
   param_update cleared() { return param_update( void_t() ); }

   void set_keeper_max_iterations( database& db, uint32_t n )
   {
      db.modify( db.get_global_properties(), [n]( global_property_object& p ) {
         p.parameters.keeper_max_iterations = n;
      });
   }

   /// prices set directly by the test instead of the oracle
   class fixed_price_provider : public price_provider
   {
      public:
         optional<price_type> collateral_price;

         virtual optional<price_type> get_relative_price( asset_id_type base, asset_id_type quote )const override
         {
            if( base == quote )
               return price_type::one();
            if( base == HONZON_NATIVE_ASSET && quote == HONZON_STABLE_ASSET )
               return collateral_price;
            return optional<price_type>();
         }
         virtual void lock_price( asset_id_type ) override {}
   };

}

BOOST_FIXTURE_TEST_SUITE( cdp_engine_tests, database_fixture )

BOOST_AUTO_TEST_CASE( collateral_params_update )
{
   try {
      ACTOR( mallory );
      db->clear_applied_operations();

      set_collateral_params( set_to( rate_type::from_rational( 1, 100000 ) ),
                             set_to( ratio_type::from_rational( 2, 1 ) ),
                             optional<param_update>(),
                             set_to( ratio_type::from_rational( 5, 2 ) ),
                             balance_type( 5000 ) );

      BOOST_CHECK( *db->get_interest_rate_per_sec() == rate_type::from_rational( 1, 100000 ) );
      BOOST_CHECK( db->get_liquidation_ratio() == ratio_type::from_rational( 2, 1 ) );
      BOOST_CHECK( db->get_liquidation_penalty() == rate_type::from_rational( 1, 5 ) );
      BOOST_CHECK( *db->get_required_collateral_ratio() == ratio_type::from_rational( 5, 2 ) );
      BOOST_CHECK( db->get_collateral_params().maximum_total_debit_value == 5000 );

      BOOST_CHECK_EQUAL( count_applied<interest_rate_per_sec_updated_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<liquidation_ratio_updated_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<liquidation_penalty_updated_operation>(), 0u );
      BOOST_CHECK_EQUAL( count_applied<required_collateral_ratio_updated_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<maximum_total_debit_value_updated_operation>(), 1u );

      // a cleared ratio falls back to the chain default
      set_collateral_params( optional<param_update>(), cleared(), cleared(), cleared(), optional<balance_type>() );
      BOOST_CHECK( db->get_liquidation_ratio() == db->get_chain_parameters().default_liquidation_ratio );
      BOOST_CHECK( db->get_liquidation_penalty() == db->get_chain_parameters().default_liquidation_penalty );
      BOOST_CHECK( !db->get_required_collateral_ratio().valid() );
      BOOST_CHECK( db->get_interest_rate_per_sec().valid() );

      HONZON_REQUIRE_THROW( set_collateral_params( set_to( rate_type::from_rational( 3, 2 ) ), optional<param_update>(),
                                                   optional<param_update>(), optional<param_update>(),
                                                   optional<balance_type>() ), invalid_rate );
      HONZON_REQUIRE_THROW( set_collateral_params( optional<param_update>(), optional<param_update>(),
                                                   set_to( rate_type::from_rational( 2, 1 ) ), optional<param_update>(),
                                                   optional<balance_type>() ), invalid_rate );
      BOOST_CHECK( *db->get_interest_rate_per_sec() == rate_type::from_rational( 1, 100000 ) );

      set_collateral_params_operation op;
      op.authority = mallory_id;
      op.maximum_total_debit_value = balance_type( 1 );
      HONZON_REQUIRE_THROW( push_op( op ), bad_origin );
      BOOST_CHECK( db->get_collateral_params().maximum_total_debit_value == 5000 );

      op.maximum_total_debit_value.reset();
      BOOST_CHECK_THROW( op.validate(), fc::exception );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( position_validity )
{
   try {
      // empty and collateral only positions are always valid
      db->check_position_valid( 0, 0, true );
      db->check_position_valid( 1, 0, true );

      db->check_position_valid( 150, 100, true );
      HONZON_REQUIRE_THROW( db->check_position_valid( 149, 100, false ), below_liquidation_ratio );
      HONZON_REQUIRE_THROW( db->check_position_valid( 100, 1, false ), remain_debit_value_too_small );

      set_collateral_params( optional<param_update>(), optional<param_update>(), optional<param_update>(),
                             set_to( ratio_type::from_rational( 2, 1 ) ), optional<balance_type>() );
      HONZON_REQUIRE_THROW( db->check_position_valid( 150, 100, true ), below_required_collateral_ratio );
      // the required ratio only binds risk increasing adjustments
      db->check_position_valid( 150, 100, false );

      BOOST_CHECK( db->calculate_collateral_ratio( 300, 100, price( 1, 2 ) ) == ratio_type::from_rational( 3, 2 ) );
      BOOST_CHECK( db->calculate_collateral_ratio( 300, 0, price( 1 ) ) == ratio_type::max_value() );

      db->check_debit_cap( 10000 );
      HONZON_REQUIRE_THROW( db->check_debit_cap( 10001 ), exceed_debit_value_hard_cap );

      const cdp_status safe = db->check_cdp_status( 150, 100 );
      BOOST_CHECK( safe.status == cdp_status::safe );
      const cdp_status unsafe = db->check_cdp_status( 149, 100 );
      BOOST_CHECK( unsafe.status == cdp_status::unsafe );
      BOOST_CHECK( db->check_cdp_status( 0, 0 ).status == cdp_status::safe );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( missing_params_and_feed )
{
   try {
      genesis_state_type bare;
      bare.initial_timestamp = time_point_sec( HONZON_TESTING_GENESIS_TIMESTAMP );

      {
         database no_params;
         no_params.open( bare );
         HONZON_REQUIRE_THROW( no_params.get_collateral_params(), invalid_collateral_type );
         const cdp_status status = no_params.check_cdp_status( 100, 10 );
         BOOST_CHECK( status.status == cdp_status::checks_failed );
         BOOST_REQUIRE( status.error );
         BOOST_CHECK_EQUAL( status.error->code(), invalid_collateral_type::code_value );
         no_params.close();
      }

      bare.initial_collateral_params = risk_management_params();
      {
         database no_feed;
         no_feed.open( bare );
         BOOST_CHECK( !no_feed.get_collateral_price().valid() );
         HONZON_REQUIRE_THROW( no_feed.check_position_valid( 100, 10, true ), invalid_feed_price );
         const cdp_status status = no_feed.check_cdp_status( 100, 10 );
         BOOST_CHECK( status.status == cdp_status::checks_failed );
         BOOST_REQUIRE( status.error );
         BOOST_CHECK_EQUAL( status.error->code(), invalid_feed_price::code_value );
         no_feed.close();
      }
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( interest_accrual )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 10000 );
      adjust_loan( alice_id, 10000, 1000 );

      set_collateral_params( set_to( rate_type::from_rational( 1, 1000 ) ), optional<param_update>(),
                             optional<param_update>(), optional<param_update>(), optional<balance_type>() );

      // one block interval of 6 seconds: 1.001^6 - 1
      generate_block();
      const exchange_rate_type expected = exchange_rate_type::from_string( "1.006015015020015001" );
      BOOST_CHECK( db->get_debit_exchange_rate() == expected );
      BOOST_CHECK( db->get_surplus_pool() == 6 );
      BOOST_CHECK( db->get_debit_value( debit_of( alice_id ) ) == 1006 );
      BOOST_CHECK( debit_of( alice_id ) == 1000 );

      // repaying the whole debit now costs its grown value
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 0, -1000 ), insufficient_balance );
      fund( alice_id, HONZON_STABLE_ASSET, 6 );

      adjust_loan( alice_id, 0, -1000 );
      BOOST_CHECK( stable_balance( alice_id ) == 0 );

      // no debit, no accrual
      generate_block();
      BOOST_CHECK( db->get_debit_exchange_rate() == expected );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( no_accrual_after_shutdown )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 10000 );
      adjust_loan( alice_id, 10000, 1000 );
      set_collateral_params( set_to( rate_type::from_rational( 1, 1000 ) ), optional<param_update>(),
                             optional<param_update>(), optional<param_update>(), optional<balance_type>() );

      emergency_shutdown();
      generate_blocks( 3 );
      BOOST_CHECK( db->get_debit_exchange_rate() == exchange_rate_type::one() );
      BOOST_CHECK( db->get_surplus_pool() == 0 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( liquidate_unsafe_position )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 200 );

      liquidate_cdp_operation op;
      op.caller = bob_id;
      op.owner = alice_id;
      HONZON_REQUIRE_THROW( push_op( op ), must_be_unsafe );

      publish_price( price( 9, 10 ) );
      BOOST_CHECK( db->check_cdp_status( alice_id ).status == cdp_status::unsafe );
      db->clear_applied_operations();

      push_op( op );

      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK_EQUAL( alice_id( *db ).consumers, 0u );
      BOOST_CHECK( db->get_total_collaterals() == 300 );
      BOOST_CHECK( db->get_debit_pool() == 200 );
      // issued stable currency is not touched
      BOOST_CHECK( stable_balance( alice_id ) == 200 );

      BOOST_CHECK_EQUAL( count_applied<confiscate_collateral_and_debit_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<new_collateral_auction_operation>(), 1u );
      BOOST_REQUIRE_EQUAL( count_applied<liquidate_unsafe_cdp_operation>(), 1u );
      const auto vop = db->get_applied_operations().back().get<liquidate_unsafe_cdp_operation>();
      BOOST_CHECK( vop.collateral_amount == 300 );
      BOOST_CHECK( vop.bad_debt_value == 200 );
      // bad debt plus the 20% penalty
      BOOST_CHECK( vop.target_amount == 240 );

      const auto& auctions = db->get_index_type<collateral_auction_index>().indices();
      BOOST_REQUIRE_EQUAL( auctions.size(), 1u );
      const collateral_auction_object& item = *auctions.begin();
      BOOST_CHECK( item.refund_recipient == alice_id );
      BOOST_CHECK( item.initial_amount == 300 );
      BOOST_CHECK( item.target == 240 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 300 );
      BOOST_CHECK( db->get_total_collaterals_not_in_auction() == 0 );

      // nothing left to liquidate
      HONZON_REQUIRE_THROW( push_op( op ), must_be_unsafe );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( liquidation_disabled_after_shutdown )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 200 );
      publish_price( price( 1, 2 ) );

      emergency_shutdown();

      liquidate_cdp_operation op;
      op.caller = bob_id;
      op.owner = alice_id;
      HONZON_REQUIRE_THROW( push_op( op ), already_shutdown );
      BOOST_CHECK( collateral_of( alice_id ) == 300 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( external_price_provider )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 200 );

      fixed_price_provider* provider = new fixed_price_provider();
      provider->collateral_price = price( 9, 10 );
      db->set_price_provider( unique_ptr<price_provider>( provider ) );

      // the oracle feed of 1 is no longer consulted
      BOOST_CHECK( *db->get_collateral_price() == price( 9, 10 ) );
      BOOST_CHECK( db->check_cdp_status( alice_id ).status == cdp_status::unsafe );

      provider->collateral_price = price( 2 );
      BOOST_CHECK( db->check_cdp_status( alice_id ).status == cdp_status::safe );

      provider->collateral_price.reset();
      const cdp_status status = db->check_cdp_status( alice_id );
      BOOST_CHECK( status.status == cdp_status::checks_failed );
      BOOST_REQUIRE( status.error );
      BOOST_CHECK_EQUAL( status.error->code(), invalid_feed_price::code_value );
      HONZON_REQUIRE_THROW( adjust_loan( alice_id, 0, 10 ), invalid_feed_price );

      HONZON_REQUIRE_THROW( db->set_price_provider( unique_ptr<price_provider>() ), fc::exception );

      db->set_price_provider( unique_ptr<price_provider>( new database_price_provider( *db ) ) );
      BOOST_CHECK( db->check_cdp_status( alice_id ).status == cdp_status::safe );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( keeper_liquidates_unsafe_positions )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 200 );
      adjust_loan( bob_id, 1000, 100 );
      publish_price( price( 9, 10 ) );

      set_keeper_max_iterations( *db, 0 );
      generate_block();
      BOOST_CHECK( collateral_of( alice_id ) == 300 );

      set_keeper_max_iterations( *db, HONZON_DEFAULT_KEEPER_MAX_ITERATIONS );
      db->clear_applied_operations();
      generate_block();

      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK_EQUAL( count_applied<liquidate_unsafe_cdp_operation>(), 1u );
      BOOST_CHECK( db->get_debit_pool() == 200 );
      BOOST_CHECK( db->get_total_collateral_in_auction() == 300 );
      BOOST_CHECK( db->get_total_target_in_auction() == 240 );

      // 900 / 100 is safe
      BOOST_CHECK( collateral_of( bob_id ) == 1000 );
      BOOST_CHECK( debit_of( bob_id ) == 100 );
      BOOST_CHECK( !db->get_cdp_engine().keeper_cursor.valid() );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( keeper_resumes_from_cursor )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      for( account_id_type who : { alice_id, bob_id, carol_id } )
      {
         fund( who, HONZON_NATIVE_ASSET, 1000 );
         adjust_loan( who, 300, 200 );
      }
      publish_price( price( 9, 10 ) );
      set_keeper_max_iterations( *db, 1 );

      generate_block();
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( db->find_position( bob_id ) != nullptr );
      BOOST_REQUIRE( db->get_cdp_engine().keeper_cursor.valid() );
      BOOST_CHECK( *db->get_cdp_engine().keeper_cursor == bob_id );

      generate_block();
      BOOST_CHECK( db->find_position( bob_id ) == nullptr );
      BOOST_CHECK( db->find_position( carol_id ) != nullptr );
      BOOST_CHECK( *db->get_cdp_engine().keeper_cursor == carol_id );

      // the last position wraps the cursor around
      generate_block();
      BOOST_CHECK( db->find_position( carol_id ) == nullptr );
      BOOST_CHECK( !db->get_cdp_engine().keeper_cursor.valid() );
      BOOST_CHECK( db->get_debit_pool() == 600 );
      BOOST_CHECK_EQUAL( db->get_index_type<collateral_auction_index>().indices().size(), 3u );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( keeper_settles_after_shutdown )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 100 );
      adjust_loan( bob_id, 300, 0 );

      emergency_shutdown();
      db->clear_applied_operations();
      generate_block();

      BOOST_CHECK_EQUAL( count_applied<settle_cdp_in_debit_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<liquidate_unsafe_cdp_operation>(), 0u );
      // 100 collateral covers the debit at price 1, the rest goes back
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( native_balance( alice_id ) == 900 );
      BOOST_CHECK( db->get_debit_pool() == 100 );
      BOOST_CHECK( db->get_total_collaterals() == 100 );

      // without debit there is nothing to settle
      BOOST_CHECK( collateral_of( bob_id ) == 300 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
