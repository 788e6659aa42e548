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
#include <honzon/chain/cdp_object.hpp>
#include <honzon/chain/loan_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

namespace {

struct honzon_fixture : database_fixture
{
   object_id_type authorize( account_id_type authorizer, account_id_type authorizee )
   {
      authorize_loan_operation op;
      op.authorizer = authorizer;
      op.authorizee = authorizee;
      auto ptx = push_op( op );
      return ptx.operation_results.back().get<object_id_type>();
   }

   void unauthorize( account_id_type authorizer, account_id_type authorizee )
   {
      unauthorize_loan_operation op;
      op.authorizer = authorizer;
      op.authorizee = authorizee;
      push_op( op );
   }

   void unauthorize_all( account_id_type authorizer )
   {
      unauthorize_all_loans_operation op;
      op.authorizer = authorizer;
      push_op( op );
   }

   void transfer_loan_from( account_id_type to, account_id_type from )
   {
      transfer_loan_from_operation op;
      op.to = to;
      op.from = from;
      push_op( op );
   }

   void adjust_loan_by_debit_value( account_id_type who, int64_t collateral_adjustment, int64_t debit_value_adjustment )
   {
      adjust_loan_by_debit_value_operation op;
      op.owner = who;
      op.collateral_adjustment = collateral_adjustment;
      op.debit_value_adjustment = debit_value_adjustment;
      push_op( op );
   }

   void transfer_debit( account_id_type who, uint64_t amount )
   {
      transfer_debit_operation op;
      op.owner = who;
      op.amount = amount;
      push_op( op );
   }

   /// stands in for accrued interest
   void set_debit_exchange_rate( const exchange_rate_type& rate )
   {
      db->modify( db->get_cdp_engine(), [&rate]( cdp_engine_object& e ) {
         e.debit_exchange_rate = rate;
      });
   }

   void set_required_collateral_ratio( const optional<param_update>& ratio )
   {
      set_collateral_params( optional<param_update>(), optional<param_update>(), optional<param_update>(),
                             ratio, optional<balance_type>() );
   }

   balance_type deposit_of( account_id_type who )const
   {
      return db->get_balance_on_hold( loan_authorization_hold, who, HONZON_NATIVE_ASSET );
   }

   size_t authorizations()const
   {
      return db->get_index_type<loan_authorization_index>().indices().size();
   }
};

}

BOOST_FIXTURE_TEST_SUITE( honzon_tests, honzon_fixture )

BOOST_AUTO_TEST_CASE( authorize_holds_deposit )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      db->clear_applied_operations();

      const object_id_type id = authorize( alice_id, bob_id );
      const auto& authorization = db->get<loan_authorization_object>( id );
      BOOST_CHECK( authorization.authorizer == alice_id );
      BOOST_CHECK( authorization.authorizee == bob_id );
      BOOST_CHECK( authorization.deposit == HONZON_DEFAULT_DEPOSIT_PER_AUTHORIZATION );
      BOOST_CHECK( native_balance( alice_id ) == 900 );
      BOOST_CHECK( deposit_of( alice_id ) == 100 );
      BOOST_CHECK_EQUAL( count_applied<loan_authorization_operation>(), 1u );

      HONZON_REQUIRE_THROW( authorize( alice_id, bob_id ), already_authorized );
      BOOST_CHECK( native_balance( alice_id ) == 900 );
      BOOST_CHECK_EQUAL( authorizations(), 1u );

      authorize_loan_operation op;
      op.authorizer = alice_id;
      op.authorizee = bob_id;
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE( op, authorizee, alice_id );

      // carol cannot pay the deposit
      HONZON_REQUIRE_THROW( authorize( carol_id, alice_id ), insufficient_balance );
      BOOST_CHECK_EQUAL( authorizations(), 1u );
      BOOST_CHECK( deposit_of( carol_id ) == 0 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unauthorize_returns_deposit )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );

      authorize( alice_id, bob_id );
      HONZON_REQUIRE_THROW( unauthorize( alice_id, carol_id ), authorization_not_exists );
      HONZON_REQUIRE_THROW( unauthorize( bob_id, alice_id ), authorization_not_exists );

      db->clear_applied_operations();
      unauthorize( alice_id, bob_id );
      BOOST_CHECK_EQUAL( authorizations(), 0u );
      BOOST_CHECK( native_balance( alice_id ) == 1000 );
      BOOST_CHECK( deposit_of( alice_id ) == 0 );
      BOOST_CHECK_EQUAL( count_applied<loan_unauthorization_operation>(), 1u );

      HONZON_REQUIRE_THROW( unauthorize( alice_id, bob_id ), authorization_not_exists );

      // authorizing again after withdrawing is allowed
      authorize( alice_id, bob_id );
      BOOST_CHECK( deposit_of( alice_id ) == 100 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unauthorize_all_returns_every_deposit )
{
   try {
      ACTORS( (alice)(bob)(carol)(dan) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      authorize( alice_id, bob_id );
      authorize( alice_id, carol_id );
      authorize( alice_id, dan_id );
      authorize( bob_id, alice_id );
      BOOST_CHECK( native_balance( alice_id ) == 700 );
      BOOST_CHECK( deposit_of( alice_id ) == 300 );

      db->clear_applied_operations();
      unauthorize_all( alice_id );
      BOOST_CHECK( native_balance( alice_id ) == 1000 );
      BOOST_CHECK( deposit_of( alice_id ) == 0 );
      BOOST_CHECK_EQUAL( count_applied<loan_unauthorization_all_operation>(), 1u );

      // only the authorizations granted by alice are gone
      BOOST_CHECK_EQUAL( authorizations(), 1u );
      BOOST_CHECK( deposit_of( bob_id ) == 100 );

      // nothing left to withdraw is not an error
      unauthorize_all( alice_id );
      BOOST_CHECK( native_balance( alice_id ) == 1000 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_loan_from_needs_authorization )
{
   try {
      ACTORS( (alice)(bob)(carol) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 100 );
      adjust_loan( bob_id, 200, 50 );

      HONZON_REQUIRE_THROW( transfer_loan_from( bob_id, alice_id ), no_permission );
      // the authorization is directional
      authorize( bob_id, alice_id );
      HONZON_REQUIRE_THROW( transfer_loan_from( bob_id, alice_id ), no_permission );

      transfer_loan_from_operation op;
      op.to = bob_id;
      op.from = alice_id;
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE( op, from, bob_id );

      authorize( alice_id, bob_id );
      db->clear_applied_operations();
      transfer_loan_from( bob_id, alice_id );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( collateral_of( bob_id ) == 500 );
      BOOST_CHECK( debit_of( bob_id ) == 150 );
      BOOST_CHECK_EQUAL( count_applied<transfer_loan_operation>(), 1u );

      // the authorization outlives the transfer
      BOOST_CHECK( deposit_of( alice_id ) == 100 );

      // an empty position moves as a no-op
      transfer_loan_from( bob_id, alice_id );
      BOOST_CHECK( collateral_of( bob_id ) == 500 );

      emergency_shutdown();
      authorize( bob_id, carol_id );
      HONZON_REQUIRE_THROW( transfer_loan_from( carol_id, bob_id ), already_shutdown );
      BOOST_CHECK( collateral_of( bob_id ) == 500 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_loan_from_rejects_unsafe_merge )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      fund( bob_id, HONZON_NATIVE_ASSET, 1000 );

      adjust_loan( alice_id, 300, 200 );
      adjust_loan( bob_id, 150, 100 );
      authorize( alice_id, bob_id );
      publish_price( price( 9, 10 ) );

      // 405 / 300 is below 1.5
      HONZON_REQUIRE_THROW( transfer_loan_from( bob_id, alice_id ), below_liquidation_ratio );
      BOOST_CHECK( collateral_of( alice_id ) == 300 );
      BOOST_CHECK( debit_of( alice_id ) == 200 );
      BOOST_CHECK( collateral_of( bob_id ) == 150 );
      BOOST_CHECK( debit_of( bob_id ) == 100 );

      // 1150 * 0.9 / 300 = 3.45 once bob tops up
      adjust_loan( bob_id, 700, 0 );
      transfer_loan_from( bob_id, alice_id );
      BOOST_CHECK( db->find_position( alice_id ) == nullptr );
      BOOST_CHECK( collateral_of( bob_id ) == 1150 );
      BOOST_CHECK( debit_of( bob_id ) == 300 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( adjust_loan_by_debit_value_converts_at_exchange_rate )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      set_debit_exchange_rate( exchange_rate_type::from_integer( 2 ) );

      db->clear_applied_operations();
      adjust_loan_by_debit_value( alice_id, 500, 200 );
      BOOST_CHECK( collateral_of( alice_id ) == 500 );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( stable_balance( alice_id ) == 200 );
      BOOST_CHECK( native_balance( alice_id ) == 500 );
      BOOST_CHECK_EQUAL( count_applied<position_updated_operation>(), 1u );

      adjust_loan_by_debit_value( alice_id, 0, -50 );
      BOOST_CHECK( debit_of( alice_id ) == 75 );
      BOOST_CHECK( stable_balance( alice_id ) == 150 );

      // repaying more than the debit repays all of it
      adjust_loan_by_debit_value( alice_id, 0, -1000 );
      BOOST_CHECK( debit_of( alice_id ) == 0 );
      BOOST_CHECK( stable_balance( alice_id ) == 0 );
      BOOST_CHECK( collateral_of( alice_id ) == 500 );

      // 3 is worth one and a half debit, only the whole unit is issued
      adjust_loan_by_debit_value( alice_id, 0, 3 );
      BOOST_CHECK( debit_of( alice_id ) == 1 );
      BOOST_CHECK( stable_balance( alice_id ) == 2 );

      // the ratio is checked on the converted debit, 500 / 600 is below 1.5
      HONZON_REQUIRE_THROW( adjust_loan_by_debit_value( alice_id, 0, 600 ), below_liquidation_ratio );
      BOOST_CHECK( debit_of( alice_id ) == 1 );

      emergency_shutdown();
      HONZON_REQUIRE_THROW( adjust_loan_by_debit_value( alice_id, 0, 2 ), already_shutdown );
      HONZON_REQUIRE_THROW( adjust_loan_by_debit_value( alice_id, 0, -2 ), already_shutdown );
      adjust_loan_by_debit_value( alice_id, 10, 0 );
      BOOST_CHECK( collateral_of( alice_id ) == 510 );
      BOOST_CHECK( debit_of( alice_id ) == 1 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transfer_debit_revalidates_position )
{
   try {
      ACTOR( alice );
      fund( alice_id, HONZON_NATIVE_ASSET, 1000 );
      adjust_loan( alice_id, 300, 100 );

      transfer_debit_operation op;
      op.owner = alice_id;
      op.amount = 10;
      op.validate();
      REQUIRE_OP_VALIDATION_FAILURE( op, amount, 0 );

      db->clear_applied_operations();
      transfer_debit( alice_id, 40 );
      BOOST_CHECK( collateral_of( alice_id ) == 300 );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( stable_balance( alice_id ) == 100 );
      BOOST_CHECK_EQUAL( count_applied<debit_transferred_operation>(), 1u );
      BOOST_CHECK_EQUAL( count_applied<position_updated_operation>(), 2u );

      HONZON_REQUIRE_THROW( transfer_debit( alice_id, 101 ), no_debit_value );

      // interest doubled the debit value, 300 / 200 still clears the liquidation ratio
      set_debit_exchange_rate( exchange_rate_type::from_integer( 2 ) );
      set_required_collateral_ratio( param_update( ratio_type::from_integer( 2 ) ) );
      HONZON_REQUIRE_THROW( transfer_debit( alice_id, 10 ), below_required_collateral_ratio );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( stable_balance( alice_id ) == 100 );

      set_required_collateral_ratio( param_update( void_t() ) );
      transfer_debit( alice_id, 10 );
      BOOST_CHECK( debit_of( alice_id ) == 100 );
      BOOST_CHECK( stable_balance( alice_id ) == 100 );

      emergency_shutdown();
      HONZON_REQUIRE_THROW( transfer_debit( alice_id, 10 ), already_shutdown );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
