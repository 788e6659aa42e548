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
#include <honzon/chain/db_with.hpp>

#include <honzon/chain/account_object.hpp>
#include <honzon/chain/global_property_object.hpp>

#include "../common/database_fixture.hpp"

using namespace honzon::chain;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_test )
{
   try {
      auto ses = db->start_undo_session();
      const auto& acct1 = db->create<account_object>( []( account_object& a ) {
         a.name = "undo-one";
      });
      auto id1 = acct1.id;
      // abandon changes
      ses.undo();
      BOOST_CHECK( db->find( account_id_type( id1 ) ) == nullptr );

      // start a new session
      ses = db->start_undo_session();
      const auto& acct2 = db->create<account_object>( []( account_object& a ) {
         a.name = "undo-two";
      });
      auto id2 = acct2.id;
      BOOST_CHECK( id1 == id2 );
      ses.undo();
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( merge_test )
{
   try {
      ACTOR( nathan );
      auto ses = db->start_undo_session();
      {
         auto inner = db->start_undo_session();
         fund( nathan_id, HONZON_NATIVE_ASSET, 42 );
         inner.merge();
      }
      BOOST_CHECK( native_balance( nathan_id ) == 42 );
      ses.undo();

      BOOST_CHECK( native_balance( nathan_id ) == 0 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transactional_scope_rolls_back_virtual_operations )
{
   try {
      ACTOR( nathan );
      db->clear_applied_operations();

      BOOST_CHECK_THROW( with_transactional_scope( *db, [&]() {
         fund( nathan_id, HONZON_NATIVE_ASSET, 10 );
         db->push_applied_operation( transfer_loan_operation( nathan_id, HONZON_LOANS_ACCOUNT ) );
         FC_ASSERT( false, "abort" );
      }), fc::exception );

      BOOST_CHECK( native_balance( nathan_id ) == 0 );
      BOOST_CHECK( db->get_applied_operations().empty() );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( transaction_is_atomic )
{
   try {
      ACTORS( (alice)(bob) );
      fund( alice_id, HONZON_NATIVE_ASSET, 100 );

      transfer_operation good;
      good.from = alice_id;
      good.to = bob_id;
      good.asset_id = HONZON_NATIVE_ASSET;
      good.amount = 60;

      transfer_operation bad = good;
      bad.amount = 60;

      trx.operations = { good, bad };
      HONZON_REQUIRE_THROW( PUSH_TX( db.get(), trx ), insufficient_balance );
      trx.clear();

      BOOST_CHECK( native_balance( alice_id ) == 100 );
      BOOST_CHECK( native_balance( bob_id ) == 0 );

      trx.operations = { good };
      auto ptx = PUSH_TX( db.get(), trx );
      trx.clear();
      BOOST_CHECK_EQUAL( ptx.operation_results.size(), 1u );
      BOOST_CHECK( native_balance( alice_id ) == 40 );
      BOOST_CHECK( native_balance( bob_id ) == 60 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( virtual_operations_cannot_be_pushed )
{
   try {
      HONZON_REQUIRE_THROW( push_op( shutdown_operation( 1 ) ), fc::exception );
      BOOST_CHECK( !db->is_shutdown() );

      trx.clear();
      HONZON_REQUIRE_THROW( PUSH_TX( db.get(), trx ), fc::exception );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( generate_block_advances_head )
{
   try {
      const block_number_type head = db->head_block_num();
      const time_point_sec time = db->head_block_time();
      const uint8_t interval = db->get_chain_parameters().block_interval;

      block_number_type signalled = 0;
      db->applied_block.connect( [&signalled]( block_number_type n ) { signalled = n; } );

      generate_block();
      BOOST_CHECK_EQUAL( db->head_block_num(), head + 1 );
      BOOST_CHECK( db->head_block_time() == time + interval );
      BOOST_CHECK_EQUAL( signalled, head );

      generate_blocks( 9 );
      BOOST_CHECK_EQUAL( db->head_block_num(), head + 10 );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( genesis_initialization )
{
   try {
      BOOST_CHECK( get_account( HONZON_LOANS_ACCOUNT_NAME ).id == HONZON_LOANS_ACCOUNT );
      BOOST_CHECK( get_account( HONZON_CDP_TREASURY_ACCOUNT_NAME ).id == HONZON_CDP_TREASURY_ACCOUNT );
      BOOST_CHECK( get_account( HONZON_TREASURY_ACCOUNT_NAME ).id == HONZON_TREASURY_ACCOUNT );
      BOOST_CHECK( db->get_asset_by_symbol( HONZON_STABLE_SYMBOL ).id == HONZON_STABLE_ASSET );
      BOOST_REQUIRE( db->get_collateral_price().valid() );
      BOOST_CHECK( db->get_collateral_price()->is_one() );
      BOOST_CHECK( !db->is_shutdown() );

      genesis_state_type genesis = create_example_genesis();
      genesis.validate();

      genesis.initial_accounts.emplace_back( "alice" );
      genesis.initial_accounts.emplace_back( "alice" );
      BOOST_CHECK_THROW( genesis.validate(), fc::exception );

      genesis = create_example_genesis();
      genesis_state_type::initial_account_balances_type balance;
      balance.owner_name = "nobody";
      balance.asset_symbol = HONZON_NATIVE_SYMBOL;
      balance.amount = 1;
      genesis.initial_account_balances.push_back( balance );
      BOOST_CHECK_THROW( genesis.validate(), fc::exception );

      genesis = create_example_genesis();
      genesis.initial_timestamp += 1;
      BOOST_CHECK_THROW( genesis.validate(), fc::exception );

      // genesis survives a trip through json
      genesis = create_example_genesis();
      genesis.initial_accounts.emplace_back( "alice" );
      balance.owner_name = "alice";
      balance.amount = 1000;
      genesis.initial_account_balances.push_back( balance );
      const auto parsed = fc::json::from_string( fc::json::to_string( genesis ) ).as<genesis_state_type>();
      parsed.validate();
      BOOST_CHECK_EQUAL( parsed.initial_accounts.size(), 1u );
      BOOST_REQUIRE_EQUAL( parsed.initial_account_balances.size(), 1u );
      BOOST_CHECK( parsed.initial_account_balances[0].amount == 1000 );
      BOOST_REQUIRE( parsed.initial_collateral_params.valid() );
      BOOST_CHECK( *parsed.initial_collateral_params->liquidation_ratio == ratio_type::from_rational( 3, 2 ) );

      database other;
      other.open( parsed );
      BOOST_CHECK( other.get_balance( other.get_account_by_name( "alice" ).id, HONZON_NATIVE_ASSET ) == 1000 );
      verify_invariants( other );
   } catch ( const fc::exception& e ) {
      edump( (e.to_detail_string()) );
      throw;
   }
}

BOOST_AUTO_TEST_SUITE_END()
