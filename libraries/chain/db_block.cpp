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

#include <honzon/chain/global_property_object.hpp>
#include <honzon/chain/evaluator.hpp>
#include <honzon/chain/exceptions.hpp>
#include <honzon/chain/transaction_evaluation_state.hpp>

namespace honzon { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   trx.validate();

   processed_transaction ptrx( trx );
   transaction_evaluation_state eval_state( this );
   eval_state._trx = &ptrx;

   auto session = _undo_db.start_undo_session();
   detail::applied_operations_restorer restorer( *this );

   for( const auto& op : ptrx.operations )
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );

   restorer.release();
   session.merge();

   ptrx.operation_results = std::move( eval_state.operation_results );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   HONZON_ASSERT( i_which >= 0 && u_which < _operation_evaluators.size() && _operation_evaluators[u_which],
                  unknown_operation, "No registered evaluator for operation ${w}", ("w",i_which) );

   auto op_session = _undo_db.start_undo_session();
   detail::applied_operations_restorer restorer( *this );

   push_applied_operation( op );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[u_which];
   operation_result result = eval->evaluate( eval_state, op, true );

   restorer.release();
   op_session.merge();
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back( op );
   return _applied_ops.size() - 1;
}

void database::generate_block()
{ try {
   FC_ASSERT( _opened, "database is not open" );

   on_finalize();
   applied_block( head_block_num() );

   const auto& dgp = get_dynamic_global_properties();
   const uint32_t interval = get_chain_parameters().block_interval;
   modify( dgp, [interval]( dynamic_global_property_object& p ) {
      p.head_block_number += 1;
      p.time += interval;
   });

   on_initialize();
} FC_CAPTURE_AND_RETHROW() }

void database::generate_blocks( uint32_t block_count )
{
   for( uint32_t i = 0; i < block_count; ++i )
      generate_block();
}

void database::on_initialize()
{
   dlog( "initializing block ${n}", ("n",head_block_num()) );
   cdp_engine_on_initialize();
}

void database::on_finalize()
{
   dlog( "finalizing block ${n}", ("n",head_block_num()) );
   sweep_ended_auctions( head_block_num() );
   cdp_engine_on_finalize();
   offset_surplus_and_debit();
}

} }
