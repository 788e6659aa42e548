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

#include <honzon/chain/emergency_shutdown_evaluator.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result emergency_shutdown_evaluator::do_evaluate( const emergency_shutdown_operation& o )
{ try {
   const database& d = db();
   verify_origin( d.get_chain_parameters().shutdown_origin );
   HONZON_ASSERT( !d.is_shutdown(), already_shutdown, "shutdown already happened", ("authority",o.authority) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result emergency_shutdown_evaluator::do_apply( const emergency_shutdown_operation& o )
{ try {
   db().emergency_shutdown();
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result open_collateral_refund_evaluator::do_evaluate( const open_collateral_refund_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().shutdown_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result open_collateral_refund_evaluator::do_apply( const open_collateral_refund_operation& o )
{ try {
   db().open_collateral_refund();
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result refund_collaterals_evaluator::do_evaluate( const refund_collaterals_operation& o )
{ try {
   HONZON_ASSERT( db().get_shutdown_state().can_refund, can_not_refund, "collateral refund is not open",
                  ("owner",o.owner) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result refund_collaterals_evaluator::do_apply( const refund_collaterals_operation& o )
{ try {
   db().refund_collaterals( o.owner, o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
