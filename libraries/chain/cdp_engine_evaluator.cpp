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

#include <honzon/chain/cdp_engine_evaluator.hpp>
#include <honzon/chain/account_object.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result set_collateral_params_evaluator::do_evaluate( const set_collateral_params_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_collateral_params_evaluator::do_apply( const set_collateral_params_operation& o )
{ try {
   db().set_collateral_params( o.interest_rate_per_sec, o.liquidation_ratio, o.liquidation_penalty,
                               o.required_collateral_ratio, o.maximum_total_debit_value );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result liquidate_cdp_evaluator::do_evaluate( const liquidate_cdp_operation& o )
{ try {
   o.owner( db() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result liquidate_cdp_evaluator::do_apply( const liquidate_cdp_operation& o )
{ try {
   db().liquidate_unsafe_cdp( o.owner );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result settle_cdp_evaluator::do_evaluate( const settle_cdp_operation& o )
{ try {
   o.owner( db() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result settle_cdp_evaluator::do_apply( const settle_cdp_operation& o )
{ try {
   db().settle_cdp_has_debit( o.owner );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
