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

#include <honzon/chain/cdp_treasury_evaluator.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result set_expected_collateral_auction_size_evaluator::do_evaluate( const set_expected_collateral_auction_size_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_expected_collateral_auction_size_evaluator::do_apply( const set_expected_collateral_auction_size_operation& o )
{ try {
   db().set_expected_collateral_auction_size( o.size );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_debit_offset_buffer_evaluator::do_evaluate( const set_debit_offset_buffer_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_debit_offset_buffer_evaluator::do_apply( const set_debit_offset_buffer_operation& o )
{ try {
   db().set_debit_offset_buffer( o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result extract_surplus_to_treasury_evaluator::do_evaluate( const extract_surplus_to_treasury_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result extract_surplus_to_treasury_evaluator::do_apply( const extract_surplus_to_treasury_operation& o )
{ try {
   db().extract_surplus_to_treasury( o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_collateral_evaluator::do_evaluate( const auction_collateral_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_collateral_evaluator::do_apply( const auction_collateral_operation& o )
{ try {
   // proceeds go back to the treasury
   db().create_collateral_auctions( o.amount, o.target, HONZON_CDP_TREASURY_ACCOUNT, o.split );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
