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

#include <honzon/chain/issuance_buffer_evaluator.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result fund_issuance_buffer_evaluator::do_evaluate( const fund_issuance_buffer_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fund_issuance_buffer_evaluator::do_apply( const fund_issuance_buffer_operation& o )
{ try {
   db().fund_issuance_buffer( o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result defund_issuance_buffer_evaluator::do_evaluate( const defund_issuance_buffer_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result defund_issuance_buffer_evaluator::do_apply( const defund_issuance_buffer_operation& o )
{ try {
   db().defund_issuance_buffer( o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_issuance_discount_evaluator::do_evaluate( const set_issuance_discount_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_issuance_discount_evaluator::do_apply( const set_issuance_discount_operation& o )
{ try {
   db().set_issuance_discount( o.discount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_issuance_quota_evaluator::do_evaluate( const set_issuance_quota_operation& o )
{ try {
   verify_origin( db().get_chain_parameters().update_origin );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result set_issuance_quota_evaluator::do_apply( const set_issuance_quota_operation& o )
{ try {
   db().set_issuance_quota( o.quota );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
