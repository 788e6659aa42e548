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

#include <honzon/chain/honzon_evaluator.hpp>
#include <honzon/chain/account_object.hpp>
#include <honzon/chain/loan_object.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result adjust_loan_evaluator::do_evaluate( const adjust_loan_operation& o )
{ try {
   // after shutdown positions may only be unwound by settlement
   HONZON_ASSERT( o.debit_adjustment == 0 || !db().is_shutdown(), already_shutdown,
                  "debit cannot change after shutdown", ("owner",o.owner)("debit",o.debit_adjustment) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result adjust_loan_evaluator::do_apply( const adjust_loan_operation& o )
{ try {
   db().adjust_position( o.owner, o.collateral_adjustment, o.debit_adjustment );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result adjust_loan_by_debit_value_evaluator::do_evaluate( const adjust_loan_by_debit_value_operation& o )
{ try {
   HONZON_ASSERT( o.debit_value_adjustment == 0 || !db().is_shutdown(), already_shutdown,
                  "debit cannot change after shutdown", ("owner",o.owner)("debit_value",o.debit_value_adjustment) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result adjust_loan_by_debit_value_evaluator::do_apply( const adjust_loan_by_debit_value_operation& o )
{ try {
   db().adjust_position_by_debit_value( o.owner, o.collateral_adjustment, o.debit_value_adjustment );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result transfer_debit_evaluator::do_evaluate( const transfer_debit_operation& o )
{ try {
   const database& d = db();
   HONZON_ASSERT( !d.is_shutdown(), already_shutdown, "debit cannot change after shutdown", ("owner",o.owner) );
   const balance_type debit = d.get_position( o.owner ).second;
   HONZON_ASSERT( debit >= o.amount, no_debit_value,
                  "${who} has ${d} debit, ${a} requested", ("who",o.owner)("d",debit)("a",o.amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result transfer_debit_evaluator::do_apply( const transfer_debit_operation& o )
{ try {
   db().transfer_debit( o.owner, o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result transfer_loan_from_evaluator::do_evaluate( const transfer_loan_from_operation& o )
{ try {
   const database& d = db();
   HONZON_ASSERT( !d.is_shutdown(), already_shutdown, "loans cannot move after shutdown", ("from",o.from)("to",o.to) );

   const auto& idx = d.get_index_type<loan_authorization_index>().indices().get<by_authorizer_authorizee>();
   HONZON_ASSERT( idx.find( boost::make_tuple( o.from, o.to ) ) != idx.end(), no_permission,
                  "${from} has not authorized ${to}", ("from",o.from)("to",o.to) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result transfer_loan_from_evaluator::do_apply( const transfer_loan_from_operation& o )
{ try {
   db().transfer_loan( o.from, o.to );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result authorize_loan_evaluator::do_evaluate( const authorize_loan_operation& o )
{ try {
   const database& d = db();
   o.authorizee(d);

   const auto& idx = d.get_index_type<loan_authorization_index>().indices().get<by_authorizer_authorizee>();
   HONZON_ASSERT( idx.find( boost::make_tuple( o.authorizer, o.authorizee ) ) == idx.end(), already_authorized,
                  "${a} already authorized ${b}", ("a",o.authorizer)("b",o.authorizee) );

   auto range = idx.equal_range( boost::make_tuple( o.authorizer ) );
   FC_ASSERT( std::distance( range.first, range.second ) < HONZON_MAX_AUTHORIZATIONS_PER_ACCOUNT,
              "${a} reached the maximum number of loan authorizations", ("a",o.authorizer) );

   deposit = d.get_chain_parameters().deposit_per_authorization;
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type authorize_loan_evaluator::do_apply( const authorize_loan_operation& o )
{ try {
   database& d = db();
   d.assets().hold( loan_authorization_hold, o.authorizer, HONZON_NATIVE_ASSET, deposit );

   const auto& authorization = d.create<loan_authorization_object>( [&]( loan_authorization_object& a ) {
      a.authorizer = o.authorizer;
      a.authorizee = o.authorizee;
      a.deposit = deposit;
   });
   d.push_applied_operation( loan_authorization_operation( o.authorizer, o.authorizee ) );
   return authorization.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result unauthorize_loan_evaluator::do_evaluate( const unauthorize_loan_operation& o )
{ try {
   const auto& idx = db().get_index_type<loan_authorization_index>().indices().get<by_authorizer_authorizee>();
   auto itr = idx.find( boost::make_tuple( o.authorizer, o.authorizee ) );
   HONZON_ASSERT( itr != idx.end(), authorization_not_exists,
                  "${a} has not authorized ${b}", ("a",o.authorizer)("b",o.authorizee) );
   authorization = &*itr;
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result unauthorize_loan_evaluator::do_apply( const unauthorize_loan_operation& o )
{ try {
   database& d = db();
   d.assets().release( loan_authorization_hold, o.authorizer, HONZON_NATIVE_ASSET, authorization->deposit,
                       exact_precision );
   d.remove( *authorization );
   d.push_applied_operation( loan_unauthorization_operation( o.authorizer, o.authorizee ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result unauthorize_all_loans_evaluator::do_evaluate( const unauthorize_all_loans_operation& o )
{
   return void_result();
}

void_result unauthorize_all_loans_evaluator::do_apply( const unauthorize_all_loans_operation& o )
{ try {
   database& d = db();
   const auto& idx = d.get_index_type<loan_authorization_index>().indices().get<by_authorizer_authorizee>();

   vector<const loan_authorization_object*> authorizations;
   auto range = idx.equal_range( boost::make_tuple( o.authorizer ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      authorizations.push_back( &*itr );

   for( const loan_authorization_object* a : authorizations )
   {
      d.assets().release( loan_authorization_hold, o.authorizer, HONZON_NATIVE_ASSET, a->deposit, exact_precision );
      d.remove( *a );
   }
   d.push_applied_operation( loan_unauthorization_all_operation( o.authorizer ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
