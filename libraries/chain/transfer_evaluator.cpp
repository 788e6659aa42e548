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

#include <honzon/chain/transfer_evaluator.hpp>
#include <honzon/chain/account_object.hpp>
#include <honzon/chain/asset_object.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result transfer_evaluator::do_evaluate( const transfer_operation& op )
{ try {
   const database& d = db();

   const account_object& from_account = op.from(d);
   const account_object& to_account   = op.to(d);
   const asset_object&   asset_type   = op.asset_id(d);

   try {
      const balance_type balance = d.get_balance( op.from, op.asset_id );
      HONZON_ASSERT( balance >= op.amount, insufficient_balance,
                     "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from account '${a}' to '${t}'",
                     ("a",from_account.name)("t",to_account.name)("total_transfer",op.amount)("balance",balance) );

      return void_result();
   } FC_RETHROW_EXCEPTIONS( error, "Unable to transfer ${a} ${s} from ${f} to ${t}",
                            ("a",op.amount)("s",asset_type.symbol)("f",from_account.name)("t",to_account.name) );

} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result transfer_evaluator::do_apply( const transfer_operation& o )
{ try {
   db().assets().transfer( o.from, o.to, o.asset_id, o.amount );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result price_feed_publish_evaluator::do_evaluate( const price_feed_publish_operation& o )
{ try {
   const database& d = db();
   verify_origin( d.get_chain_parameters().oracle_origin );
   // the asset must exist
   o.asset_id(d);
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result price_feed_publish_evaluator::do_apply( const price_feed_publish_operation& o )
{ try {
   db().publish_price( o.asset_id, o.price );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
