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

#include <honzon/chain/auction_evaluator.hpp>
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

void_result auction_bid_evaluator::do_evaluate( const auction_bid_operation& o )
{ try {
   db().get_auction( o.auction_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_bid_evaluator::do_apply( const auction_bid_operation& o )
{ try {
   db().place_auction_bid( o.bidder, o.auction_id, o.value );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result cancel_collateral_auction_evaluator::do_evaluate( const cancel_collateral_auction_operation& o )
{ try {
   const database& d = db();
   HONZON_ASSERT( d.is_shutdown(), must_after_shutdown, "auctions can only be cancelled after shutdown",
                  ("id",o.auction_id) );
   d.get_collateral_auction( o.auction_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result cancel_collateral_auction_evaluator::do_apply( const cancel_collateral_auction_operation& o )
{ try {
   db().cancel_collateral_auction( o.auction_id );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // honzon::chain
