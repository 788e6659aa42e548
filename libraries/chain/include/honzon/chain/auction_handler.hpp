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

#pragma once
#include <honzon/chain/protocol/types.hpp>

#include <functional>

namespace honzon { namespace chain {

   /**
    *  Answer of an auction policy to a new bid. When @ref change_end is set the
    *  end of the auction moves to @ref new_end, an empty @ref new_end removes it.
    */
   struct auction_bid_outcome
   {
      bool                          accept_bid = false;
      bool                          change_end = false;
      optional<block_number_type>   new_end;
   };

   /**
    *  @brief callbacks through which the generic auction module consults the policy owning an auction
    *
    *  on_new_bid( now, id, new_bid, last_bid ) decides whether a bid is taken and
    *  how it moves the end of the auction. on_auction_ended( id, winner ) settles
    *  an auction removed by the end of block sweep.
    */
   struct auction_handler
   {
      std::function< auction_bid_outcome( block_number_type, auction_id_type,
                                          const auction_bid_type&, const optional<auction_bid_type>& ) > on_new_bid;
      std::function< void( auction_id_type, const optional<auction_bid_type>& ) >                      on_auction_ended;
   };

} } // honzon::chain
