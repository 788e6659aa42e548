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

#include <honzon/chain/auction_object.hpp>

namespace honzon { namespace chain {

price_type collateral_auction_object::target_price()const
{
   auto price = price_type::checked_from_rational( target, initial_amount );
   if( !price.valid() )
      return price_type::max_value();
   return *price;
}

bool collateral_auction_object::in_reverse_stage( const price_type& price_per_unit )const
{
   return !always_forward() && price_per_unit >= target_price();
}

balance_type collateral_auction_object::payment_amount( const balance_type& bid_value )const
{
   if( always_forward() )
      return saturating_mul_rational( bid_value, amount, 1 );
   if( in_reverse_stage( price_per_unit( bid_value ) ) )
      return target;
   // bid / initial_amount per unit, exact so that a full lot pays the bid itself
   return saturating_mul_rational( bid_value, amount, initial_amount );
}

price_type collateral_auction_object::price_per_unit( const balance_type& bid_value )const
{
   if( always_forward() )
      return price_type::from_rational( bid_value, 1 );
   auto price = price_type::checked_from_rational( bid_value, initial_amount );
   if( !price.valid() )
      return price_type::max_value();
   return *price;
}

} } // honzon::chain
