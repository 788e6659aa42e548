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
#include <honzon/chain/exceptions.hpp>

namespace honzon { namespace chain {

   /**
    *  Checked arithmetic on balances. Failures surface as chain exceptions
    *  instead of the std::overflow_error thrown by the checked backend.
    */

   inline balance_type checked_add( const balance_type& a, const balance_type& b )
   {
      HONZON_ASSERT( max_balance() - a >= b, arithmetic_overflow, "${a} + ${b} overflows", ("a",a)("b",b) );
      return a + b;
   }

   inline balance_type checked_sub( const balance_type& a, const balance_type& b )
   {
      HONZON_ASSERT( a >= b, arithmetic_underflow, "${a} - ${b} underflows", ("a",a)("b",b) );
      return a - b;
   }

   inline balance_type saturating_add( const balance_type& a, const balance_type& b )
   {
      return max_balance() - a >= b ? balance_type( a + b ) : max_balance();
   }

   inline balance_type saturating_sub( const balance_type& a, const balance_type& b )
   {
      return a > b ? balance_type( a - b ) : balance_type( 0 );
   }

   /// magnitude of a signed amount
   inline balance_type amount_abs( const amount_type& a )
   {
      return a < 0 ? balance_type( amount_type( -a ) ) : balance_type( a );
   }

   /// signed amount equal to @ref b, throws amount_convert_failed when out of the signed 128 bit range
   inline amount_type to_amount( const balance_type& b )
   {
      amount_type a( b );
      HONZON_ASSERT( amount_in_range( a ), amount_convert_failed, "${b} does not fit a signed amount", ("b",b) );
      return a;
   }

   /// @ref a + @ref delta, throws arithmetic_overflow or arithmetic_underflow
   inline balance_type apply_delta( const balance_type& a, const amount_type& delta )
   {
      if( delta < 0 )
         return checked_sub( a, amount_abs( delta ) );
      return checked_add( a, amount_abs( delta ) );
   }

} } // honzon::chain
