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

namespace honzon { namespace chain {

   /**
    *  @brief unsigned fixed point number with 18 decimals
    *
    *  The inner value is an unsigned 128 bit integer equal to the number times 10^18.
    *  Products and quotients are computed on 256 bit intermediates and truncated
    *  toward zero. Saturating operations clamp to max_value() / zero, checked
    *  operations return an empty optional instead.
    */
   class fixed_point
   {
      public:
         typedef boost::multiprecision::uint128_t inner_type;
         typedef boost::multiprecision::uint256_t wide_type;

         fixed_point(){}

         static const inner_type& accuracy();

         static fixed_point from_inner( const inner_type& v );
         static fixed_point zero() { return fixed_point(); }
         static fixed_point one();
         static fixed_point max_value();

         /// n, saturating
         static fixed_point from_integer( const balance_type& n );
         /// n / d, saturating; d must not be zero
         static fixed_point from_rational( const balance_type& n, const balance_type& d );
         static optional<fixed_point> checked_from_rational( const balance_type& n, const balance_type& d );

         fixed_point saturating_add( const fixed_point& other )const;
         fixed_point saturating_sub( const fixed_point& other )const;
         fixed_point saturating_mul( const fixed_point& other )const;
         fixed_point saturating_pow( uint64_t exp )const;

         optional<fixed_point> checked_add( const fixed_point& other )const;
         optional<fixed_point> checked_mul( const fixed_point& other )const;
         optional<fixed_point> checked_div( const fixed_point& other )const;
         optional<fixed_point> reciprocal()const;

         /// self * n truncated to an integer, clamped to the balance range
         balance_type saturating_mul_int( const balance_type& n )const;
         /// n + self * n, clamped to the balance range
         balance_type saturating_mul_acc_int( const balance_type& n )const;

         bool is_zero()const { return _inner == 0; }
         bool is_one()const  { return _inner == accuracy(); }
         const inner_type& into_inner()const { return _inner; }

         /// decimal representation, e.g. "1.5" or "0.000000000000000001"
         std::string to_string()const;
         static fixed_point from_string( const std::string& s );

         friend bool operator == ( const fixed_point& a, const fixed_point& b ) { return a._inner == b._inner; }
         friend bool operator != ( const fixed_point& a, const fixed_point& b ) { return a._inner != b._inner; }
         friend bool operator <  ( const fixed_point& a, const fixed_point& b ) { return a._inner <  b._inner; }
         friend bool operator <= ( const fixed_point& a, const fixed_point& b ) { return a._inner <= b._inner; }
         friend bool operator >  ( const fixed_point& a, const fixed_point& b ) { return a._inner >  b._inner; }
         friend bool operator >= ( const fixed_point& a, const fixed_point& b ) { return a._inner >= b._inner; }

      private:
         inner_type _inner = 0;
   };

   typedef fixed_point rate_type;
   typedef fixed_point ratio_type;
   typedef fixed_point price_type;
   typedef fixed_point exchange_rate_type;

   /// a * n / d on a 256 bit intermediate truncated toward zero, clamped to the balance range; d must not be zero
   balance_type saturating_mul_rational( const balance_type& a, const balance_type& n, const balance_type& d );

} } // honzon::chain

namespace fc
{
    void to_variant( const honzon::chain::fixed_point& var,  fc::variant& vo );
    void from_variant( const fc::variant& var,  honzon::chain::fixed_point& vo );
}

FC_REFLECT_TYPENAME( honzon::chain::fixed_point )
