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

#include <honzon/chain/protocol/fixed_point.hpp>

namespace honzon { namespace chain {

namespace {

   const fixed_point::wide_type& max_inner()
   {
      static const fixed_point::wide_type m = (fixed_point::wide_type(1) << 128) - 1;
      return m;
   }

   fixed_point::inner_type clamp( const fixed_point::wide_type& w )
   {
      if( w > max_inner() )
         return fixed_point::inner_type( max_inner() );
      return fixed_point::inner_type( w );
   }

   balance_type clamp_balance( const fixed_point::wide_type& w )
   {
      if( w > max_inner() )
         return max_balance();
      return balance_type( w );
   }

}

const fixed_point::inner_type& fixed_point::accuracy()
{
   static const inner_type acc = boost::multiprecision::pow( inner_type(10), HONZON_FIXED_POINT_DECIMALS );
   return acc;
}

fixed_point fixed_point::from_inner( const inner_type& v )
{
   fixed_point r;
   r._inner = v;
   return r;
}

fixed_point fixed_point::one()
{
   return from_inner( accuracy() );
}

fixed_point fixed_point::max_value()
{
   return from_inner( inner_type( max_inner() ) );
}

fixed_point fixed_point::from_integer( const balance_type& n )
{
   return from_inner( clamp( wide_type(n) * wide_type(accuracy()) ) );
}

fixed_point fixed_point::from_rational( const balance_type& n, const balance_type& d )
{
   FC_ASSERT( d != 0, "fixed point division by zero", ("n",n) );
   return from_inner( clamp( wide_type(n) * wide_type(accuracy()) / wide_type(d) ) );
}

optional<fixed_point> fixed_point::checked_from_rational( const balance_type& n, const balance_type& d )
{
   if( d == 0 )
      return optional<fixed_point>();
   wide_type w = wide_type(n) * wide_type(accuracy()) / wide_type(d);
   if( w > max_inner() )
      return optional<fixed_point>();
   return from_inner( inner_type(w) );
}

fixed_point fixed_point::saturating_add( const fixed_point& other )const
{
   return from_inner( clamp( wide_type(_inner) + wide_type(other._inner) ) );
}

fixed_point fixed_point::saturating_sub( const fixed_point& other )const
{
   if( other._inner >= _inner )
      return zero();
   return from_inner( _inner - other._inner );
}

fixed_point fixed_point::saturating_mul( const fixed_point& other )const
{
   return from_inner( clamp( wide_type(_inner) * wide_type(other._inner) / wide_type(accuracy()) ) );
}

fixed_point fixed_point::saturating_pow( uint64_t exp )const
{
   fixed_point result = one();
   fixed_point base = *this;
   while( exp > 0 )
   {
      if( exp & 1 )
         result = result.saturating_mul( base );
      exp >>= 1;
      if( exp > 0 )
         base = base.saturating_mul( base );
   }
   return result;
}

optional<fixed_point> fixed_point::checked_add( const fixed_point& other )const
{
   wide_type w = wide_type(_inner) + wide_type(other._inner);
   if( w > max_inner() )
      return optional<fixed_point>();
   return from_inner( inner_type(w) );
}

optional<fixed_point> fixed_point::checked_mul( const fixed_point& other )const
{
   wide_type w = wide_type(_inner) * wide_type(other._inner) / wide_type(accuracy());
   if( w > max_inner() )
      return optional<fixed_point>();
   return from_inner( inner_type(w) );
}

optional<fixed_point> fixed_point::checked_div( const fixed_point& other )const
{
   if( other._inner == 0 )
      return optional<fixed_point>();
   wide_type w = wide_type(_inner) * wide_type(accuracy()) / wide_type(other._inner);
   if( w > max_inner() )
      return optional<fixed_point>();
   return from_inner( inner_type(w) );
}

optional<fixed_point> fixed_point::reciprocal()const
{
   return one().checked_div( *this );
}

balance_type fixed_point::saturating_mul_int( const balance_type& n )const
{
   return clamp_balance( wide_type(_inner) * wide_type(n) / wide_type(accuracy()) );
}

balance_type fixed_point::saturating_mul_acc_int( const balance_type& n )const
{
   return clamp_balance( wide_type(n) + wide_type(_inner) * wide_type(n) / wide_type(accuracy()) );
}

std::string fixed_point::to_string()const
{
   inner_type whole = _inner / accuracy();
   inner_type frac  = _inner % accuracy();
   std::string result = whole.str();
   if( frac == 0 )
      return result;
   std::string digits = frac.str();
   digits.insert( 0, HONZON_FIXED_POINT_DECIMALS - digits.size(), '0' );
   digits.erase( digits.find_last_not_of('0') + 1 );
   return result + "." + digits;
}

fixed_point fixed_point::from_string( const std::string& s )
{ try {
   auto dot = s.find('.');
   std::string whole = s.substr( 0, dot );
   std::string frac  = dot == std::string::npos ? std::string() : s.substr( dot + 1 );
   FC_ASSERT( !whole.empty() && whole.find_first_not_of("0123456789") == std::string::npos );
   FC_ASSERT( frac.find_first_not_of("0123456789") == std::string::npos );
   FC_ASSERT( frac.size() <= HONZON_FIXED_POINT_DECIMALS, "too many decimals" );
   frac.append( HONZON_FIXED_POINT_DECIMALS - frac.size(), '0' );

   wide_type w = wide_type( whole ) * wide_type( accuracy() ) + wide_type( frac );
   FC_ASSERT( w <= max_inner(), "fixed point overflow" );
   return from_inner( inner_type(w) );
} FC_CAPTURE_AND_RETHROW( (s) ) }

balance_type saturating_mul_rational( const balance_type& a, const balance_type& n, const balance_type& d )
{
   FC_ASSERT( d != 0, "division by zero", ("a",a)("n",n) );
   typedef fixed_point::wide_type wide_type;
   return clamp_balance( wide_type(a) * wide_type(n) / wide_type(d) );
}

} } // honzon::chain

namespace fc
{
    void to_variant( const honzon::chain::fixed_point& var,  fc::variant& vo )
    {
       vo = var.to_string();
    }

    void from_variant( const fc::variant& var,  honzon::chain::fixed_point& vo )
    {
       if( var.is_string() )
          vo = honzon::chain::fixed_point::from_string( var.get_string() );
       else
          vo = honzon::chain::fixed_point::from_integer( honzon::chain::balance_type( var.as_uint64() ) );
    }
}
