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

#include <honzon/chain/protocol/types.hpp>

namespace honzon { namespace chain {

   bool amount_in_range( const amount_type& a )
   {
      static const amount_type upper = (amount_type(1) << 127) - 1;
      static const amount_type lower = -(amount_type(1) << 127);
      return a >= lower && a <= upper;
   }

   const balance_type& max_balance()
   {
      static const balance_type m = std::numeric_limits<balance_type>::max();
      return m;
   }

} } // honzon::chain

namespace fc
{
    void to_variant( const honzon::chain::balance_type& var,  fc::variant& vo )
    {
       vo = var.str();
    }

    void from_variant( const fc::variant& var,  honzon::chain::balance_type& vo )
    { try {
       if( var.is_string() )
       {
          const auto& s = var.get_string();
          FC_ASSERT( !s.empty() && s.find_first_not_of("0123456789") == std::string::npos,
                     "invalid balance ${s}", ("s",s) );
          vo = honzon::chain::balance_type( s );
       }
       else
          vo = honzon::chain::balance_type( var.as_uint64() );
    } FC_CAPTURE_AND_RETHROW( (var) ) }

    void to_variant( const honzon::chain::amount_type& var,  fc::variant& vo )
    {
       vo = var.str();
    }

    void from_variant( const fc::variant& var,  honzon::chain::amount_type& vo )
    { try {
       if( var.is_string() )
       {
          const auto& s = var.get_string();
          auto digits = ( !s.empty() && s[0] == '-' ) ? s.substr(1) : s;
          FC_ASSERT( !digits.empty() && digits.find_first_not_of("0123456789") == std::string::npos,
                     "invalid amount ${s}", ("s",s) );
          vo = honzon::chain::amount_type( s );
       }
       else
          vo = honzon::chain::amount_type( var.as_int64() );
       FC_ASSERT( honzon::chain::amount_in_range( vo ), "amount out of range", ("amount",var) );
    } FC_CAPTURE_AND_RETHROW( (var) ) }
}
