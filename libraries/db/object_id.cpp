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

#include <honzon/db/object_id.hpp>

namespace fc
{
   void to_variant( const honzon::db::object_id_type& var,  fc::variant& vo )
   {
      vo = std::string( var );
   }

   void from_variant( const fc::variant& var,  honzon::db::object_id_type& vo )
   { try {
      vo.number = 0;
      const auto& s = var.get_string();
      auto first_dot = s.find('.');
      auto second_dot = s.find('.',first_dot+1);
      FC_ASSERT( first_dot != std::string::npos && second_dot != std::string::npos );
      FC_ASSERT( first_dot != 0 && first_dot != second_dot-1 && second_dot != s.size()-1 );
      vo.number = fc::to_uint64(s.substr( second_dot+1 ));
      FC_ASSERT( vo.number <= HONZON_DB_MAX_INSTANCE_ID );
      auto space_id = fc::to_uint64( s.substr( 0, first_dot ) );
      FC_ASSERT( space_id <= 0xff );
      auto type_id =  fc::to_uint64( s.substr( first_dot+1, second_dot-first_dot-1 ) );
      FC_ASSERT( type_id <= 0xff );
      vo.number |= (space_id << 56) | (type_id << 48);
   } FC_CAPTURE_AND_RETHROW( (var) ) }
}
