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
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>
#include <fc/string.hpp>

#include <functional>
#include <memory>

#define HONZON_DB_MAX_INSTANCE_ID  (uint64_t(-1)>>16)

namespace honzon { namespace db {
   using  std::shared_ptr;
   using  std::unique_ptr;
   using  std::vector;
   using  fc::variant;

   class object;
   class object_database;

   /**
    *  Packs space, type and instance into a single 64 bit number so that
    *  ids sort first by space, then by type, then by instance.
    */
   struct object_id_type
   {
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> 48 == 0, "instance overflow", ("instance",i) );
         number = (uint64_t(s)<<56) | (uint64_t(t)<<48) | i;
      }
      object_id_type(){ number = 0; }

      uint8_t  space()const       { return number >> 56;              }
      uint8_t  type()const        { return number >> 48 & 0x00ff;     }
      uint16_t space_type()const  { return number >> 48;              }
      uint64_t instance()const    { return number & HONZON_DB_MAX_INSTANCE_ID; }
      bool     is_null()const     { return number == 0; }
      explicit operator uint64_t()const { return number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator < ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool operator > ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      object_id_type& operator++(int) { ++number; return *this; }
      object_id_type& operator++()    { ++number; return *this; }

      friend object_id_type operator+(const object_id_type& a, int delta ) {
         return object_id_type( a.space(), a.type(), a.instance() + delta );
      }
      friend size_t hash_value( object_id_type v ) { return std::hash<uint64_t>()(v.number); }

      template< typename T >
      bool is() const
      {
         return (number >> 48) == ((uint64_t(T::space_id) << 8) | uint64_t(T::type_id));
      }

      template< typename T >
      T as() const
      {
         FC_ASSERT( is<T>() );
         return T( *this );
      }

      explicit operator std::string() const
      {
          return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number;
   };

   template<uint8_t SpaceID, uint8_t TypeID, typename T = object>
   struct object_id
   {
      typedef T type;
      static const uint8_t space_id = SpaceID;
      static const uint8_t type_id = TypeID;

      object_id(){}
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (i >> 48) == 0 );
      }
      object_id( object_id_type id ):instance(id.instance())
      {
      }

      friend object_id operator+(const object_id a, int64_t delta ) { return object_id( uint64_t(a.instance+delta) ); }

      operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance ); }
      explicit operator uint64_t()const { return object_id_type( *this ).number; }

      template<typename DB>
      const T& operator()(const DB& db)const { return db.get(*this); }

      friend bool  operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool  operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool  operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool  operator != ( const object_id_type& a, const object_id& b ) { return a != object_id_type(b); }
      friend bool  operator == ( const object_id& b, const object_id_type& a ) { return a == object_id_type(b); }
      friend bool  operator != ( const object_id& b, const object_id_type& a ) { return a != object_id_type(b); }

      friend bool  operator < ( const object_id& a, const object_id& b ) { return a.instance < b.instance; }
      friend bool  operator > ( const object_id& a, const object_id& b ) { return a.instance > b.instance; }

      friend size_t hash_value( object_id v ) { return std::hash<uint64_t>()(v.instance); }

      uint64_t instance = 0;
   };

} } // honzon::db

FC_REFLECT( honzon::db::object_id_type, (number) )

namespace fc {

   void to_variant( const honzon::db::object_id_type& var,  fc::variant& vo );
   void from_variant( const fc::variant& var,  honzon::db::object_id_type& vo );

   template<uint8_t SpaceID, uint8_t TypeID, typename T>
   void to_variant( const honzon::db::object_id<SpaceID,TypeID,T>& var,  fc::variant& vo )
   {
      vo = std::string( honzon::db::object_id_type( var ) );
   }

   template<uint8_t SpaceID, uint8_t TypeID, typename T>
   void from_variant( const fc::variant& var,  honzon::db::object_id<SpaceID,TypeID,T>& vo )
   { try {
      const auto& s = var.get_string();
      auto first_dot = s.find('.');
      auto second_dot = s.find('.',first_dot+1);
      FC_ASSERT( first_dot != std::string::npos && second_dot != std::string::npos );
      FC_ASSERT( std::stoi(s.substr(0,first_dot)) == SpaceID &&
                 std::stoi(s.substr(first_dot+1,second_dot-first_dot-1)) == TypeID,
                 "Space.Type.0 (${SpaceID}.${TypeID}.0) doesn't match expected value ${type}",
                 ("TypeID",TypeID)("SpaceID",SpaceID)("type",s) );
      vo.instance = fc::to_uint64(s.substr( second_dot+1 ));
   } FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
   template <> struct hash<honzon::db::object_id_type>
   {
      size_t operator()(const honzon::db::object_id_type& x) const
      {
         return std::hash<uint64_t>()(x.number);
      }
   };
}
