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
#include <honzon/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace honzon { namespace chain {

   /**
    *  @brief collateral locked by an account and the debit issued against it
    *  @ingroup object
    *  @ingroup implementation
    *
    *  A position exists only while one of its fields is non-zero. Positions are
    *  written exclusively by the loans functions of the database.
    */
   class position_object : public abstract_object<position_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_position_object_type;

         account_id_type   owner;
         balance_type      collateral;
         balance_type      debit;

         bool is_empty()const { return collateral == 0 && debit == 0; }
   };

   /**
    *  @brief sum of every live position
    *  @ingroup object
    *  @ingroup implementation
    */
   class total_positions_object : public abstract_object<total_positions_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_total_positions_object_type;

         balance_type      collateral;
         balance_type      debit;
   };

   /**
    *  @brief permission of @ref authorizee to take over the position of @ref authorizer
    *  @ingroup object
    *  @ingroup implementation
    *
    *  @ref deposit is held from the authorizer under loan_authorization_hold until
    *  the authorization is removed.
    */
   class loan_authorization_object : public abstract_object<loan_authorization_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_loan_authorization_object_type;

         account_id_type   authorizer;
         account_id_type   authorizee;
         balance_type      deposit;
   };

   struct by_owner;
   struct by_authorizer_authorizee;

   typedef multi_index_container<
      position_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< position_object, account_id_type, &position_object::owner > >
      >
   > position_multi_index_type;

   typedef generic_index<position_object, position_multi_index_type> position_index;

   typedef simple_index<total_positions_object> total_positions_index;

   typedef multi_index_container<
      loan_authorization_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_authorizer_authorizee>,
            composite_key<
               loan_authorization_object,
               member< loan_authorization_object, account_id_type, &loan_authorization_object::authorizer >,
               member< loan_authorization_object, account_id_type, &loan_authorization_object::authorizee >
            >
         >
      >
   > loan_authorization_multi_index_type;

   typedef generic_index<loan_authorization_object, loan_authorization_multi_index_type> loan_authorization_index;

} } // honzon::chain

FC_REFLECT_DERIVED( honzon::chain::position_object, (honzon::db::object), (owner)(collateral)(debit) )
FC_REFLECT_DERIVED( honzon::chain::total_positions_object, (honzon::db::object), (collateral)(debit) )
FC_REFLECT_DERIVED( honzon::chain::loan_authorization_object, (honzon::db::object), (authorizer)(authorizee)(deposit) )
