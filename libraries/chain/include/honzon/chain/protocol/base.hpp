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
#include <honzon/chain/protocol/fixed_point.hpp>

namespace honzon { namespace chain {

   /**
    *  @defgroup operations Operations
    *  @ingroup transactions Transactions
    *  @brief A set of valid comands for mutating the globally shared state.
    *
    *  An operation can be thought of like a function that will modify the global
    *  shared state of the chain.  The members of each struct are like function
    *  arguments and each operation can potentially generate a return value.
    *
    *  Operations can be grouped into transactions (@ref transaction) to ensure that they occur
    *  in a particular order and that all operations apply successfully or
    *  no operations apply.
    *
    *  Each operation names the account that dispatches it, signer(). Privileged
    *  operations carry an authority which must match the origin configured in
    *  chain_parameters.
    *
    *  Virtual operations are never dispatched, they are pushed by the database
    *  as a record of what happened while applying a dispatched one.
    *
    *  @{
    */

   struct void_result{};
   typedef fc::static_variant<void_result,object_id_type,balance_type> operation_result;

   struct base_operation
   {
      void validate()const{}
   };

   /**
    *  For virtual operations the signer is informational only, validate() rejects
    *  any attempt to dispatch them.
    */
   struct base_virtual_operation : public base_operation
   {
      account_id_type signer()const { return HONZON_COMMITTEE_ACCOUNT; }
      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    *  New value of an optional risk parameter: void_t clears the parameter,
    *  a fixed_point sets it. A missing change leaves the parameter untouched.
    */
   typedef fc::static_variant<void_t, fixed_point> param_update;

   ///@}

} } // honzon::chain

FC_REFLECT( honzon::chain::void_result, )
