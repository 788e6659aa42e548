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
#include <honzon/chain/protocol/operations.hpp>

namespace honzon { namespace chain {

   /**
    * @defgroup transactions Transactions
    *
    * A transaction is an ordered list of operations that is applied atomically:
    * either every operation succeeds or the state is left as if none had been
    * dispatched.
    *
    * Signatures are not part of this chain, each operation names its signer and
    * privileged operations are checked against the origins in chain_parameters.
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   struct transaction
   {
      vector<operation>  operations;

      /// Calls validate() on every operation
      void validate() const;

      void clear() { operations.clear(); }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // honzon::chain

FC_REFLECT( honzon::chain::transaction, (operations) )
FC_REFLECT_DERIVED( honzon::chain::processed_transaction, (honzon::chain::transaction), (operation_results) )
