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
#include <honzon/chain/evaluator.hpp>
#include <honzon/chain/database.hpp>

namespace honzon { namespace chain {

   class adjust_loan_evaluator : public evaluator<adjust_loan_evaluator>
   {
      public:
         typedef adjust_loan_operation operation_type;

         void_result do_evaluate( const adjust_loan_operation& o );
         void_result do_apply( const adjust_loan_operation& o );
   };

   class adjust_loan_by_debit_value_evaluator : public evaluator<adjust_loan_by_debit_value_evaluator>
   {
      public:
         typedef adjust_loan_by_debit_value_operation operation_type;

         void_result do_evaluate( const adjust_loan_by_debit_value_operation& o );
         void_result do_apply( const adjust_loan_by_debit_value_operation& o );
   };

   class transfer_debit_evaluator : public evaluator<transfer_debit_evaluator>
   {
      public:
         typedef transfer_debit_operation operation_type;

         void_result do_evaluate( const transfer_debit_operation& o );
         void_result do_apply( const transfer_debit_operation& o );
   };

   class transfer_loan_from_evaluator : public evaluator<transfer_loan_from_evaluator>
   {
      public:
         typedef transfer_loan_from_operation operation_type;

         void_result do_evaluate( const transfer_loan_from_operation& o );
         void_result do_apply( const transfer_loan_from_operation& o );
   };

   class authorize_loan_evaluator : public evaluator<authorize_loan_evaluator>
   {
      public:
         typedef authorize_loan_operation operation_type;

         void_result      do_evaluate( const authorize_loan_operation& o );
         object_id_type   do_apply( const authorize_loan_operation& o );

         balance_type     deposit;
   };

   class unauthorize_loan_evaluator : public evaluator<unauthorize_loan_evaluator>
   {
      public:
         typedef unauthorize_loan_operation operation_type;

         void_result do_evaluate( const unauthorize_loan_operation& o );
         void_result do_apply( const unauthorize_loan_operation& o );

         const loan_authorization_object* authorization = nullptr;
   };

   class unauthorize_all_loans_evaluator : public evaluator<unauthorize_all_loans_evaluator>
   {
      public:
         typedef unauthorize_all_loans_operation operation_type;

         void_result do_evaluate( const unauthorize_all_loans_operation& o );
         void_result do_apply( const unauthorize_all_loans_operation& o );
   };

} } // honzon::chain
