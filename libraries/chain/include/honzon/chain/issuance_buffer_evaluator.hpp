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

   class fund_issuance_buffer_evaluator : public evaluator<fund_issuance_buffer_evaluator>
   {
      public:
         typedef fund_issuance_buffer_operation operation_type;

         void_result do_evaluate( const fund_issuance_buffer_operation& o );
         void_result do_apply( const fund_issuance_buffer_operation& o );
   };

   class defund_issuance_buffer_evaluator : public evaluator<defund_issuance_buffer_evaluator>
   {
      public:
         typedef defund_issuance_buffer_operation operation_type;

         void_result do_evaluate( const defund_issuance_buffer_operation& o );
         void_result do_apply( const defund_issuance_buffer_operation& o );
   };

   class set_issuance_discount_evaluator : public evaluator<set_issuance_discount_evaluator>
   {
      public:
         typedef set_issuance_discount_operation operation_type;

         void_result do_evaluate( const set_issuance_discount_operation& o );
         void_result do_apply( const set_issuance_discount_operation& o );
   };

   class set_issuance_quota_evaluator : public evaluator<set_issuance_quota_evaluator>
   {
      public:
         typedef set_issuance_quota_operation operation_type;

         void_result do_evaluate( const set_issuance_quota_operation& o );
         void_result do_apply( const set_issuance_quota_operation& o );
   };

} } // honzon::chain
