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

   class emergency_shutdown_evaluator : public evaluator<emergency_shutdown_evaluator>
   {
      public:
         typedef emergency_shutdown_operation operation_type;

         void_result do_evaluate( const emergency_shutdown_operation& o );
         void_result do_apply( const emergency_shutdown_operation& o );
   };

   class open_collateral_refund_evaluator : public evaluator<open_collateral_refund_evaluator>
   {
      public:
         typedef open_collateral_refund_operation operation_type;

         void_result do_evaluate( const open_collateral_refund_operation& o );
         void_result do_apply( const open_collateral_refund_operation& o );
   };

   class refund_collaterals_evaluator : public evaluator<refund_collaterals_evaluator>
   {
      public:
         typedef refund_collaterals_operation operation_type;

         void_result do_evaluate( const refund_collaterals_operation& o );
         void_result do_apply( const refund_collaterals_operation& o );
   };

} } // honzon::chain
