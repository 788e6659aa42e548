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

   class set_collateral_params_evaluator : public evaluator<set_collateral_params_evaluator>
   {
      public:
         typedef set_collateral_params_operation operation_type;

         void_result do_evaluate( const set_collateral_params_operation& o );
         void_result do_apply( const set_collateral_params_operation& o );
   };

   class liquidate_cdp_evaluator : public evaluator<liquidate_cdp_evaluator>
   {
      public:
         typedef liquidate_cdp_operation operation_type;

         void_result do_evaluate( const liquidate_cdp_operation& o );
         void_result do_apply( const liquidate_cdp_operation& o );
   };

   class settle_cdp_evaluator : public evaluator<settle_cdp_evaluator>
   {
      public:
         typedef settle_cdp_operation operation_type;

         void_result do_evaluate( const settle_cdp_operation& o );
         void_result do_apply( const settle_cdp_operation& o );
   };

} } // honzon::chain
