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
#include <honzon/chain/protocol/types.hpp>

#define HONZON_ASSERT( expr, exc_type, FORMAT, ... )                  \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define HONZON_DECLARE_MODULE_EXCEPTIONS( module_name, code )         \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      module_name ## _exception,                                      \
      honzon::chain::operation_evaluate_exception,                    \
      code,                                                           \
      #module_name " exception"                                       \
      )

#define HONZON_DECLARE_MODULE_EXCEPTION( exc_name, module_name, seqnum, msg ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      exc_name,                                                       \
      honzon::chain::module_name ## _exception,                       \
      module_name ## _exception_code + seqnum,                        \
      msg                                                             \
      )

namespace honzon { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "blockchain exception" )
   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,          honzon::chain::chain_exception, 3010000, "database query exception" )
   FC_DECLARE_DERIVED_EXCEPTION( block_validate_exception,          honzon::chain::chain_exception, 3020000, "block validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_exception,             honzon::chain::chain_exception, 3030000, "transaction validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,      honzon::chain::chain_exception, 3040000, "operation validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,      honzon::chain::chain_exception, 3050000, "operation evaluation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,           honzon::chain::chain_exception, 3070000, "undo database exception" )

   FC_DECLARE_DERIVED_EXCEPTION( bad_origin,                        honzon::chain::transaction_exception, 3030001, "origin is not allowed to dispatch this operation" )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_operation,                 honzon::chain::transaction_exception, 3030002, "no evaluator registered for operation" )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,              honzon::chain::operation_evaluate_exception, 3050001, "insufficient balance" )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_hold,                 honzon::chain::operation_evaluate_exception, 3050002, "insufficient balance on hold" )
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow,               honzon::chain::operation_evaluate_exception, 3050003, "arithmetic overflow" )
   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_underflow,              honzon::chain::operation_evaluate_exception, 3050004, "arithmetic underflow" )
   FC_DECLARE_DERIVED_EXCEPTION( amount_convert_failed,             honzon::chain::operation_evaluate_exception, 3050005, "amount convert failed" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                    honzon::chain::operation_evaluate_exception, 3050006, "invalid amount" )

   const int64_t loans_exception_code               = 3110000;
   const int64_t cdp_engine_exception_code          = 3120000;
   const int64_t cdp_treasury_exception_code        = 3130000;
   const int64_t auction_exception_code             = 3140000;
   const int64_t auction_manager_exception_code     = 3150000;
   const int64_t emergency_shutdown_exception_code  = 3160000;
   const int64_t honzon_exception_code              = 3170000;
   const int64_t oracle_exception_code              = 3180000;

   HONZON_DECLARE_MODULE_EXCEPTIONS( loans, loans_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( position_not_found, loans, 1, "position does not exist" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( cdp_engine, cdp_engine_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( invalid_collateral_type,          cdp_engine,  1, "collateral params are not set" )
   HONZON_DECLARE_MODULE_EXCEPTION( below_required_collateral_ratio,  cdp_engine,  2, "below required collateral ratio" )
   HONZON_DECLARE_MODULE_EXCEPTION( below_liquidation_ratio,          cdp_engine,  3, "below liquidation ratio" )
   HONZON_DECLARE_MODULE_EXCEPTION( remain_debit_value_too_small,     cdp_engine,  4, "remaining debit value is below the minimum" )
   HONZON_DECLARE_MODULE_EXCEPTION( must_be_unsafe,                   cdp_engine,  5, "position must be unsafe" )
   HONZON_DECLARE_MODULE_EXCEPTION( must_be_safe,                     cdp_engine,  6, "position must be safe" )
   HONZON_DECLARE_MODULE_EXCEPTION( no_debit_value,                   cdp_engine,  7, "position has no debit" )
   HONZON_DECLARE_MODULE_EXCEPTION( must_after_shutdown,              cdp_engine,  8, "only allowed after emergency shutdown" )
   HONZON_DECLARE_MODULE_EXCEPTION( exceed_debit_value_hard_cap,      cdp_engine,  9, "total debit value exceeds the hard cap" )
   HONZON_DECLARE_MODULE_EXCEPTION( invalid_feed_price,               cdp_engine, 10, "no price feed for collateral" )
   HONZON_DECLARE_MODULE_EXCEPTION( invalid_rate,                     cdp_engine, 11, "rate is out of range" )
   HONZON_DECLARE_MODULE_EXCEPTION( collateral_amount_below_minimum,  cdp_engine, 12, "collateral amount is below the minimum" )
   HONZON_DECLARE_MODULE_EXCEPTION( convert_debit_balance_failed,     cdp_engine, 13, "debit value cannot be converted to debit" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( cdp_treasury, cdp_treasury_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( collateral_not_enough,            cdp_treasury, 1, "not enough collateral in the treasury" )
   HONZON_DECLARE_MODULE_EXCEPTION( surplus_pool_not_enough,          cdp_treasury, 2, "not enough surplus in the treasury" )
   HONZON_DECLARE_MODULE_EXCEPTION( debit_pool_overflow,              cdp_treasury, 3, "debit pool overflow" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( auction, auction_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( auction_not_exist,                auction, 1, "auction does not exist" )
   HONZON_DECLARE_MODULE_EXCEPTION( auction_not_started,              auction, 2, "auction has not started" )
   HONZON_DECLARE_MODULE_EXCEPTION( bid_not_accepted,                 auction, 3, "bid was not accepted" )
   HONZON_DECLARE_MODULE_EXCEPTION( invalid_bid_price,                auction, 4, "bid price is too low" )
   HONZON_DECLARE_MODULE_EXCEPTION( no_available_auction_id,          auction, 5, "auction id space exhausted" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( auction_manager, auction_manager_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( collateral_auction_not_exist,     auction_manager, 1, "collateral auction does not exist" )
   HONZON_DECLARE_MODULE_EXCEPTION( in_reverse_stage,                 auction_manager, 2, "auction is in reverse stage" )
   HONZON_DECLARE_MODULE_EXCEPTION( invalid_auction_amount,           auction_manager, 3, "invalid auction amount" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( emergency_shutdown, emergency_shutdown_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( already_shutdown,                 emergency_shutdown, 1, "already shutdown" )
   HONZON_DECLARE_MODULE_EXCEPTION( exist_potential_surplus,          emergency_shutdown, 2, "collateral is still in auction" )
   HONZON_DECLARE_MODULE_EXCEPTION( exist_unhandled_debit,            emergency_shutdown, 3, "positions still carry debit" )
   HONZON_DECLARE_MODULE_EXCEPTION( can_not_refund,                   emergency_shutdown, 4, "collateral refund is not open" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( honzon, honzon_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( no_permission,                    honzon, 1, "caller is not authorized to move this loan" )
   HONZON_DECLARE_MODULE_EXCEPTION( already_authorized,               honzon, 2, "authorization already exists" )
   HONZON_DECLARE_MODULE_EXCEPTION( authorization_not_exists,         honzon, 3, "authorization does not exist" )

   HONZON_DECLARE_MODULE_EXCEPTIONS( oracle, oracle_exception_code )
   HONZON_DECLARE_MODULE_EXCEPTION( price_locked,                     oracle, 1, "price feed is locked" )

} } // honzon::chain
