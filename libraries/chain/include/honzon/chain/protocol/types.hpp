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
#include <fc/container/flat_fwd.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

#include <honzon/chain/config.hpp>
#include <honzon/db/object_id.hpp>

namespace honzon { namespace chain {
   using namespace honzon::db;

   using                               std::map;
   using                               std::vector;
   using                               std::string;
   using                               std::shared_ptr;
   using                               std::unique_ptr;
   using                               std::set;
   using                               std::pair;
   using                               std::tie;
   using                               std::make_pair;

   using                               fc::variant_object;
   using                               fc::variant;
   using                               fc::optional;
   using                               fc::time_point_sec;
   using                               fc::time_point;
   using                               fc::flat_map;
   using                               fc::flat_set;
   using                               fc::static_variant;

   /**
    *  Quantity of an asset. Unsigned 128 bit, every overflow and underflow throws
    *  std::overflow_error / std::range_error instead of wrapping.
    */
   typedef boost::multiprecision::number<
               boost::multiprecision::cpp_int_backend<128, 128,
                                                      boost::multiprecision::unsigned_magnitude,
                                                      boost::multiprecision::checked, void> >  balance_type;

   /**
    *  Signed adjustment applied to a balance. The magnitude may reach 2^128-1, use
    *  amount_in_range() before storing one that must fit a two's complement i128.
    */
   typedef boost::multiprecision::number<
               boost::multiprecision::cpp_int_backend<128, 128,
                                                      boost::multiprecision::signed_magnitude,
                                                      boost::multiprecision::checked, void> >  amount_type;

   /// true when the value fits in a two's complement 128 bit integer
   bool amount_in_range( const amount_type& a );
   /// 2^128 - 1
   const balance_type& max_balance();

   typedef uint32_t  block_number_type;
   typedef uint32_t  auction_id_type;

   /**
    *  Reasons under which a free balance may be earmarked. A held balance stays on the
    *  owner's account but cannot be transferred until released.
    */
   enum hold_reason
   {
      collateral_auction_hold  = 0,
      loan_authorization_hold  = 1,
      HOLD_REASON_COUNT
   };

   /// release semantics, mirrors the precision flag of the assets provider
   enum release_precision
   {
      exact_precision       = 0,
      best_effort_precision = 1
   };

   enum object_type
   {
      null_object_type,
      base_object_type,
      account_object_type,
      asset_object_type,
      auction_object_type,
      collateral_auction_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   enum impl_object_type
   {
      impl_global_property_object_type,
      impl_dynamic_global_property_object_type,
      impl_account_balance_object_type,
      impl_account_hold_object_type,
      impl_position_object_type,
      impl_total_positions_object_type,
      impl_loan_authorization_object_type,
      impl_cdp_engine_object_type,
      impl_cdp_treasury_object_type,
      impl_auction_manager_object_type,
      impl_shutdown_state_object_type,
      impl_price_feed_object_type,
      impl_issuance_buffer_object_type
   };

   class account_object;
   class asset_object;
   class auction_object;
   class collateral_auction_object;

   typedef object_id< protocol_ids, account_object_type,            account_object>               account_id_type;
   typedef object_id< protocol_ids, asset_object_type,              asset_object>                 asset_id_type;
   typedef object_id< protocol_ids, auction_object_type,            auction_object>               auction_object_id_type;
   typedef object_id< protocol_ids, collateral_auction_object_type, collateral_auction_object>    collateral_auction_object_id_type;

   // implementation types
   class global_property_object;
   class dynamic_global_property_object;
   class account_balance_object;
   class account_hold_object;
   class position_object;
   class total_positions_object;
   class loan_authorization_object;
   class cdp_engine_object;
   class cdp_treasury_object;
   class auction_manager_object;
   class shutdown_state_object;
   class price_feed_object;
   class issuance_buffer_object;

   typedef object_id< implementation_ids, impl_global_property_object_type,          global_property_object>          global_property_id_type;
   typedef object_id< implementation_ids, impl_dynamic_global_property_object_type,  dynamic_global_property_object>  dynamic_global_property_id_type;
   typedef object_id< implementation_ids, impl_account_balance_object_type,          account_balance_object>          account_balance_id_type;
   typedef object_id< implementation_ids, impl_account_hold_object_type,             account_hold_object>             account_hold_id_type;
   typedef object_id< implementation_ids, impl_position_object_type,                 position_object>                 position_id_type;
   typedef object_id< implementation_ids, impl_total_positions_object_type,          total_positions_object>          total_positions_id_type;
   typedef object_id< implementation_ids, impl_loan_authorization_object_type,       loan_authorization_object>       loan_authorization_id_type;
   typedef object_id< implementation_ids, impl_cdp_engine_object_type,               cdp_engine_object>               cdp_engine_id_type;
   typedef object_id< implementation_ids, impl_cdp_treasury_object_type,             cdp_treasury_object>             cdp_treasury_id_type;
   typedef object_id< implementation_ids, impl_auction_manager_object_type,          auction_manager_object>          auction_manager_id_type;
   typedef object_id< implementation_ids, impl_shutdown_state_object_type,           shutdown_state_object>           shutdown_state_id_type;
   typedef object_id< implementation_ids, impl_price_feed_object_type,               price_feed_object>               price_feed_id_type;
   typedef object_id< implementation_ids, impl_issuance_buffer_object_type,          issuance_buffer_object>          issuance_buffer_id_type;

   /// the account and amount of the current top bid of an auction
   typedef pair<account_id_type, balance_type> auction_bid_type;

   struct void_t{};

} }  // honzon::chain

namespace fc
{
    void to_variant( const honzon::chain::balance_type& var,  fc::variant& vo );
    void from_variant( const fc::variant& var,  honzon::chain::balance_type& vo );
    void to_variant( const honzon::chain::amount_type& var,  fc::variant& vo );
    void from_variant( const fc::variant& var,  honzon::chain::amount_type& vo );
}

FC_REFLECT_ENUM( honzon::chain::object_type,
                 (null_object_type)
                 (base_object_type)
                 (account_object_type)
                 (asset_object_type)
                 (auction_object_type)
                 (collateral_auction_object_type)
                 (OBJECT_TYPE_COUNT)
               )
FC_REFLECT_ENUM( honzon::chain::impl_object_type,
                 (impl_global_property_object_type)
                 (impl_dynamic_global_property_object_type)
                 (impl_account_balance_object_type)
                 (impl_account_hold_object_type)
                 (impl_position_object_type)
                 (impl_total_positions_object_type)
                 (impl_loan_authorization_object_type)
                 (impl_cdp_engine_object_type)
                 (impl_cdp_treasury_object_type)
                 (impl_auction_manager_object_type)
                 (impl_shutdown_state_object_type)
                 (impl_price_feed_object_type)
                 (impl_issuance_buffer_object_type)
               )
FC_REFLECT_ENUM( honzon::chain::hold_reason, (collateral_auction_hold)(loan_authorization_hold)(HOLD_REASON_COUNT) )
FC_REFLECT_ENUM( honzon::chain::release_precision, (exact_precision)(best_effort_precision) )

FC_REFLECT_TYPENAME( honzon::chain::account_id_type )
FC_REFLECT_TYPENAME( honzon::chain::asset_id_type )
FC_REFLECT( honzon::chain::void_t, )
