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
#include <honzon/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace honzon { namespace chain {

   /**
    *  @brief a live auction of the generic auction module
    *  @ingroup object
    *  @ingroup protocol
    *
    *  The generic module only tracks the top bid and the block range, the
    *  meaning of a bid is decided by the auction_handler.
    */
   class auction_object : public abstract_object<auction_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = auction_object_type;

         auction_id_type              auction_id = 0;
         optional<auction_bid_type>   bid;
         block_number_type            start = 0;
         optional<block_number_type>  end;

         /// key of the by_end index, auctions without an end sort last
         block_number_type end_key()const { return end.valid() ? *end : block_number_type(-1); }
   };

   /**
    *  @brief collateral policy state of a live collateral auction
    *  @ingroup object
    *  @ingroup protocol
    *
    *  Shares @ref auction_id with the auction_object driving it. @ref initial_amount
    *  never changes, @ref amount only shrinks once bids enter the reverse stage.
    */
   class collateral_auction_object : public abstract_object<collateral_auction_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = collateral_auction_object_type;

         auction_id_type      auction_id = 0;
         account_id_type      refund_recipient;
         balance_type         initial_amount;
         balance_type         amount;
         /// stable currency the auction tries to raise, 0 for an auction without reverse stage
         balance_type         target;
         block_number_type    start_time = 0;

         bool         always_forward()const { return target == 0; }
         /// price per collateral unit at which bids stop raising the payment
         price_type   target_price()const;
         bool         in_reverse_stage( const price_type& price_per_unit )const;
         /// stable currency paid by a bid of @ref bid_value for the current @ref amount
         balance_type payment_amount( const balance_type& bid_value )const;
         /// price per unit of a bid of @ref bid_value stable currency
         price_type   price_per_unit( const balance_type& bid_value )const;
   };

   /**
    *  @brief aggregates over every live collateral auction
    *  @ingroup object
    *  @ingroup implementation
    */
   class auction_manager_object : public abstract_object<auction_manager_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_auction_manager_object_type;

         /// sum of initial_amount
         balance_type      total_collateral_in_auction;
         /// sum of target
         balance_type      total_target_in_auction;
   };

   struct by_auction_id;
   struct by_end;

   typedef multi_index_container<
      auction_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_auction_id>, member< auction_object, auction_id_type, &auction_object::auction_id > >,
         ordered_unique< tag<by_end>,
            composite_key<
               auction_object,
               const_mem_fun< auction_object, block_number_type, &auction_object::end_key >,
               member< auction_object, auction_id_type, &auction_object::auction_id >
            >
         >
      >
   > auction_multi_index_type;

   typedef generic_index<auction_object, auction_multi_index_type> auction_index;

   typedef multi_index_container<
      collateral_auction_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_auction_id>,
                         member< collateral_auction_object, auction_id_type, &collateral_auction_object::auction_id > >
      >
   > collateral_auction_multi_index_type;

   typedef generic_index<collateral_auction_object, collateral_auction_multi_index_type> collateral_auction_index;

   typedef simple_index<auction_manager_object> auction_manager_index;

} } // honzon::chain

FC_REFLECT_DERIVED( honzon::chain::auction_object, (honzon::db::object),
                    (auction_id)
                    (bid)
                    (start)
                    (end)
                  )

FC_REFLECT_DERIVED( honzon::chain::collateral_auction_object, (honzon::db::object),
                    (auction_id)
                    (refund_recipient)
                    (initial_amount)
                    (amount)
                    (target)
                    (start_time)
                  )

FC_REFLECT_DERIVED( honzon::chain::auction_manager_object, (honzon::db::object),
                    (total_collateral_in_auction)
                    (total_target_in_auction)
                  )
