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
    * @brief This class represents an account on the object graph
    * @ingroup object
    * @ingroup protocol
    *
    * Accounts own balances and positions. The module accounts (loans, cdp treasury
    * and governance treasury) are ordinary accounts created at genesis.
    */
   class account_object : public honzon::db::abstract_object<account_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = account_object_type;

         string          name;

         /**
          * Number of modules that depend on this account staying alive. Loans holds
          * one reference for as long as the account has a live position, an account
          * with consumers may not be reaped.
          */
         uint32_t        consumers = 0;

         account_id_type get_id()const { return id; }
         bool            can_be_reaped()const { return consumers == 0; }
   };

   /**
    * @brief Tracks the free balance of a single account/asset pair
    * @ingroup object
    * @ingroup implementation
    */
   class account_balance_object : public abstract_object<account_balance_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_account_balance_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         balance_type      balance;
   };

   /**
    * @brief Balance earmarked on an account under a hold reason
    * @ingroup object
    * @ingroup implementation
    *
    * The amount stays on the owner's account but is not part of the free balance.
    */
   class account_hold_object : public abstract_object<account_hold_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_account_hold_object_type;

         account_id_type   owner;
         asset_id_type     asset_type;
         hold_reason       reason = collateral_auction_hold;
         balance_type      amount;
   };

   struct by_name;
   struct by_account_asset;
   struct by_owner_asset_reason;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_name>, member<account_object, string, &account_object::name> >
      >
   > account_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_object, account_multi_index_type> account_index;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account_asset>,
            composite_key<
               account_balance_object,
               member<account_balance_object, account_id_type, &account_balance_object::owner>,
               member<account_balance_object, asset_id_type, &account_balance_object::asset_type>
            >
         >
      >
   > account_balance_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      account_hold_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner_asset_reason>,
            composite_key<
               account_hold_object,
               member<account_hold_object, account_id_type, &account_hold_object::owner>,
               member<account_hold_object, asset_id_type, &account_hold_object::asset_type>,
               member<account_hold_object, hold_reason, &account_hold_object::reason>
            >
         >
      >
   > account_hold_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<account_hold_object, account_hold_object_multi_index_type> account_hold_index;

} } // honzon::chain

FC_REFLECT_DERIVED( honzon::chain::account_object,
                    (honzon::db::object),
                    (name)(consumers)
                  )

FC_REFLECT_DERIVED( honzon::chain::account_balance_object,
                    (honzon::db::object),
                    (owner)(asset_type)(balance)
                  )

FC_REFLECT_DERIVED( honzon::chain::account_hold_object,
                    (honzon::db::object),
                    (owner)(asset_type)(reason)(amount)
                  )
