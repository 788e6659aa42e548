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

namespace honzon { namespace chain {

   /**
    *  @class fungible_assets
    *  @brief multi asset balance book consumed by the CDP modules
    *
    *  Every method either applies completely or throws leaving balances untouched.
    *  Held balances stay on the owner's account under a hold_reason and are not
    *  part of the free balance until released.
    */
   class fungible_assets
   {
      public:
         virtual ~fungible_assets(){}

         /// moves @ref amount of free balance, throws insufficient_balance
         virtual void transfer( account_id_type from, account_id_type to,
                                asset_id_type asset, const balance_type& amount ) = 0;

         /// earmarks @ref amount of the free balance of @ref who
         virtual void hold( hold_reason reason, account_id_type who,
                            asset_id_type asset, const balance_type& amount ) = 0;

         /**
          *  Returns held balance to the free balance of @ref who.
          *
          *  With exact_precision anything less than @ref amount on hold throws
          *  insufficient_hold. With best_effort_precision the available amount is
          *  released instead.
          *
          *  @return the amount actually released
          */
         virtual balance_type release( hold_reason reason, account_id_type who,
                                       asset_id_type asset, const balance_type& amount,
                                       release_precision precision ) = 0;

         virtual void mint( account_id_type who, asset_id_type asset, const balance_type& amount ) = 0;
         /// destroys free balance, throws insufficient_balance
         virtual void burn( account_id_type who, asset_id_type asset, const balance_type& amount ) = 0;

         virtual balance_type balance( account_id_type who, asset_id_type asset )const = 0;
         virtual balance_type balance_on_hold( hold_reason reason, account_id_type who, asset_id_type asset )const = 0;
         virtual balance_type total_issuance( asset_id_type asset )const = 0;
   };

   class database;

   /**
    *  @brief fungible_assets backed by account_balance_object and account_hold_object
    *
    *  Every change goes through the database so that undo sessions cover it.
    */
   class database_fungible_assets : public fungible_assets
   {
      public:
         explicit database_fungible_assets( database& db ):_db(db){}

         virtual void transfer( account_id_type from, account_id_type to,
                                asset_id_type asset, const balance_type& amount ) override;
         virtual void hold( hold_reason reason, account_id_type who,
                            asset_id_type asset, const balance_type& amount ) override;
         virtual balance_type release( hold_reason reason, account_id_type who,
                                       asset_id_type asset, const balance_type& amount,
                                       release_precision precision ) override;
         virtual void mint( account_id_type who, asset_id_type asset, const balance_type& amount ) override;
         virtual void burn( account_id_type who, asset_id_type asset, const balance_type& amount ) override;

         virtual balance_type balance( account_id_type who, asset_id_type asset )const override;
         virtual balance_type balance_on_hold( hold_reason reason, account_id_type who, asset_id_type asset )const override;
         virtual balance_type total_issuance( asset_id_type asset )const override;

      private:
         database& _db;
   };

} } // honzon::chain
