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

#include <honzon/chain/database.hpp>

#include <honzon/chain/account_object.hpp>
#include <honzon/chain/asset_object.hpp>

namespace honzon { namespace chain {

balance_type database::get_balance( account_id_type owner, asset_id_type asset_id )const
{
   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( owner, asset_id ) );
   if( itr == index.end() )
      return balance_type(0);
   return itr->balance;
}

balance_type database::get_balance_on_hold( hold_reason reason, account_id_type owner, asset_id_type asset_id )const
{
   auto& index = get_index_type<account_hold_index>().indices().get<by_owner_asset_reason>();
   auto itr = index.find( boost::make_tuple( owner, asset_id, reason ) );
   if( itr == index.end() )
      return balance_type(0);
   return itr->amount;
}

void database::adjust_balance( account_id_type account, asset_id_type asset_id, const amount_type& delta )
{ try {
   if( delta == 0 )
      return;

   auto& index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
   auto itr = index.find( boost::make_tuple( account, asset_id ) );
   if( itr == index.end() )
   {
      HONZON_ASSERT( delta > 0, insufficient_balance,
                     "Insufficient Balance: ${a}'s balance of 0 is less than required ${r}",
                     ("a",account)("r",amount_abs(delta)) );
      FC_ASSERT( find( account ) != nullptr, "account ${a} does not exist", ("a",account) );
      const balance_type amount = amount_abs( delta );
      create<account_balance_object>( [account, asset_id, &amount]( account_balance_object& b ) {
         b.owner = account;
         b.asset_type = asset_id;
         b.balance = amount;
      });
   }
   else
   {
      if( delta < 0 )
         HONZON_ASSERT( itr->balance >= amount_abs( delta ), insufficient_balance,
                        "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                        ("a",account)("b",itr->balance)("r",amount_abs(delta)) );
      const balance_type new_balance = apply_delta( itr->balance, delta );
      modify( *itr, [&new_balance]( account_balance_object& b ) {
         b.balance = new_balance;
      });
   }
} FC_CAPTURE_AND_RETHROW( (account)(asset_id)(delta) ) }

void database::adjust_hold( hold_reason reason, account_id_type account, asset_id_type asset_id, const amount_type& delta )
{ try {
   if( delta == 0 )
      return;

   auto& index = get_index_type<account_hold_index>().indices().get<by_owner_asset_reason>();
   auto itr = index.find( boost::make_tuple( account, asset_id, reason ) );
   if( itr == index.end() )
   {
      HONZON_ASSERT( delta > 0, insufficient_hold, "${a} has nothing on hold for ${r}", ("a",account)("r",reason) );
      const balance_type amount = amount_abs( delta );
      create<account_hold_object>( [account, asset_id, reason, &amount]( account_hold_object& h ) {
         h.owner = account;
         h.asset_type = asset_id;
         h.reason = reason;
         h.amount = amount;
      });
      return;
   }

   if( delta < 0 )
      HONZON_ASSERT( itr->amount >= amount_abs( delta ), insufficient_hold,
                     "${a} holds ${h} for ${r}, less than ${d}",
                     ("a",account)("h",itr->amount)("r",reason)("d",amount_abs(delta)) );
   const balance_type new_amount = apply_delta( itr->amount, delta );
   if( new_amount == 0 )
      remove( *itr );
   else
      modify( *itr, [&new_amount]( account_hold_object& h ) {
         h.amount = new_amount;
      });
} FC_CAPTURE_AND_RETHROW( (reason)(account)(asset_id)(delta) ) }

void database::adjust_supply( asset_id_type asset_id, const amount_type& delta )
{ try {
   const asset_object& asset = get( asset_id );
   const balance_type new_supply = apply_delta( asset.current_supply, delta );
   modify( asset, [&new_supply]( asset_object& a ) {
      a.current_supply = new_supply;
   });
} FC_CAPTURE_AND_RETHROW( (asset_id)(delta) ) }

void database::set_fungible_assets( unique_ptr<fungible_assets> provider )
{
   FC_ASSERT( provider, "balance provider required" );
   _assets = std::move( provider );
}

/////////////////////// database_fungible_assets ///////////////////////

void database_fungible_assets::transfer( account_id_type from, account_id_type to,
                                         asset_id_type asset, const balance_type& amount )
{ try {
   if( amount == 0 || from == to )
      return;
   FC_ASSERT( _db.find( to ) != nullptr, "account ${a} does not exist", ("a",to) );
   const amount_type delta = to_amount( amount );
   _db.adjust_balance( from, asset, -delta );
   _db.adjust_balance( to, asset, delta );
} FC_CAPTURE_AND_RETHROW( (from)(to)(asset)(amount) ) }

void database_fungible_assets::hold( hold_reason reason, account_id_type who,
                                     asset_id_type asset, const balance_type& amount )
{ try {
   if( amount == 0 )
      return;
   const amount_type delta = to_amount( amount );
   _db.adjust_balance( who, asset, -delta );
   _db.adjust_hold( reason, who, asset, delta );
} FC_CAPTURE_AND_RETHROW( (reason)(who)(asset)(amount) ) }

balance_type database_fungible_assets::release( hold_reason reason, account_id_type who,
                                                asset_id_type asset, const balance_type& amount,
                                                release_precision precision )
{ try {
   balance_type to_release = amount;
   const balance_type on_hold = _db.get_balance_on_hold( reason, who, asset );
   if( on_hold < amount )
   {
      HONZON_ASSERT( precision == best_effort_precision, insufficient_hold,
                     "${a} holds ${h}, cannot release ${r}", ("a",who)("h",on_hold)("r",amount) );
      wlog( "releasing ${h} of ${r} requested from ${a}", ("h",on_hold)("r",amount)("a",who) );
      to_release = on_hold;
   }
   if( to_release == 0 )
      return to_release;

   const amount_type delta = to_amount( to_release );
   _db.adjust_hold( reason, who, asset, -delta );
   _db.adjust_balance( who, asset, delta );
   return to_release;
} FC_CAPTURE_AND_RETHROW( (reason)(who)(asset)(amount)(precision) ) }

void database_fungible_assets::mint( account_id_type who, asset_id_type asset, const balance_type& amount )
{ try {
   if( amount == 0 )
      return;
   const amount_type delta = to_amount( amount );
   _db.adjust_supply( asset, delta );
   _db.adjust_balance( who, asset, delta );
} FC_CAPTURE_AND_RETHROW( (who)(asset)(amount) ) }

void database_fungible_assets::burn( account_id_type who, asset_id_type asset, const balance_type& amount )
{ try {
   if( amount == 0 )
      return;
   const amount_type delta = to_amount( amount );
   _db.adjust_balance( who, asset, -delta );
   _db.adjust_supply( asset, -delta );
} FC_CAPTURE_AND_RETHROW( (who)(asset)(amount) ) }

balance_type database_fungible_assets::balance( account_id_type who, asset_id_type asset )const
{
   return _db.get_balance( who, asset );
}

balance_type database_fungible_assets::balance_on_hold( hold_reason reason, account_id_type who, asset_id_type asset )const
{
   return _db.get_balance_on_hold( reason, who, asset );
}

balance_type database_fungible_assets::total_issuance( asset_id_type asset )const
{
   return _db.get( asset ).current_supply;
}

} }
