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

#include <honzon/chain/protocol/chain_parameters.hpp>
#include <honzon/chain/protocol/operations.hpp>
#include <honzon/chain/protocol/transaction.hpp>

namespace honzon { namespace chain {

struct operation_validator
{
   typedef void result_type;
   template<typename T>
   void operator()( const T& v )const { v.validate(); }
};

struct operation_signer_visitor
{
   typedef account_id_type result_type;
   template<typename T>
   account_id_type operator()( const T& v )const { return v.signer(); }
};

void operation_validate( const operation& op )
{
   op.visit( operation_validator() );
}

account_id_type operation_signer( const operation& op )
{
   return op.visit( operation_signer_visitor() );
}

void transfer_operation::validate()const
{
   FC_ASSERT( from != to, "cannot transfer to self" );
   FC_ASSERT( amount > 0, "transfer amount must be positive" );
}

void price_feed_publish_operation::validate()const
{
   FC_ASSERT( asset_id != HONZON_STABLE_ASSET, "the stable currency is the quote asset" );
   FC_ASSERT( !price.is_zero(), "price must be positive" );
}

void adjust_loan_operation::validate()const
{
   FC_ASSERT( amount_in_range( collateral_adjustment ) && amount_in_range( debit_adjustment ),
              "adjustment does not fit a signed 128 bit amount" );
}

void adjust_loan_by_debit_value_operation::validate()const
{
   FC_ASSERT( amount_in_range( collateral_adjustment ) && amount_in_range( debit_value_adjustment ),
              "adjustment does not fit a signed 128 bit amount" );
}

void transfer_debit_operation::validate()const
{
   FC_ASSERT( amount > 0, "nothing to transfer" );
}

void transfer_loan_from_operation::validate()const
{
   FC_ASSERT( from != to, "cannot transfer a loan to its owner" );
}

void authorize_loan_operation::validate()const
{
   FC_ASSERT( authorizer != authorizee, "cannot authorize self" );
}

void unauthorize_loan_operation::validate()const
{
   FC_ASSERT( authorizer != authorizee, "cannot authorize self" );
}

void set_collateral_params_operation::validate()const
{
   FC_ASSERT( interest_rate_per_sec.valid() || liquidation_ratio.valid() || liquidation_penalty.valid() ||
              required_collateral_ratio.valid() || maximum_total_debit_value.valid(),
              "no parameter to update" );
}

void extract_surplus_to_treasury_operation::validate()const
{
   FC_ASSERT( amount > 0 );
}

void auction_collateral_operation::validate()const
{
   FC_ASSERT( amount > 0, "nothing to auction" );
}

void refund_collaterals_operation::validate()const
{
   FC_ASSERT( amount > 0, "nothing to refund" );
}

void auction_bid_operation::validate()const
{
   FC_ASSERT( value > 0, "bid must be positive" );
}

void fund_issuance_buffer_operation::validate()const
{
   FC_ASSERT( amount > 0, "nothing to fund" );
}

void defund_issuance_buffer_operation::validate()const
{
   FC_ASSERT( amount > 0, "nothing to defund" );
}

void transaction::validate()const
{
   FC_ASSERT( operations.size() > 0, "A transaction must have at least one operation", ("trx",*this) );
   for( const auto& op : operations )
      operation_validate(op);
}

void chain_parameters::validate()const
{
   FC_ASSERT( block_interval >= HONZON_MIN_BLOCK_INTERVAL );
   FC_ASSERT( block_interval <= HONZON_MAX_BLOCK_INTERVAL );
   FC_ASSERT( auction_time_to_close > 0, "auctions must be able to end" );
   FC_ASSERT( max_auctions_count > 0 );
   FC_ASSERT( !default_debit_exchange_rate.is_zero() );
   FC_ASSERT( default_liquidation_penalty <= rate_type::one() );
}

} } // honzon::chain
