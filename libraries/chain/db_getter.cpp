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

namespace honzon { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get( dynamic_global_property_id_type() );
}

const chain_parameters& database::get_chain_parameters()const
{
   return get_global_properties().parameters;
}

const cdp_engine_object& database::get_cdp_engine()const
{
   return get( cdp_engine_id_type() );
}

const cdp_treasury_object& database::get_cdp_treasury()const
{
   return get( cdp_treasury_id_type() );
}

const auction_manager_object& database::get_auction_manager()const
{
   return get( auction_manager_id_type() );
}

const shutdown_state_object& database::get_shutdown_state()const
{
   return get( shutdown_state_id_type() );
}

const issuance_buffer_object& database::get_issuance_buffer()const
{
   return get( issuance_buffer_id_type() );
}

const total_positions_object& database::get_total_positions()const
{
   return get( total_positions_id_type() );
}

block_number_type database::head_block_num()const
{
   return get_dynamic_global_properties().head_block_number;
}

time_point_sec database::head_block_time()const
{
   return get_dynamic_global_properties().time;
}

bool database::is_shutdown()const
{
   return get_shutdown_state().is_shutdown;
}

const account_object& database::get_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   FC_ASSERT( itr != idx.end(), "Unable to find account '${acct}'. Did you forget to add a record for it?", ("acct",name) );
   return *itr;
}

const asset_object& database::get_asset_by_symbol( const string& symbol )const
{
   const auto& idx = get_index_type<asset_index>().indices().get<by_symbol>();
   auto itr = idx.find( symbol );
   FC_ASSERT( itr != idx.end(), "Unable to find asset '${sym}'", ("sym",symbol) );
   return *itr;
}

} }
