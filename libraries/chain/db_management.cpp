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

#include <functional>

namespace honzon { namespace chain {

database::database()
{
   _assets.reset( new database_fungible_assets( *this ) );
   _prices.reset( new database_price_provider( *this ) );
   initialize_indexes();
   initialize_evaluators();
   initialize_auction_handler();
}

database::~database()
{
   clear_applied_operations();
}

void database::open( std::function<genesis_state_type()> genesis_loader )
{
   try
   {
      open( genesis_loader() );
   }
   FC_CAPTURE_LOG_AND_RETHROW( () )
}

void database::open( const genesis_state_type& genesis_state )
{
   try
   {
      FC_ASSERT( !_opened, "database is already open" );
      genesis_state.validate();

      init_genesis( genesis_state );
      _opened = true;

      ilog( "opened honzon database at block ${n}, time ${t}",
            ("n", head_block_num())("t", head_block_time()) );
   }
   FC_CAPTURE_LOG_AND_RETHROW( () )
}

void database::close()
{
   if( !_opened )
      return;

   ilog( "closing database at block ${n}", ("n", head_block_num()) );
   clear_applied_operations();
   _opened = false;
}

} }
