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

#include <honzon/chain/database.hpp>

/*
 * This file provides with() functions which modify the database
 * temporarily, then restore it.  These functions are mostly internal
 * implementation detail of the database.
 *
 * Essentially, we want to be able to use "finally" to restore the
 * database regardless of whether an exception is thrown or not, but there
 * is no "finally" in C++.  Instead, C++ requires us to create a struct
 * and put the finally block in a destructor.
 */

namespace honzon { namespace chain {

namespace detail {

/**
 * Class used to help the with_transactional_scope implementation.
 * It drops the virtual operations pushed inside the scope unless the
 * scope completed.
 */
struct applied_operations_restorer
{
   applied_operations_restorer( database& db )
      : _db( db ), _old_size( db._applied_ops.size() )
   {
   }

   ~applied_operations_restorer()
   {
      if( !_released )
         _db._applied_ops.resize( _old_size );
   }

   void release() { _released = true; }

   database& _db;
   size_t    _old_size; // initialized in ctor
   bool      _released = false;
};

}

/**
 * Run @ref callback inside its own undo session. If it throws, every object
 * it wrote and every virtual operation it pushed is rolled back, otherwise
 * the changes are folded into the enclosing session.
 */
template< typename Lambda >
void with_transactional_scope( database& db, Lambda&& callback )
{
   auto session = db.start_undo_session();
   detail::applied_operations_restorer restorer( db );
   callback();
   restorer.release();
   session.merge();
}

} } // honzon::chain
