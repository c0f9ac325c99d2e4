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
#include <gavel/chain/protocol/lot_ops.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

void lot_create_operation::validate()const
{
   GAVEL_ASSERT( !auction_type.empty(), invalid_params_exception, "auction type required" );
   GAVEL_ASSERT( base_token != quote_token, invalid_params_exception, "base and quote token must differ" );
   GAVEL_ASSERT( capacity > 0, invalid_params_exception, "capacity must be positive" );
   GAVEL_ASSERT( capacity <= GAVEL_MAX_AMOUNT, overflow_exception, "capacity ${c} exceeds the amount width", ("c",capacity) );
   GAVEL_ASSERT( duration > 0, invalid_params_exception, "duration must be positive" );
   GAVEL_ASSERT( params.min_fill_percent <= GAVEL_100_PERCENT, invalid_params_exception,
                 "minimum fill ${m} exceeds 100%", ("m",params.min_fill_percent) );
   if( curator.valid() )
   {
      GAVEL_ASSERT( *curator != GAVEL_NULL_ACCOUNT, invalid_params_exception, "the null account cannot curate" );
      GAVEL_ASSERT( *curator != seller, invalid_params_exception, "the seller cannot curate its own lot" );
   }
   if( callbacks.valid() )
      GAVEL_ASSERT( !callbacks->empty(), invalid_params_exception, "empty callbacks name" );
}

} } // gavel::chain
