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
#include <gavel/chain/protocol/fee_ops.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

void fee_config_update_operation::validate()const
{
   GAVEL_ASSERT( !auction_type.empty(), invalid_params_exception, "auction type required" );
   GAVEL_ASSERT( percent <= GAVEL_100_PERCENT, invalid_fee_exception, "fee ${p} exceeds 100%", ("p",percent) );
}

void curator_fee_update_operation::validate()const
{
   GAVEL_ASSERT( !auction_type.empty(), invalid_params_exception, "auction type required" );
   GAVEL_ASSERT( percent <= GAVEL_100_PERCENT, invalid_fee_exception, "fee ${p} exceeds 100%", ("p",percent) );
}

} } // gavel::chain
