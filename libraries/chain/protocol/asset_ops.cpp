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
#include <gavel/chain/protocol/asset_ops.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

/**
 *  Valid symbols can contain [A-Z0-9]
 *  They must start with [A, Z]
 */
bool is_valid_symbol( const string& symbol )
{
    if( symbol.size() < GAVEL_MIN_ASSET_SYMBOL_LENGTH )
        return false;

    if( symbol.size() > GAVEL_MAX_ASSET_SYMBOL_LENGTH )
        return false;

    if( !isalpha( symbol.front() ) )
        return false;

    for( const auto c : symbol )
    {
        if( (isalpha( c ) && isupper( c )) || isdigit(c) )
            continue;
        return false;
    }

    return true;
}

void asset_create_operation::validate()const
{
   GAVEL_ASSERT( is_valid_symbol(symbol), invalid_params_exception, "invalid symbol ${s}", ("s",symbol) );
   GAVEL_ASSERT( precision >= GAVEL_MIN_ASSET_PRECISION_DIGITS && precision <= GAVEL_MAX_ASSET_PRECISION_DIGITS,
                 unsupported_token_exception, "token decimals ${p} out of range", ("p",precision) );
   GAVEL_ASSERT( transfer_fee_percent < GAVEL_100_PERCENT, invalid_params_exception,
                 "transfer fee ${f} would burn the whole transfer", ("f",transfer_fee_percent) );
}

void asset_issue_operation::validate()const
{
   GAVEL_ASSERT( asset_to_issue.amount > 0, invalid_params_exception, "nothing to issue" );
   GAVEL_ASSERT( asset_to_issue.amount <= GAVEL_MAX_AMOUNT, overflow_exception, "issue of ${a} exceeds the amount width",
                 ("a",asset_to_issue.amount) );
}

} } // gavel::chain
