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
#include <gavel/chain/protocol/account.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

/**
 * A valid name:
 *
 * - begins with a lowercase letter
 * - ends with a lowercase letter or digit
 * - contains only lowercase letters, digits or hyphens
 * - has a length between (inclusive) GAVEL_MIN_ACCOUNT_NAME_LENGTH and GAVEL_MAX_ACCOUNT_NAME_LENGTH
 */
bool is_valid_name( const string& name )
{
    const size_t len = name.size();

    if( len < GAVEL_MIN_ACCOUNT_NAME_LENGTH )
        return false;

    if( len > GAVEL_MAX_ACCOUNT_NAME_LENGTH )
        return false;

    if( name.front() < 'a' || name.front() > 'z' )
        return false;

    if( name.back() == '-' )
        return false;

    for( const auto c : name )
    {
        if( (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' )
            continue;
        return false;
    }

    return true;
}

void account_create_operation::validate()const
{
   GAVEL_ASSERT( is_valid_name( name ), invalid_params_exception, "invalid account name ${n}", ("n",name) );
}

} } // gavel::chain
