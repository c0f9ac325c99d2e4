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
#include <gavel/chain/fixed_point.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

typedef boost::multiprecision::uint256_t wide_amount;

static amount_type narrow( const wide_amount& v )
{
   GAVEL_ASSERT( v <= wide_amount( GAVEL_MAX_AMOUNT ), overflow_exception,
                 "result ${v} exceeds ${b} bits", ("v",v.str())("b",GAVEL_AMOUNT_BITS) );
   return amount_type( v );
}

amount_type decimal_factor( uint8_t digits )
{
   FC_ASSERT( digits <= GAVEL_INTERNAL_PRECISION_DIGITS, "unsupported decimals", ("digits",digits) );
   amount_type result = 1;
   for( uint8_t i = 0; i < digits; ++i )
      result *= 10;
   return result;
}

amount_type scale_to_internal( const amount_type& amount, uint8_t decimals )
{ try {
   GAVEL_ASSERT( decimals <= GAVEL_INTERNAL_PRECISION_DIGITS, unsupported_token_exception,
                 "token decimals ${d} above internal precision", ("d",decimals) );
   return narrow( wide_amount(amount) * wide_amount( decimal_factor( GAVEL_INTERNAL_PRECISION_DIGITS - decimals ) ) );
} FC_CAPTURE_AND_RETHROW( (amount)(decimals) ) }

amount_type scale_from_internal( const amount_type& amount18, uint8_t decimals, rounding_mode mode )
{ try {
   GAVEL_ASSERT( decimals <= GAVEL_INTERNAL_PRECISION_DIGITS, unsupported_token_exception,
                 "token decimals ${d} above internal precision", ("d",decimals) );
   const amount_type factor = decimal_factor( GAVEL_INTERNAL_PRECISION_DIGITS - decimals );
   amount_type result = amount18 / factor;
   if( mode == round_up && result * factor != amount18 )
      ++result;
   return narrow( wide_amount(result) );
} FC_CAPTURE_AND_RETHROW( (amount18)(decimals)(mode) ) }

amount_type mul_div( const amount_type& a, const amount_type& b, const amount_type& d, rounding_mode mode )
{ try {
   FC_ASSERT( d > 0, "division by zero" );
   const wide_amount product = wide_amount(a) * wide_amount(b);
   wide_amount result = product / wide_amount(d);
   if( mode == round_up && result * wide_amount(d) != product )
      ++result;
   return narrow( result );
} FC_CAPTURE_AND_RETHROW( (a)(b)(d)(mode) ) }

amount_type checked_add( const amount_type& a, const amount_type& b )
{
   return narrow( wide_amount(a) + wide_amount(b) );
}

amount_type checked_sub( const amount_type& a, const amount_type& b )
{
   GAVEL_ASSERT( a >= b, overflow_exception, "${a} - ${b} is negative", ("a",a)("b",b) );
   return a - b;
}

amount_type percent_of( const amount_type& amount, uint32_t percent )
{
   GAVEL_ASSERT( percent <= GAVEL_100_PERCENT, invalid_fee_exception, "percent ${p} exceeds 100%", ("p",percent) );
   return mul_div( amount, percent, GAVEL_100_PERCENT );
}

} } // gavel::chain
