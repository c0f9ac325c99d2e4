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
#include <gavel/chain/protocol/types.hpp>

namespace gavel { namespace chain {

   enum rounding_mode
   {
      round_down = 0,
      round_up   = 1
   };

   /**
    *  @defgroup fixed_point Fixed point amounts
    *
    *  Token amounts are held in each token's native decimals.  Prices and every
    *  computation that mixes two tokens run at GAVEL_INTERNAL_PRECISION_DIGITS
    *  decimals.  All helpers throw overflow_exception rather than return a value
    *  above GAVEL_MAX_AMOUNT or below zero.
    *
    *  Round down whenever the result is something the engine pays out or charges,
    *  round up whenever it is something the engine must collect.
    *  @{
    */

   /// 10^digits, digits <= GAVEL_INTERNAL_PRECISION_DIGITS
   amount_type decimal_factor( uint8_t digits );

   /// one whole token of the given decimals, in native units
   inline amount_type whole_unit( uint8_t decimals ) { return decimal_factor( decimals ); }

   amount_type scale_to_internal( const amount_type& amount, uint8_t decimals );
   amount_type scale_from_internal( const amount_type& amount18, uint8_t decimals, rounding_mode mode = round_down );

   /// a * b / d evaluated at 256 bits
   amount_type mul_div( const amount_type& a, const amount_type& b, const amount_type& d, rounding_mode mode = round_down );

   amount_type checked_add( const amount_type& a, const amount_type& b );
   amount_type checked_sub( const amount_type& a, const amount_type& b );

   /// floor( amount * percent / GAVEL_100_PERCENT )
   amount_type percent_of( const amount_type& amount, uint32_t percent );

   ///@}

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::rounding_mode, (round_down)(round_up) )
