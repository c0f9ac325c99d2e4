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
#include <gavel/chain/protocol/bid_ops.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

void bid_operation::validate()const
{
   GAVEL_ASSERT( amount > 0, invalid_params_exception, "bid amount must be positive" );
   GAVEL_ASSERT( amount <= GAVEL_MAX_AMOUNT, overflow_exception, "bid of ${a} exceeds the amount width", ("a",amount) );
   GAVEL_ASSERT( referrer != bidder, invalid_params_exception, "a bidder cannot refer itself" );
}

void purchase_operation::validate()const
{
   GAVEL_ASSERT( amount > 0, invalid_params_exception, "purchase amount must be positive" );
   GAVEL_ASSERT( amount <= GAVEL_MAX_AMOUNT, overflow_exception, "purchase of ${a} exceeds the amount width", ("a",amount) );
   GAVEL_ASSERT( recipient != GAVEL_NULL_ACCOUNT, invalid_params_exception, "no recipient" );
   GAVEL_ASSERT( referrer != buyer, invalid_params_exception, "a buyer cannot refer itself" );
}

void bids_claim_operation::validate()const
{
   GAVEL_ASSERT( !bids.empty(), invalid_params_exception, "no bids to claim" );
   GAVEL_ASSERT( bids.size() <= GAVEL_DEFAULT_MAX_BIDS_PER_CLAIM, invalid_params_exception,
                 "at most ${m} bids per claim", ("m",GAVEL_DEFAULT_MAX_BIDS_PER_CLAIM) );
   flat_set<bid_id_type> unique_bids( bids.begin(), bids.end() );
   GAVEL_ASSERT( unique_bids.size() == bids.size(), invalid_bid_id_exception, "duplicate bid in claim" );
}

} } // gavel::chain
