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
#include <gavel/chain/auction_module.hpp>
#include <gavel/chain/database.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel { namespace chain {

void auction_module::validate_bid( const database& db, const lot_object& lot, const amount_type& amount )const
{
}

amount_type auction_module::purchase( const database& db, const lot_object& lot, const amount_type& amount )const
{
   FC_THROW_EXCEPTION( not_implemented_exception, "${k} lots cannot be purchased from", ("k", keycode()) );
}

settlement auction_module::settle( const database& db, const lot_object& lot, vector<bid_claim>& bid_outcomes )const
{
   FC_THROW_EXCEPTION( not_implemented_exception, "${k} lots do not settle", ("k", keycode()) );
}

bid_claim auction_module::claim_bid( const database& db, const lot_object& lot, const bid_object& bid )const
{
   bid_claim claim;
   claim.bid_id   = bid.id;
   claim.bidder   = bid.bidder;
   claim.referrer = bid.referrer;
   if( lot.result.valid() && lot.result->settled() )
   {
      claim.paid   = bid.paid;
      claim.payout = bid.payout;
      claim.refund = bid.refund;
   }
   else
      claim.refund = bid.amount;
   return claim;
}

} } // gavel::chain
