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
#include <gavel/chain/fixed_price_auctions.hpp>
#include <gavel/chain/database.hpp>
#include <gavel/chain/exceptions.hpp>
#include <gavel/chain/fixed_point.hpp>

#include <fc/io/json.hpp>

namespace gavel { namespace chain {

amount_type quote_to_base( const amount_type& quote_amount, const amount_type& price,
                           uint8_t quote_precision, uint8_t base_precision )
{
   FC_ASSERT( price > 0 );
   const amount_type base18 = mul_div( scale_to_internal( quote_amount, quote_precision ),
                                       whole_unit( GAVEL_INTERNAL_PRECISION_DIGITS ), price, round_down );
   return scale_from_internal( base18, base_precision, round_down );
}

amount_type base_to_quote( const amount_type& base_amount, const amount_type& price,
                           uint8_t base_precision, uint8_t quote_precision )
{
   const amount_type quote18 = mul_div( scale_to_internal( base_amount, base_precision ),
                                        price, whole_unit( GAVEL_INTERNAL_PRECISION_DIGITS ), round_up );
   return scale_from_internal( quote18, quote_precision, round_up );
}

void fixed_price_sale::validate_lot( const database& db, const lot_create_operation& op )const
{
   GAVEL_ASSERT( op.params.price > 0, invalid_params_exception, "a fixed price sale needs a price" );
}

amount_type fixed_price_sale::purchase( const database& db, const lot_object& lot, const amount_type& amount )const
{
   const amount_type payout = quote_to_base( amount, lot.params.price,
                                             lot.quote_token(db).precision, lot.base_token(db).precision );
   GAVEL_ASSERT( payout > 0, invalid_params_exception, "${a} buys nothing at ${p}", ("a", amount)("p", lot.params.price) );
   GAVEL_ASSERT( payout <= lot.remaining(), invalid_params_exception,
                 "purchase of ${o} exceeds the remaining ${r}", ("o", payout)("r", lot.remaining()) );
   return payout;
}

void fixed_price_batch::validate_lot( const database& db, const lot_create_operation& op )const
{
   GAVEL_ASSERT( op.params.price > 0, invalid_params_exception, "a fixed price batch needs a price" );
   GAVEL_ASSERT( op.params.min_fill_percent <= GAVEL_100_PERCENT, invalid_params_exception,
                 "minimum fill ${m} above 100%", ("m", op.params.min_fill_percent) );
}

void fixed_price_batch::validate_bid( const database& db, const lot_object& lot, const amount_type& amount )const
{
   const amount_type out = quote_to_base( amount, lot.params.price,
                                          lot.quote_token(db).precision, lot.base_token(db).precision );
   GAVEL_ASSERT( out > 0, invalid_params_exception, "bid of ${a} buys nothing at ${p}", ("a", amount)("p", lot.params.price) );
}

settlement fixed_price_batch::settle( const database& db, const lot_object& lot, vector<bid_claim>& bid_outcomes )const
{
   const uint8_t base_precision  = lot.base_token(db).precision;
   const uint8_t quote_precision = lot.quote_token(db).precision;

   settlement result;
   amount_type remaining = lot.capacity;

   const auto& by_lot_idx = db.get_index_type<bid_index>().indices().get<by_lot>();
   auto range = by_lot_idx.equal_range( boost::make_tuple( lot.id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      const bid_object& bid = *itr;
      if( !bid.is_live() )
         continue;

      bid_claim outcome;
      outcome.bid_id   = bid.id;
      outcome.bidder   = bid.bidder;
      outcome.referrer = bid.referrer;

      const amount_type out = quote_to_base( bid.amount, lot.params.price, quote_precision, base_precision );
      if( remaining == 0 )
      {
         outcome.refund = bid.amount;
      }
      else if( out <= remaining )
      {
         outcome.paid   = bid.amount;
         outcome.payout = out;
         remaining -= out;
         result.total_in  = checked_add( result.total_in, bid.amount );
         result.total_out = checked_add( result.total_out, out );
      }
      else
      {
         // the bid crossing capacity gets what is left and pays for exactly that
         amount_type used = base_to_quote( remaining, lot.params.price, base_precision, quote_precision );
         if( used > bid.amount )
            used = bid.amount;
         outcome.paid   = used;
         outcome.payout = remaining;
         outcome.refund = bid.amount - used;

         result.pf_bid      = bid.id;
         result.pf_bidder   = bid.bidder;
         result.pf_referrer = bid.referrer;
         result.pf_payout   = remaining;
         result.pf_refund   = outcome.refund;
         result.total_in  = checked_add( result.total_in, bid.amount );
         result.total_out = checked_add( result.total_out, remaining );
         remaining = 0;
      }
      bid_outcomes.push_back( outcome );
   }

   const amount_type min_fill = percent_of( lot.capacity, lot.params.min_fill_percent );
   if( result.total_out == 0 || result.total_out < min_fill )
   {
      dlog( "lot ${l} sold ${o} of the ${m} it needs to settle", ("l", lot.id)("o", result.total_out)("m", min_fill) );
      bid_outcomes.clear();
      return settlement();
   }

   const string price = fc::json::to_string( lot.params.price );
   result.auction_output.assign( price.begin(), price.end() );
   return result;
}

} } // gavel::chain
