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

   /**
    *  Atomic lots settle on every purchase, batch lots collect bids and settle once
    *  after conclusion.
    */
   enum auction_category
   {
      atomic_auction = 0,
      batch_auction  = 1
   };

   enum fee_type
   {
      protocol_fee_type    = 0,
      referrer_fee_type    = 1,
      max_curator_fee_type = 2
   };

   /**
    *  Parameters handed to the auction module when a lot is created.
    *
    *  price is expressed in quote token units at 18 decimals for one whole base token.
    */
   struct auction_parameters
   {
      amount_type price;
      /// batch lots that sell less than this share of capacity do not settle
      uint32_t    min_fill_percent = 0;
   };

   /**
    *  @brief the result of settling a batch lot, as reported by its auction module
    *
    *  total_in includes every bid the module cleared, the marginal bid at its full
    *  amount; pf_refund is the part of that bid handed back to its bidder.
    */
   struct settlement
   {
      amount_type             total_in;
      amount_type             total_out;

      optional<bid_id_type>   pf_bid;
      account_id_type         pf_bidder   = GAVEL_NULL_ACCOUNT;
      account_id_type         pf_referrer = GAVEL_NULL_ACCOUNT;
      amount_type             pf_refund;
      amount_type             pf_payout;

      vector<char>            auction_output;

      bool settled()const { return total_out > 0; }
      bool has_partial_fill()const { return pf_bid.valid(); }
   };

   /**
    *  The outcome of one bid: the quote the lot keeps, the base the bidder receives
    *  and the quote returned to the bidder.
    */
   struct bid_claim
   {
      bid_id_type     bid_id;
      account_id_type bidder;
      account_id_type referrer = GAVEL_NULL_ACCOUNT;
      amount_type     paid;
      amount_type     payout;
      amount_type     refund;
   };

   /**
    *  The split of a gross quote amount between protocol, referrer and seller.
    */
   struct fee_split
   {
      amount_type protocol_fee;
      amount_type referrer_fee;
      amount_type net;
   };

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::auction_category, (atomic_auction)(batch_auction) )
FC_REFLECT_ENUM( gavel::chain::fee_type, (protocol_fee_type)(referrer_fee_type)(max_curator_fee_type) )
FC_REFLECT( gavel::chain::auction_parameters, (price)(min_fill_percent) )
FC_REFLECT( gavel::chain::settlement,
            (total_in)(total_out)(pf_bid)(pf_bidder)(pf_referrer)(pf_refund)(pf_payout)(auction_output) )
FC_REFLECT( gavel::chain::bid_claim, (bid_id)(bidder)(referrer)(paid)(payout)(refund) )
FC_REFLECT( gavel::chain::fee_split, (protocol_fee)(referrer_fee)(net) )
