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
#include <gavel/chain/protocol/base.hpp>

namespace gavel { namespace chain {

   /**
    *  @class bid_operation
    *  @brief commits quote tokens to a batch lot
    *  @ingroup operations
    *
    *  The bid is escrowed with the auction house at the amount actually received.
    *
    *  @return the id of the new bid
    */
   struct bid_operation : public base_operation
   {
      account_id_type bidder;
      lot_id_type     lot;
      account_id_type referrer = GAVEL_NULL_ACCOUNT;
      amount_type     amount;

      account_id_type actor()const { return bidder; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief withdraws a bid from a batch lot that is still running
    */
   struct bid_refund_operation : public base_operation
   {
      account_id_type bidder;
      lot_id_type     lot;
      bid_id_type     bid;

      account_id_type actor()const { return bidder; }
      void            validate()const {}
   };

   /**
    *  @class purchase_operation
    *  @brief buys from an atomic lot at the module's price
    *  @ingroup operations
    *
    *  Fails when the base amount received would be less than min_amount_out.
    *
    *  @return the base amount paid to recipient
    */
   struct purchase_operation : public base_operation
   {
      account_id_type buyer;
      lot_id_type     lot;
      account_id_type recipient;
      account_id_type referrer = GAVEL_NULL_ACCOUNT;
      amount_type     amount;
      amount_type     min_amount_out;

      account_id_type actor()const { return buyer; }
      void            validate()const;
   };

   /**
    *  @ingroup operations
    *  @brief pays out settled bids, or refunds them when the lot did not settle
    *
    *  @return one bid_claim per bid, in the order given
    */
   struct bids_claim_operation : public base_operation
   {
      account_id_type     bidder;
      lot_id_type         lot;
      vector<bid_id_type> bids;

      account_id_type actor()const { return bidder; }
      void            validate()const;
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::bid_operation, (bidder)(lot)(referrer)(amount) )
FC_REFLECT( gavel::chain::bid_refund_operation, (bidder)(lot)(bid) )
FC_REFLECT( gavel::chain::purchase_operation, (buyer)(lot)(recipient)(referrer)(amount)(min_amount_out) )
FC_REFLECT( gavel::chain::bids_claim_operation, (bidder)(lot)(bids) )
