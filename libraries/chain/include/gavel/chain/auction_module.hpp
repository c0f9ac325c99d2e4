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
#include <gavel/chain/protocol/lot_ops.hpp>
#include <gavel/chain/lot_object.hpp>

namespace gavel { namespace chain {

   class database;

   /**
    *  @class auction_module
    *  @brief prices purchases and clears bids for one auction type
    *
    *  Modules are registered with the database under their keycode and resolved once, when a
    *  lot is created.  They only read the database; every token movement and state change is
    *  made by the engine from what the module returns.
    *
    *  Atomic modules implement purchase(), batch modules implement settle().  The other one
    *  throws not_implemented_exception.
    */
   class auction_module
   {
      public:
         virtual ~auction_module(){}

         virtual auction_category category()const = 0;
         virtual string           keycode()const = 0;

         /// checks the module parameters of a lot about to be created
         virtual void validate_lot( const database& db, const lot_create_operation& op )const = 0;

         /// checks a bid of @ref amount quote, already received, against a batch lot
         virtual void validate_bid( const database& db, const lot_object& lot, const amount_type& amount )const;

         /// @return the base amount bought with @ref amount quote
         virtual amount_type purchase( const database& db, const lot_object& lot, const amount_type& amount )const;

         /**
          *  Clears the live bids of a concluded batch lot.
          *
          *  @param bid_outcomes receives one entry per live bid, in bid id order
          *  @return total_out == 0 when the lot does not settle
          */
         virtual settlement settle( const database& db, const lot_object& lot, vector<bid_claim>& bid_outcomes )const;

         /// what claiming @ref bid pays; the default reads the outcome stored at settlement
         virtual bid_claim claim_bid( const database& db, const lot_object& lot, const bid_object& bid )const;
   };

} } // gavel::chain
