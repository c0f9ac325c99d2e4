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
#include <gavel/chain/auction_module.hpp>

namespace gavel { namespace chain {

   /**
    *  @brief atomic sale at a fixed price
    *
    *  Every purchase is filled at once at params.price, quote per whole base token at 18
    *  decimals.  A purchase that would buy more than the remaining capacity fails.
    */
   class fixed_price_sale : public auction_module
   {
      public:
         virtual auction_category category()const override { return atomic_auction; }
         virtual string           keycode()const override  { return GAVEL_FIXED_PRICE_SALE_KEYCODE; }

         virtual void        validate_lot( const database& db, const lot_create_operation& op )const override;
         virtual amount_type purchase( const database& db, const lot_object& lot, const amount_type& amount )const override;
   };

   /**
    *  @brief batch auction at a fixed price
    *
    *  Bids are filled in the order they were placed until capacity runs out; the bid that
    *  crosses the boundary is filled partially and the rest of it refunded.  When less than
    *  params.min_fill_percent of capacity would sell, nothing settles.
    */
   class fixed_price_batch : public auction_module
   {
      public:
         virtual auction_category category()const override { return batch_auction; }
         virtual string           keycode()const override  { return GAVEL_FIXED_PRICE_BATCH_KEYCODE; }

         virtual void        validate_lot( const database& db, const lot_create_operation& op )const override;
         virtual void        validate_bid( const database& db, const lot_object& lot, const amount_type& amount )const override;
         virtual settlement  settle( const database& db, const lot_object& lot, vector<bid_claim>& bid_outcomes )const override;
   };

   /// base amount bought with @ref quote_amount at @ref price, rounded down
   amount_type quote_to_base( const amount_type& quote_amount, const amount_type& price,
                              uint8_t quote_precision, uint8_t base_precision );
   /// quote amount needed to buy @ref base_amount at @ref price, rounded up
   amount_type base_to_quote( const amount_type& base_amount, const amount_type& price,
                              uint8_t base_precision, uint8_t quote_precision );

} } // gavel::chain
