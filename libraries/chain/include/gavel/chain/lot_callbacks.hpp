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
#include <gavel/chain/lot_object.hpp>

namespace gavel { namespace chain {

   class database;

   enum callback_permission_flags
   {
      on_create_callback       = 0x01,
      on_cancel_callback       = 0x02,
      on_curate_callback       = 0x04,
      on_purchase_callback     = 0x08,
      on_bid_callback          = 0x10,
      on_settle_callback       = 0x20,
      on_claim_proceeds_callback = 0x40,
      /// the custody account receives the seller's quote proceeds
      receive_quote_tokens     = 0x80,
      /// the custody account supplies base tokens and receives whatever base returns to the seller
      send_base_tokens         = 0x100
   };

   /**
    *  @class lot_callbacks
    *  @brief optional hooks a seller attaches to a lot by name
    *
    *  A hook is only called when its permission flag is set.  Hooks run after the engine has
    *  finished every state change and token movement of the operation; a hook that throws
    *  aborts the whole operation.  Hooks may apply further operations on the database, which
    *  are rejected with reentrancy_exception when they touch the lot being processed.
    */
   class lot_callbacks
   {
      public:
         virtual ~lot_callbacks(){}

         virtual uint32_t        permissions()const = 0;
         virtual account_id_type custody_account()const = 0;

         bool has_permission( uint32_t flag )const { return (permissions() & flag) == flag; }

         virtual void on_create( database& db, const lot_object& lot ) {}
         virtual void on_cancel( database& db, const lot_object& lot, const amount_type& refund ) {}
         virtual void on_curate( database& db, const lot_object& lot, const amount_type& curator_reserve ) {}
         virtual void on_purchase( database& db, const lot_object& lot, account_id_type buyer,
                                   const amount_type& amount, const amount_type& payout ) {}
         virtual void on_bid( database& db, const lot_object& lot, const bid_object& bid ) {}
         virtual void on_settle( database& db, const lot_object& lot, const settlement& result ) {}
         virtual void on_claim_proceeds( database& db, const lot_object& lot,
                                         const amount_type& proceeds, const amount_type& base_returned ) {}
   };

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::callback_permission_flags,
                 (on_create_callback)(on_cancel_callback)(on_curate_callback)(on_purchase_callback)(on_bid_callback)
                 (on_settle_callback)(on_claim_proceeds_callback)(receive_quote_tokens)(send_base_tokens) )
