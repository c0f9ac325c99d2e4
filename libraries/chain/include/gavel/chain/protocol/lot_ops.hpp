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
    * @ingroup operations
    * @brief lists capacity of the base token for sale against the quote token
    *
    * The lot is priced and cleared by the auction module registered under
    * auction_type.  Batch lots, and atomic lots whose callbacks do not send base
    * tokens, escrow capacity with the auction house on creation.
    *
    * @return the id of the new lot
    */
   struct lot_create_operation : public base_operation
   {
      account_id_type          seller;
      string                   auction_type;
      asset_id_type            base_token;
      asset_id_type            quote_token;

      /// zero starts the lot at the current time
      fc::time_point_sec       start;
      uint32_t                 duration = 0;
      amount_type              capacity;

      optional<account_id_type> curator;
      /// name of a registered lot_callbacks implementation
      optional<string>         callbacks;

      auction_parameters       params;

      account_id_type actor()const { return seller; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    * @brief withdraws a lot before it can trade any further; funding returns to the seller
    */
   struct lot_cancel_operation : public base_operation
   {
      account_id_type seller;
      lot_id_type     lot;

      account_id_type actor()const { return seller; }
      void            validate()const {}
   };

   /**
    * @ingroup operations
    * @brief the designated curator approves a lot and locks its curator fee
    */
   struct lot_curate_operation : public base_operation
   {
      account_id_type curator;
      lot_id_type     lot;

      account_id_type actor()const { return curator; }
      void            validate()const {}
   };

   /**
    * @ingroup operations
    * @brief settles a concluded batch lot
    *
    * Anyone may settle.  Proceeds, fees and the partially filled bid are resolved in
    * the same operation.
    *
    * @return the settlement reported by the auction module
    */
   struct lot_settle_operation : public base_operation
   {
      account_id_type caller;
      lot_id_type     lot;

      account_id_type actor()const { return caller; }
      void            validate()const {}
   };

   /**
    * @ingroup operations
    * @brief the seller collects whatever the lot still holds for them
    *
    * @return the quote proceeds paid out
    */
   struct proceeds_claim_operation : public base_operation
   {
      account_id_type seller;
      lot_id_type     lot;

      account_id_type actor()const { return seller; }
      void            validate()const {}
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::lot_create_operation,
            (seller)(auction_type)(base_token)(quote_token)(start)(duration)(capacity)
            (curator)(callbacks)(params) )
FC_REFLECT( gavel::chain::lot_cancel_operation, (seller)(lot) )
FC_REFLECT( gavel::chain::lot_curate_operation, (curator)(lot) )
FC_REFLECT( gavel::chain::lot_settle_operation, (caller)(lot) )
FC_REFLECT( gavel::chain::proceeds_claim_operation, (seller)(lot) )
