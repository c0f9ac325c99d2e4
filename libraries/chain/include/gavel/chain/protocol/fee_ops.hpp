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
    * @brief governance sets one fee percent for an auction type
    *
    * Lots that have already locked their fees keep them; every later lock-in of that
    * auction type reads the new value.
    */
   struct fee_config_update_operation : public base_operation
   {
      account_id_type governor = GAVEL_PROTOCOL_ACCOUNT;
      string          auction_type;
      fee_type        type = protocol_fee_type;
      uint32_t        percent = 0;

      account_id_type actor()const { return governor; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    * @brief a curator sets the fee it charges on lots of one auction type
    */
   struct curator_fee_update_operation : public base_operation
   {
      account_id_type curator;
      string          auction_type;
      uint32_t        percent = 0;

      account_id_type actor()const { return curator; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    * @brief withdraws the protocol or referrer fees accrued to an account in one token
    *
    * @return the amount paid out
    */
   struct rewards_claim_operation : public base_operation
   {
      account_id_type recipient;
      asset_id_type   token;

      account_id_type actor()const { return recipient; }
      void            validate()const {}
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::fee_config_update_operation, (governor)(auction_type)(type)(percent) )
FC_REFLECT( gavel::chain::curator_fee_update_operation, (curator)(auction_type)(percent) )
FC_REFLECT( gavel::chain::rewards_claim_operation, (recipient)(token) )
