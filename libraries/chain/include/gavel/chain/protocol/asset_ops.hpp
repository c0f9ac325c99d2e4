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

   bool is_valid_symbol( const string& symbol );

   /**
    * @ingroup operations
    * @brief creates a token that can be auctioned or used as payment
    *
    * precision is the number of decimals of the token's native unit and must lie in
    * [GAVEL_MIN_ASSET_PRECISION_DIGITS, GAVEL_MAX_ASSET_PRECISION_DIGITS].
    *
    * A non zero transfer_fee_percent makes the token burn that share of every
    * transfer, so the receiver gets less than the sender sent.
    */
   struct asset_create_operation : public base_operation
   {
      account_id_type issuer;
      string          symbol;
      uint8_t         precision = 18;
      uint32_t        transfer_fee_percent = 0;

      account_id_type actor()const { return issuer; }
      void            validate()const;
   };

   /**
    * @ingroup operations
    * @brief mints new supply of a token to an account; only the issuer may issue
    */
   struct asset_issue_operation : public base_operation
   {
      account_id_type issuer;
      asset           asset_to_issue;
      account_id_type issue_to_account;

      account_id_type actor()const { return issuer; }
      void            validate()const;
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::asset_create_operation, (issuer)(symbol)(precision)(transfer_fee_percent) )
FC_REFLECT( gavel::chain::asset_issue_operation, (issuer)(asset_to_issue)(issue_to_account) )
