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
#include <gavel/chain/protocol/asset.hpp>
#include <gavel/db/generic_index.hpp>

/**
 * @defgroup tokens Tokens
 *
 * Every token the engine sees, base or quote, is an asset_object.  Token movement
 * goes through database::transfer, which applies the token's transfer fee and its
 * restricted accounts before any balance changes.
 */

namespace gavel { namespace chain {
   class database;

   /**
    *  @brief tracks the parameters of a token
    *  @ingroup object
    */
   class asset_object : public gavel::db::abstract_object<asset_object>
   {
      public:
         static const uint8_t space_id = protocol_ids;
         static const uint8_t type_id  = asset_object_type;

         /// Ticker symbol for this asset, i.e. "USD"
         string symbol;
         /// Maximum number of digits after the decimal point (must be <= 18)
         uint8_t precision = 0;
         /// ID of the account which issued this asset.
         account_id_type issuer;
         /// share of every transfer that is burned on the way, in parts of GAVEL_100_PERCENT
         uint32_t transfer_fee_percent = 0;
         /// accounts that can neither send nor receive this asset
         flat_set<account_id_type> restricted_accounts;

         amount_type current_supply;

         asset amount(amount_type a)const { return asset(a, id); }

         /// the amount a receiver is credited when @ref a is sent
         amount_type amount_received( const amount_type& a )const;
         bool is_restricted( account_id_type account )const { return restricted_accounts.count( account ) != 0; }

         asset_id_type get_id()const { return id; }
   };

   struct by_symbol;
   typedef multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_symbol>, member<asset_object, string, &asset_object::symbol> >
      >
   > asset_object_multi_index_type;
   typedef generic_index<asset_object, asset_object_multi_index_type> asset_index;

} } // gavel::chain

FC_REFLECT_DERIVED( gavel::chain::asset_object, (gavel::db::object),
                    (symbol)
                    (precision)
                    (issuer)
                    (transfer_fee_percent)
                    (restricted_accounts)
                    (current_supply)
                  )
