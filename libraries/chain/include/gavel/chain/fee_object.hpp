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

namespace gavel { namespace chain {

   /**
    *  @brief the fees governance charges on lots of one auction type
    *  @ingroup object
    *  @ingroup implementation
    *
    *  All percents are parts of GAVEL_100_PERCENT.  protocol_fee + referrer_fee never exceeds
    *  GAVEL_100_PERCENT.  Lots copy protocol_fee and referrer_fee when they lock their fees, so
    *  later updates only reach lots that have not locked yet.
    */
   class fee_config_object : public abstract_object<fee_config_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_fee_config_object_type;

         string   auction_type;
         uint32_t protocol_fee    = 0;
         uint32_t referrer_fee    = 0;
         uint32_t max_curator_fee = 0;

         uint32_t get( fee_type kind )const;
   };

   /**
    *  @brief the fee a curator charges on lots of one auction type
    *  @ingroup object
    *  @ingroup implementation
    */
   class curator_fee_object : public abstract_object<curator_fee_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_curator_fee_object_type;

         account_id_type curator;
         string          auction_type;
         uint32_t        fee = 0;
   };

   /**
    *  @brief protocol and referrer fees accrued to an account, waiting to be claimed
    *  @ingroup object
    *  @ingroup implementation
    *
    *  The tokens themselves are held by the auction house account.
    */
   class reward_balance_object : public abstract_object<reward_balance_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_reward_balance_object_type;

         account_id_type recipient;
         asset_id_type   asset_type;
         amount_type     balance;
   };

   struct by_auction_type;
   struct by_curator;
   struct by_recipient_asset;
   struct by_asset;

   typedef multi_index_container<
      fee_config_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_auction_type>, member< fee_config_object, string, &fee_config_object::auction_type > >
      >
   > fee_config_multi_index_type;
   typedef generic_index<fee_config_object, fee_config_multi_index_type> fee_config_index;

   typedef multi_index_container<
      curator_fee_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_curator>,
            composite_key< curator_fee_object,
               member< curator_fee_object, account_id_type, &curator_fee_object::curator >,
               member< curator_fee_object, string, &curator_fee_object::auction_type >
            >
         >
      >
   > curator_fee_multi_index_type;
   typedef generic_index<curator_fee_object, curator_fee_multi_index_type> curator_fee_index;

   typedef multi_index_container<
      reward_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_recipient_asset>,
            composite_key< reward_balance_object,
               member< reward_balance_object, account_id_type, &reward_balance_object::recipient >,
               member< reward_balance_object, asset_id_type, &reward_balance_object::asset_type >
            >
         >,
         ordered_unique< tag<by_asset>,
            composite_key< reward_balance_object,
               member< reward_balance_object, asset_id_type, &reward_balance_object::asset_type >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > reward_balance_multi_index_type;
   typedef generic_index<reward_balance_object, reward_balance_multi_index_type> reward_balance_index;

} } // gavel::chain

FC_REFLECT_DERIVED( gavel::chain::fee_config_object, (gavel::db::object),
                    (auction_type)(protocol_fee)(referrer_fee)(max_curator_fee) )
FC_REFLECT_DERIVED( gavel::chain::curator_fee_object, (gavel::db::object),
                    (curator)(auction_type)(fee) )
FC_REFLECT_DERIVED( gavel::chain::reward_balance_object, (gavel::db::object),
                    (recipient)(asset_type)(balance) )
