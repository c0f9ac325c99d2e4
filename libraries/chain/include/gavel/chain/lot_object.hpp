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
#include <gavel/chain/protocol/auction.hpp>
#include <gavel/chain/protocol/types.hpp>
#include <gavel/db/generic_index.hpp>
#include <gavel/db/object.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace gavel { namespace chain {

using namespace gavel::db;

/// what has been done to a lot; the time dependent part of its status is derived, see lot_object::get_status
enum lot_state
{
   active_lot    = 0,
   cancelled_lot = 1,
   settled_lot   = 2,
   claimed_lot   = 3
};

enum lot_status
{
   lot_created   = 0,
   lot_started   = 1,
   lot_cancelled = 2,
   lot_concluded = 3,
   lot_settled   = 4,
   lot_claimed   = 5
};

enum curation_status
{
   no_curator         = 0,
   curator_set        = 1,
   curator_fee_locked = 2,
   curator_approved   = 3
};

/**
 *  Fee percents that apply to one lot.  protocol_fee and referrer_fee are copied from the
 *  auction type's fee_config_object once, at the first point fees can accrue; curator_fee is
 *  copied from the curator's curator_fee_object when the curator approves the lot.
 */
struct lot_fee_data
{
   account_id_type curator      = GAVEL_NULL_ACCOUNT;
   bool            curated      = false;
   uint32_t        curator_fee  = 0;

   bool            fees_locked  = false;
   uint32_t        protocol_fee = 0;
   uint32_t        referrer_fee = 0;

   bool has_curator()const { return curator != GAVEL_NULL_ACCOUNT; }
};

/**
 *  @brief one auction of base tokens against quote tokens
 *  @ingroup object
 *  @ingroup protocol
 *
 *  funding is the base token the auction house holds for this lot.  It covers the unsold
 *  capacity and the curator reserve; base already owed to winning bidders is tracked apart,
 *  in payouts_pending, and quote owed to the seller in proceeds_pending.
 */
class lot_object : public abstract_object<lot_object>
{
   public:
      static const uint8_t space_id = protocol_ids;
      static const uint8_t type_id  = lot_object_type;

      // routing
      account_id_type          seller;
      string                   auction_type;
      auction_category         category = atomic_auction;
      asset_id_type            base_token;
      asset_id_type            quote_token;
      optional<string>         callbacks;
      amount_type              funding;
      bool                     prefunded = false;

      // core
      time_point_sec           start;
      time_point_sec           conclusion;
      amount_type              capacity;
      amount_type              sold;       ///< base
      amount_type              purchased;  ///< quote
      auction_parameters       params;
      lot_state                state = active_lot;

      lot_fee_data             fees;
      amount_type              curator_reserve;

      optional<settlement>     result;
      amount_type              payouts_pending;
      amount_type              proceeds_pending;

      bool is_batch()const { return category == batch_auction; }
      bool sold_out()const { return sold >= capacity; }
      amount_type remaining()const { return sold >= capacity ? amount_type(0) : capacity - sold; }

      lot_status get_status( time_point_sec now )const
      {
         switch( state )
         {
            case cancelled_lot: return lot_cancelled;
            case settled_lot:   return lot_settled;
            case claimed_lot:   return lot_claimed;
            default: break;
         }
         if( now < start ) return lot_created;
         if( now >= conclusion || ( !is_batch() && sold_out() ) ) return lot_concluded;
         return lot_started;
      }

      lot_id_type get_id()const { return id; }

      asset base( const amount_type& a )const  { return asset( a, base_token ); }
      asset quote( const amount_type& a )const { return asset( a, quote_token ); }
};

enum bid_status
{
   bid_unclaimed = 0,
   bid_claimed   = 1,
   bid_refunded  = 2
};

/**
 *  @brief quote tokens committed to a batch lot
 *  @ingroup object
 *
 *  amount is held by the auction house until the bid is refunded or claimed.  paid, payout
 *  and refund are fixed when the lot settles.
 */
class bid_object : public abstract_object<bid_object>
{
   public:
      static const uint8_t space_id = protocol_ids;
      static const uint8_t type_id  = bid_object_type;

      lot_id_type      lot;
      account_id_type  bidder;
      account_id_type  referrer = GAVEL_NULL_ACCOUNT;
      amount_type      amount;
      bid_status       status = bid_unclaimed;

      amount_type      paid;
      amount_type      payout;
      amount_type      refund;

      bool is_live()const { return status == bid_unclaimed; }
      bid_id_type get_id()const { return id; }
};

struct by_seller;
struct by_lot;
struct by_bidder;
typedef multi_index_container<
   lot_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_seller>,
         composite_key< lot_object,
            member< lot_object, account_id_type, &lot_object::seller>,
            member< object, object_id_type, &object::id>
         >
      >
   >
> lot_multi_index_type;

typedef generic_index<lot_object, lot_multi_index_type> lot_index;

typedef multi_index_container<
   bid_object,
   indexed_by<
      ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
      ordered_unique< tag<by_lot>,
         composite_key< bid_object,
            member< bid_object, lot_id_type, &bid_object::lot>,
            member< object, object_id_type, &object::id>
         >
      >,
      ordered_unique< tag<by_bidder>,
         composite_key< bid_object,
            member< bid_object, account_id_type, &bid_object::bidder>,
            member< object, object_id_type, &object::id>
         >
      >
   >
> bid_multi_index_type;

typedef generic_index<bid_object, bid_multi_index_type> bid_index;

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::lot_state, (active_lot)(cancelled_lot)(settled_lot)(claimed_lot) )
FC_REFLECT_ENUM( gavel::chain::lot_status,
                 (lot_created)(lot_started)(lot_cancelled)(lot_concluded)(lot_settled)(lot_claimed) )
FC_REFLECT_ENUM( gavel::chain::curation_status, (no_curator)(curator_set)(curator_fee_locked)(curator_approved) )
FC_REFLECT_ENUM( gavel::chain::bid_status, (bid_unclaimed)(bid_claimed)(bid_refunded) )

FC_REFLECT( gavel::chain::lot_fee_data,
            (curator)(curated)(curator_fee)(fees_locked)(protocol_fee)(referrer_fee) )

FC_REFLECT_DERIVED( gavel::chain::lot_object, (gavel::db::object),
                    (seller)(auction_type)(category)(base_token)(quote_token)(callbacks)(funding)(prefunded)
                    (start)(conclusion)(capacity)(sold)(purchased)(params)(state)
                    (fees)(curator_reserve)(result)(payouts_pending)(proceeds_pending)
                  )

FC_REFLECT_DERIVED( gavel::chain::bid_object, (gavel::db::object),
                    (lot)(bidder)(referrer)(amount)(status)(paid)(payout)(refund)
                  )
