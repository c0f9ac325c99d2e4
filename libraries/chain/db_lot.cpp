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
#include <gavel/chain/database.hpp>

#include <gavel/chain/account_object.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/lot_object.hpp>
#include <gavel/chain/fixed_point.hpp>

namespace gavel
{
namespace chain
{

account_id_type database::base_account(const lot_object &lot) const
{
    auto *callbacks = get_lot_callbacks(lot);
    if (callbacks != nullptr && callbacks->has_permission(send_base_tokens))
        return callbacks->custody_account();
    return lot.seller;
}

account_id_type database::quote_account(const lot_object &lot) const
{
    auto *callbacks = get_lot_callbacks(lot);
    if (callbacks != nullptr && callbacks->has_permission(receive_quote_tokens))
        return callbacks->custody_account();
    return lot.seller;
}

const lot_object &database::create_lot(const lot_create_operation &op)
{
    try
    {
        const auto *module = find_auction_module(op.auction_type);
        GAVEL_ASSERT(module != nullptr, lot_create_unknown_auction_type,
                     "no auction module registered for ${t}", ("t", op.auction_type));

        lot_callbacks *callbacks = nullptr;
        if (op.callbacks.valid())
        {
            callbacks = find_callbacks(*op.callbacks);
            GAVEL_ASSERT(callbacks != nullptr, lot_create_unknown_callbacks,
                         "no callbacks registered under ${n}", ("n", *op.callbacks));
        }

        module->validate_lot(*this, op);

        const time_point_sec now = head_time();
        const time_point_sec start = op.start == time_point_sec() ? now : op.start;
        GAVEL_ASSERT(start >= now, invalid_params_exception, "lot would start in the past", ("start", start)("now", now));

        const bool prefunded = module->category() == batch_auction ||
                               callbacks == nullptr || !callbacks->has_permission(send_base_tokens);

        const lot_object &lot = create<lot_object>([&](lot_object &l) {
            l.seller = op.seller;
            l.auction_type = op.auction_type;
            l.category = module->category();
            l.base_token = op.base_token;
            l.quote_token = op.quote_token;
            l.callbacks = op.callbacks;
            l.prefunded = prefunded;
            l.start = start;
            l.conclusion = start + op.duration;
            l.capacity = op.capacity;
            l.params = op.params;
            if (op.curator.valid())
                l.fees.curator = *op.curator;
        });

        if (prefunded)
        {
            const amount_type received = collect_exact(base_account(lot), lot.base(op.capacity));
            add_funding(lot, received);
        }

        if (callbacks != nullptr && callbacks->has_permission(on_create_callback))
            callbacks->on_create(*this, lot);

        ilog("lot ${l} created by ${s}: ${c} of ${b} for ${q} via ${t}",
             ("l", lot.id)("s", op.seller)("c", op.capacity)("b", op.base_token)("q", op.quote_token)("t", op.auction_type));
        return lot;
    }
    FC_CAPTURE_AND_RETHROW((op))
}

void database::cancel_lot(account_id_type seller, const lot_object &lot)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.seller == seller, not_permitted_exception, "only the seller may cancel lot ${l}", ("l", lot.id));
        const auto status = get_lot_status(lot);
        if (lot.is_batch())
            GAVEL_ASSERT(status == lot_created, market_not_active_exception,
                         "batch lot ${l} cannot be cancelled once started", ("l", lot.id)("status", status));
        else
            GAVEL_ASSERT(status == lot_created || status == lot_started, market_not_active_exception,
                         "lot ${l} cannot be cancelled while ${s}", ("l", lot.id)("s", status));

        const amount_type refund = lot.funding;
        const amount_type proceeds = lot.proceeds_pending;
        modify(lot, [](lot_object &l) {
            l.state = cancelled_lot;
            l.funding = 0;
            l.proceeds_pending = 0;
        });

        pay_out(base_account(lot), lot.base(refund));
        pay_out(quote_account(lot), lot.quote(proceeds));

        auto *callbacks = get_lot_callbacks(lot);
        if (callbacks != nullptr && callbacks->has_permission(on_cancel_callback))
            callbacks->on_cancel(*this, lot, refund);

        ilog("lot ${l} cancelled, ${r} returned to the seller", ("l", lot.id)("r", refund));
    }
    FC_CAPTURE_AND_RETHROW((seller)(lot.id))
}

const bid_object &database::place_bid(const bid_operation &op)
{
    try
    {
        const lot_object &lot = get_lot(op.lot);
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.is_batch(), not_implemented_exception, "lot ${l} does not take bids", ("l", lot.id));
        const auto status = get_lot_status(lot);
        GAVEL_ASSERT(status == lot_started, market_not_active_exception,
                     "lot ${l} does not take bids while ${s}", ("l", lot.id)("s", status));

        lock_in_fees(lot);

        const amount_type received = collect(op.bidder, lot.quote(op.amount));
        GAVEL_ASSERT(received > 0, invalid_params_exception, "nothing received for the bid");
        get_auction_module(lot.auction_type).validate_bid(*this, lot, received);

        const bid_object &bid = create<bid_object>([&](bid_object &b) {
            b.lot = lot.id;
            b.bidder = op.bidder;
            b.referrer = op.referrer;
            b.amount = received;
        });

        auto *callbacks = get_lot_callbacks(lot);
        if (callbacks != nullptr && callbacks->has_permission(on_bid_callback))
            callbacks->on_bid(*this, lot, bid);

        return bid;
    }
    FC_CAPTURE_AND_RETHROW((op))
}

void database::refund_bid(account_id_type bidder, const lot_object &lot, const bid_object &bid)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.is_batch(), not_implemented_exception, "lot ${l} does not take bids", ("l", lot.id));
        GAVEL_ASSERT(bid.lot == lot.id, invalid_bid_id_exception, "bid ${b} does not belong to lot ${l}", ("b", bid.id)("l", lot.id));
        GAVEL_ASSERT(bid.bidder == bidder, not_bidder_exception, "${a} did not place bid ${b}", ("a", bidder)("b", bid.id));
        const auto status = get_lot_status(lot);
        GAVEL_ASSERT(status == lot_started, market_not_active_exception,
                     "bids on lot ${l} cannot be refunded while ${s}", ("l", lot.id)("s", status));
        GAVEL_ASSERT(bid.is_live(), invalid_bid_id_exception, "bid ${b} was already refunded or claimed", ("b", bid.id));

        const amount_type refund = bid.amount;
        modify(bid, [&refund](bid_object &b) {
            b.status = bid_refunded;
            b.refund = refund;
        });

        pay_out(bidder, lot.quote(refund));
    }
    FC_CAPTURE_AND_RETHROW((bidder)(lot.id)(bid.id))
}

amount_type database::purchase(const purchase_operation &op)
{
    try
    {
        const lot_object &lot = get_lot(op.lot);
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(!lot.is_batch(), not_implemented_exception, "lot ${l} does not sell atomically", ("l", lot.id));
        const auto status = get_lot_status(lot);
        GAVEL_ASSERT(status == lot_started, market_not_active_exception,
                     "lot ${l} does not sell while ${s}", ("l", lot.id)("s", status));

        lock_in_fees(lot);

        const amount_type received = collect(op.buyer, lot.quote(op.amount));
        GAVEL_ASSERT(received > 0, invalid_params_exception, "nothing received for the purchase");

        const amount_type payout = get_auction_module(lot.auction_type).purchase(*this, lot, received);
        GAVEL_ASSERT(payout <= lot.remaining(), accounting_exception,
                     "module sold ${p} with only ${r} remaining", ("p", payout)("r", lot.remaining()));
        GAVEL_ASSERT(payout >= op.min_amount_out, purchase_amount_out_below_minimum,
                     "purchase pays ${p}, below the minimum ${m}", ("p", payout)("m", op.min_amount_out));

        const bool has_referrer = op.referrer != GAVEL_NULL_ACCOUNT;
        const fee_split split = compute_fee_split(received, lot.fees.protocol_fee, lot.fees.referrer_fee, has_referrer);
        const amount_type curator_fee = compute_curator_fee(lot, payout);
        dlog("lot ${l} purchase of ${a}: ${s}, curator fee ${c}", ("l", lot.id)("a", received)("s", split)("c", curator_fee));

        if (lot.prefunded)
            release_funding(lot, checked_add(payout, curator_fee));

        accrue_reward(GAVEL_PROTOCOL_ACCOUNT, lot.quote_token, split.protocol_fee);
        if (has_referrer)
            accrue_reward(op.referrer, lot.quote_token, split.referrer_fee);

        const bool push = get_chain_parameters().push_proceeds;
        const amount_type sold = checked_add(lot.sold, payout);
        const amount_type purchased = checked_add(lot.purchased, received);
        const amount_type proceeds = push ? lot.proceeds_pending : checked_add(lot.proceeds_pending, split.net);
        modify(lot, [&](lot_object &l) {
            l.sold = sold;
            l.purchased = purchased;
            l.proceeds_pending = proceeds;
        });

        if (push)
            pay_out(quote_account(lot), lot.quote(split.net));
        if (lot.prefunded)
        {
            pay_out(op.recipient, lot.base(payout));
            pay_out(lot.fees.curator, lot.base(curator_fee));
        }
        else
        {
            const account_id_type custody = base_account(lot);
            transfer(custody, op.recipient, lot.base(payout));
            if (curator_fee > 0)
                transfer(custody, lot.fees.curator, lot.base(curator_fee));
        }

        auto *callbacks = get_lot_callbacks(lot);
        if (callbacks != nullptr && callbacks->has_permission(on_purchase_callback))
            callbacks->on_purchase(*this, lot, op.buyer, received, payout);

        return payout;
    }
    FC_CAPTURE_AND_RETHROW((op))
}

} // namespace chain
} // namespace gavel
