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

#include <gavel/chain/lot_object.hpp>
#include <gavel/chain/fixed_point.hpp>

namespace gavel
{
namespace chain
{

void database::verify_settlement(const lot_object &lot, const settlement &result,
                                 const vector<const bid_object *> &live_bids,
                                 const vector<bid_claim> &outcomes) const
{
    GAVEL_ASSERT(result.total_out <= lot.capacity, accounting_exception,
                 "settlement sells ${o}, more than the capacity ${c}", ("o", result.total_out)("c", lot.capacity));
    GAVEL_ASSERT(result.pf_refund <= result.total_in, accounting_exception,
                 "partial fill refund ${r} exceeds the total in ${i}", ("r", result.pf_refund)("i", result.total_in));
    GAVEL_ASSERT(outcomes.size() == live_bids.size(), accounting_exception,
                 "module reported ${o} outcomes for ${b} live bids", ("o", outcomes.size())("b", live_bids.size()));

    amount_type paid;
    amount_type payout;
    for (size_t i = 0; i < outcomes.size(); ++i)
    {
        const bid_claim &outcome = outcomes[i];
        const bid_object &bid = *live_bids[i];
        GAVEL_ASSERT(outcome.bid_id == bid.id, accounting_exception,
                     "outcome for ${o} reported in place of ${b}", ("o", outcome.bid_id)("b", bid.id));
        GAVEL_ASSERT(checked_add(outcome.paid, outcome.refund) == bid.amount, accounting_exception,
                     "bid ${b} of ${a} split into ${p} paid and ${r} refunded",
                     ("b", bid.id)("a", bid.amount)("p", outcome.paid)("r", outcome.refund));
        paid = checked_add(paid, outcome.paid);
        payout = checked_add(payout, outcome.payout);
    }

    GAVEL_ASSERT(paid == result.total_in - result.pf_refund, accounting_exception,
                 "bids paid ${p}, settlement reports ${i} in", ("p", paid)("i", result.total_in - result.pf_refund));
    GAVEL_ASSERT(payout == result.total_out, accounting_exception,
                 "bids receive ${p}, settlement reports ${o} out", ("p", payout)("o", result.total_out));
}

settlement database::settle(const lot_object &lot)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.is_batch(), not_implemented_exception, "lot ${l} does not settle", ("l", lot.id));
        const auto status = get_lot_status(lot);
        GAVEL_ASSERT(status == lot_concluded, invalid_state_exception,
                     "lot ${l} cannot be settled while ${s}", ("l", lot.id)("s", status));

        vector<const bid_object *> live_bids;
        const auto &by_lot_idx = get_index_type<bid_index>().indices().get<by_lot>();
        auto range = by_lot_idx.equal_range(boost::make_tuple(lot.id));
        for (auto itr = range.first; itr != range.second; ++itr)
            if (itr->is_live())
                live_bids.push_back(&*itr);

        vector<bid_claim> outcomes;
        settlement result = get_auction_module(lot.auction_type).settle(*this, lot, outcomes);
        const bool push = get_chain_parameters().push_proceeds;
        auto *callbacks = get_lot_callbacks(lot);

        if (!result.settled())
        {
            // every bid is refunded in full and the capacity goes back to the seller
            for (const bid_object *bid : live_bids)
                modify(*bid, [](bid_object &b) {
                    b.paid = 0;
                    b.payout = 0;
                    b.refund = b.amount;
                });

            const amount_type base_return = push ? lot.funding : amount_type(0);
            modify(lot, [&](lot_object &l) {
                l.state = settled_lot;
                l.result = result;
                if (push)
                    l.funding = 0;
            });
            pay_out(base_account(lot), lot.base(base_return));

            wlog("lot ${l} did not settle, ${n} bids to refund", ("l", lot.id)("n", live_bids.size()));
            if (callbacks != nullptr && callbacks->has_permission(on_settle_callback))
                callbacks->on_settle(*this, lot, result);
            return result;
        }

        verify_settlement(lot, result, live_bids, outcomes);

        lock_in_fees(lot);

        const amount_type effective_in = result.total_in - result.pf_refund;
        const amount_type protocol_fee = percent_of(effective_in, lot.fees.protocol_fee);
        // referrer fees are floored per bid on what that bid paid, then summed per referrer, so a
        // referrer with many small bids can receive less than the fee on their combined total
        std::map<account_id_type, amount_type> referrer_fees;
        amount_type referrer_total;
        for (size_t i = 0; i < outcomes.size(); ++i)
        {
            const account_id_type referrer = live_bids[i]->referrer;
            if (referrer == GAVEL_NULL_ACCOUNT)
                continue;
            const amount_type fee = percent_of(outcomes[i].paid, lot.fees.referrer_fee);
            referrer_fees[referrer] = checked_add(referrer_fees[referrer], fee);
            referrer_total = checked_add(referrer_total, fee);
        }
        const amount_type seller_net = checked_sub(effective_in, checked_add(protocol_fee, referrer_total));

        const amount_type curator_fee = compute_curator_fee(lot, result.total_out);
        release_funding(lot, checked_add(result.total_out, curator_fee));

        for (size_t i = 0; i < outcomes.size(); ++i)
        {
            const bid_claim &outcome = outcomes[i];
            const bool partial = result.has_partial_fill() && *result.pf_bid == outcome.bid_id;
            modify(*live_bids[i], [&](bid_object &b) {
                b.paid = outcome.paid;
                b.payout = outcome.payout;
                b.refund = outcome.refund;
                if (partial)
                    b.status = bid_claimed;
            });
        }

        accrue_reward(GAVEL_PROTOCOL_ACCOUNT, lot.quote_token, protocol_fee);
        for (const auto &item : referrer_fees)
            accrue_reward(item.first, lot.quote_token, item.second);

        amount_type base_return;
        modify(lot, [&](lot_object &l) {
            l.state = settled_lot;
            l.result = result;
            l.sold = result.total_out;
            l.purchased = effective_in;
            l.payouts_pending = result.total_out - result.pf_payout;
            if (push)
            {
                base_return = l.funding;
                l.funding = 0;
            }
            else
            {
                l.proceeds_pending = checked_add(l.proceeds_pending, seller_net);
            }
        });

        pay_out(lot.fees.curator, lot.base(curator_fee));
        if (push)
        {
            pay_out(quote_account(lot), lot.quote(seller_net));
            pay_out(base_account(lot), lot.base(base_return));
        }
        if (result.has_partial_fill())
        {
            pay_out(result.pf_bidder, lot.base(result.pf_payout));
            pay_out(result.pf_bidder, lot.quote(result.pf_refund));
        }

        if (callbacks != nullptr && callbacks->has_permission(on_settle_callback))
            callbacks->on_settle(*this, lot, result);

        ilog("lot ${l} settled: ${o} sold for ${i}, protocol fee ${p}, referrer fees ${r}, curator fee ${c}",
             ("l", lot.id)("o", result.total_out)("i", effective_in)("p", protocol_fee)("r", referrer_total)("c", curator_fee));
        return result;
    }
    FC_CAPTURE_AND_RETHROW((lot.id))
}

} // namespace chain
} // namespace gavel
