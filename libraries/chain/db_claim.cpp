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

amount_type database::claim_proceeds(account_id_type seller, const lot_object &lot)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.seller == seller, not_permitted_exception, "only the seller may claim lot ${l}", ("l", lot.id));
        const auto status = get_lot_status(lot);
        if (lot.is_batch())
            GAVEL_ASSERT(status == lot_settled, invalid_state_exception,
                         "batch lot ${l} cannot be claimed while ${s}", ("l", lot.id)("s", status));
        else
            GAVEL_ASSERT(status == lot_concluded, invalid_state_exception,
                         "lot ${l} cannot be claimed while ${s}", ("l", lot.id)("s", status));

        const amount_type proceeds = lot.proceeds_pending;
        const amount_type base_returned = lot.funding;
        modify(lot, [](lot_object &l) {
            l.proceeds_pending = 0;
            l.funding = 0;
            l.state = claimed_lot;
        });

        pay_out(quote_account(lot), lot.quote(proceeds));
        pay_out(base_account(lot), lot.base(base_returned));

        auto *callbacks = get_lot_callbacks(lot);
        if (callbacks != nullptr && callbacks->has_permission(on_claim_proceeds_callback))
            callbacks->on_claim_proceeds(*this, lot, proceeds, base_returned);

        ilog("lot ${l} claimed: ${p} proceeds, ${b} base returned", ("l", lot.id)("p", proceeds)("b", base_returned));
        return proceeds;
    }
    FC_CAPTURE_AND_RETHROW((seller)(lot.id))
}

vector<bid_claim> database::claim_bids(account_id_type bidder, const lot_object &lot, const vector<bid_id_type> &bids)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.is_batch(), not_implemented_exception, "lot ${l} does not take bids", ("l", lot.id));
        GAVEL_ASSERT(lot.state == settled_lot || lot.state == claimed_lot, invalid_state_exception,
                     "bids on lot ${l} cannot be claimed before it settles", ("l", lot.id)("state", lot.state));
        const uint16_t max_bids = get_chain_parameters().max_bids_per_claim;
        GAVEL_ASSERT(bids.size() <= max_bids, invalid_params_exception,
                     "at most ${m} bids may be claimed at once", ("m", max_bids));

        const auto &module = get_auction_module(lot.auction_type);
        vector<bid_claim> claims;
        claims.reserve(bids.size());
        for (const bid_id_type &id : bids)
        {
            const bid_object &bid = get_bid(lot, id);
            GAVEL_ASSERT(bid.bidder == bidder, not_bidder_exception, "${a} did not place bid ${b}", ("a", bidder)("b", id));
            GAVEL_ASSERT(bid.is_live(), invalid_bid_id_exception, "bid ${b} was already claimed", ("b", id));

            bid_claim claim = module.claim_bid(*this, lot, bid);
            GAVEL_ASSERT(checked_add(claim.paid, claim.refund) == bid.amount, accounting_exception,
                         "claim of bid ${b} of ${a} splits into ${p} paid and ${r} refunded",
                         ("b", id)("a", bid.amount)("p", claim.paid)("r", claim.refund));

            release_payout(lot, claim.payout);
            modify(bid, [&claim](bid_object &b) {
                b.status = claim.payout > 0 ? bid_claimed : bid_refunded;
            });
            claims.push_back(claim);
        }

        for (const bid_claim &claim : claims)
        {
            pay_out(bidder, lot.base(claim.payout));
            pay_out(bidder, lot.quote(claim.refund));
        }
        return claims;
    }
    FC_CAPTURE_AND_RETHROW((bidder)(lot.id)(bids))
}

} // namespace chain
} // namespace gavel
