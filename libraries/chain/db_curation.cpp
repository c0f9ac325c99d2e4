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

#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/lot_object.hpp>
#include <gavel/chain/fixed_point.hpp>

namespace gavel
{
namespace chain
{

void database::set_curator_fee(account_id_type curator, const string &auction_type, uint32_t percent)
{
    try
    {
        const uint32_t max_fee = get_fee(auction_type, max_curator_fee_type);
        GAVEL_ASSERT(percent <= max_fee, invalid_fee_exception,
                     "curator fee ${p} exceeds the maximum ${m} for ${t}", ("p", percent)("m", max_fee)("t", auction_type));

        const auto &idx = get_index_type<curator_fee_index>().indices().get<by_curator>();
        auto itr = idx.find(boost::make_tuple(curator, auction_type));
        if (itr == idx.end())
        {
            create<curator_fee_object>([&](curator_fee_object &c) {
                c.curator = curator;
                c.auction_type = auction_type;
                c.fee = percent;
            });
        }
        else
        {
            modify(*itr, [&](curator_fee_object &c) {
                c.fee = percent;
            });
        }
    }
    FC_CAPTURE_AND_RETHROW((curator)(auction_type)(percent))
}

uint32_t database::get_curator_fee(account_id_type curator, const string &auction_type) const
{
    const auto &idx = get_index_type<curator_fee_index>().indices().get<by_curator>();
    auto itr = idx.find(boost::make_tuple(curator, auction_type));
    return itr == idx.end() ? 0 : itr->fee;
}

amount_type database::curate(account_id_type curator, const lot_object &lot)
{
    try
    {
        lot_guard guard(*this, lot.id);

        GAVEL_ASSERT(lot.fees.has_curator() && lot.fees.curator == curator, not_permitted_exception,
                     "${c} is not the curator of lot ${l}", ("c", curator)("l", lot.id));
        GAVEL_ASSERT(!lot.fees.curated, invalid_state_exception, "lot ${l} is already curated", ("l", lot.id));
        const auto status = get_lot_status(lot);
        GAVEL_ASSERT(status == lot_created || status == lot_started, market_not_active_exception,
                     "lot ${l} cannot be curated while ${s}", ("l", lot.id)("s", status));

        // the curator's fee is re-checked against the current bound, which may have dropped since it was set
        const uint32_t fee = get_curator_fee(curator, lot.auction_type);
        const uint32_t max_fee = get_fee(lot.auction_type, max_curator_fee_type);
        GAVEL_ASSERT(fee <= max_fee, invalid_fee_exception,
                     "curator fee ${p} exceeds the maximum ${m}", ("p", fee)("m", max_fee));

        const amount_type reserve = lot.prefunded ? percent_of(lot.capacity, fee) : amount_type(0);
        modify(lot, [&](lot_object &l) {
            l.fees.curated = true;
            l.fees.curator_fee = fee;
            l.curator_reserve = reserve;
        });

        if (reserve > 0)
        {
            const amount_type received = collect_exact(base_account(lot), lot.base(reserve));
            add_funding(lot, received);
        }

        auto *callbacks = get_lot_callbacks(lot);
        if (callbacks != nullptr && callbacks->has_permission(on_curate_callback))
            callbacks->on_curate(*this, lot, reserve);

        ilog("lot ${l} curated by ${c} at ${f}, reserve ${r}", ("l", lot.id)("c", curator)("f", fee)("r", reserve));
        return reserve;
    }
    FC_CAPTURE_AND_RETHROW((curator)(lot.id))
}

amount_type database::compute_curator_fee(const lot_object &lot, const amount_type &sold) const
{
    if (!lot.fees.curated)
        return 0;
    return percent_of(sold, lot.fees.curator_fee);
}

} // namespace chain
} // namespace gavel
