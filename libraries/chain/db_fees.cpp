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

void database::set_fee(const string &auction_type, fee_type kind, uint32_t percent)
{
    try
    {
        GAVEL_ASSERT(percent <= GAVEL_100_PERCENT, invalid_fee_exception, "fee ${p} exceeds 100%", ("p", percent));

        const fee_config_object *config = find_fee_config(auction_type);
        if (config == nullptr)
        {
            config = &create<fee_config_object>([&](fee_config_object &c) {
                c.auction_type = auction_type;
            });
        }

        const uint64_t protocol = kind == protocol_fee_type ? percent : config->protocol_fee;
        const uint64_t referrer = kind == referrer_fee_type ? percent : config->referrer_fee;
        GAVEL_ASSERT(protocol + referrer <= GAVEL_100_PERCENT, invalid_fee_exception,
                     "protocol fee ${p} and referrer fee ${r} together exceed 100%", ("p", protocol)("r", referrer));

        modify(*config, [&](fee_config_object &c) {
            switch (kind)
            {
            case protocol_fee_type:
                c.protocol_fee = percent;
                break;
            case referrer_fee_type:
                c.referrer_fee = percent;
                break;
            case max_curator_fee_type:
                c.max_curator_fee = percent;
                break;
            }
        });
        ilog("${t} ${k} set to ${p}", ("t", auction_type)("k", kind)("p", percent));
    }
    FC_CAPTURE_AND_RETHROW((auction_type)(kind)(percent))
}

const fee_config_object *database::find_fee_config(const string &auction_type) const
{
    const auto &idx = get_index_type<fee_config_index>().indices().get<by_auction_type>();
    auto itr = idx.find(auction_type);
    if (itr == idx.end())
        return nullptr;
    return &*itr;
}

uint32_t database::get_fee(const string &auction_type, fee_type kind) const
{
    const fee_config_object *config = find_fee_config(auction_type);
    return config == nullptr ? 0 : config->get(kind);
}

void database::lock_in_fees(const lot_object &lot)
{
    if (lot.fees.fees_locked)
        return;

    const uint32_t protocol = get_fee(lot.auction_type, protocol_fee_type);
    const uint32_t referrer = get_fee(lot.auction_type, referrer_fee_type);
    modify(lot, [&](lot_object &l) {
        l.fees.fees_locked = true;
        l.fees.protocol_fee = protocol;
        l.fees.referrer_fee = referrer;
    });
    dlog("lot ${l} locked protocol fee ${p} and referrer fee ${r}", ("l", lot.id)("p", protocol)("r", referrer));
}

fee_split database::compute_fee_split(const amount_type &gross, uint32_t protocol_percent,
                                      uint32_t referrer_percent, bool has_referrer)
{
    try
    {
        GAVEL_ASSERT(uint64_t(protocol_percent) + referrer_percent <= GAVEL_100_PERCENT, invalid_fee_exception,
                     "protocol fee ${p} and referrer fee ${r} together exceed 100%",
                     ("p", protocol_percent)("r", referrer_percent));
        fee_split split;
        split.protocol_fee = percent_of(gross, protocol_percent);
        // without a referrer its share stays with the seller
        split.referrer_fee = has_referrer ? percent_of(gross, referrer_percent) : amount_type(0);
        split.net = checked_sub(checked_sub(gross, split.protocol_fee), split.referrer_fee);
        return split;
    }
    FC_CAPTURE_AND_RETHROW((gross)(protocol_percent)(referrer_percent)(has_referrer))
}

void database::accrue_reward(account_id_type recipient, asset_id_type token, const amount_type &amount)
{
    try
    {
        if (amount == 0)
            return;

        const auto &idx = get_index_type<reward_balance_index>().indices().get<by_recipient_asset>();
        auto itr = idx.find(boost::make_tuple(recipient, token));
        if (itr == idx.end())
        {
            create<reward_balance_object>([&](reward_balance_object &r) {
                r.recipient = recipient;
                r.asset_type = token;
                r.balance = amount;
            });
        }
        else
        {
            auto balance = checked_add(itr->balance, amount);
            modify(*itr, [&balance](reward_balance_object &r) {
                r.balance = balance;
            });
        }
    }
    FC_CAPTURE_AND_RETHROW((recipient)(token)(amount))
}

amount_type database::get_reward_balance(account_id_type recipient, asset_id_type token) const
{
    const auto &idx = get_index_type<reward_balance_index>().indices().get<by_recipient_asset>();
    auto itr = idx.find(boost::make_tuple(recipient, token));
    return itr == idx.end() ? amount_type(0) : itr->balance;
}

amount_type database::claim_rewards(account_id_type recipient, asset_id_type token)
{
    try
    {
        const auto &idx = get_index_type<reward_balance_index>().indices().get<by_recipient_asset>();
        auto itr = idx.find(boost::make_tuple(recipient, token));
        if (itr == idx.end() || itr->balance == 0)
            return 0;

        const amount_type amount = itr->balance;
        modify(*itr, [](reward_balance_object &r) {
            r.balance = 0;
        });
        pay_out(recipient, asset(amount, token));
        return amount;
    }
    FC_CAPTURE_AND_RETHROW((recipient)(token))
}

} // namespace chain
} // namespace gavel
