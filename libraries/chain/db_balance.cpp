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
#include <gavel/chain/fixed_point.hpp>

namespace gavel
{
namespace chain
{

asset database::get_balance(account_id_type owner, asset_id_type asset_id) const
{
    auto &index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
    auto itr = index.find(boost::make_tuple(owner, asset_id));
    if (itr == index.end())
        return asset(0, asset_id);
    return itr->get_balance();
}

asset database::get_balance(const account_object &owner, const asset_object &asset_obj) const
{
    return get_balance(owner.get_id(), asset_obj.get_id());
}

void database::add_balance(account_id_type account, const asset &delta)
{
    try
    {
        if (delta.amount == 0)
            return;

        auto &index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
        auto itr = index.find(boost::make_tuple(account, delta.asset_id));
        if (itr == index.end())
        {
            create<account_balance_object>([account, &delta](account_balance_object &b) {
                b.owner = account;
                b.asset_type = delta.asset_id;
                b.balance = delta.amount;
            });
        }
        else
        {
            auto balance = checked_add(itr->balance, delta.amount);
            modify(*itr, [&balance](account_balance_object &b) {
                b.balance = balance;
            });
        }
    }
    FC_CAPTURE_AND_RETHROW((account)(delta))
}

void database::sub_balance(account_id_type account, const asset &delta)
{
    try
    {
        if (delta.amount == 0)
            return;

        auto &index = get_index_type<account_balance_index>().indices().get<by_account_asset>();
        auto itr = index.find(boost::make_tuple(account, delta.asset_id));
        amount_type available = itr == index.end() ? amount_type(0) : itr->balance;
        GAVEL_ASSERT(available >= delta.amount, insufficient_balance_exception,
                     "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                     ("a", account(*this).name)("b", available)("r", delta.amount));
        modify(*itr, [&delta](account_balance_object &b) {
            b.balance -= delta.amount;
        });
    }
    FC_CAPTURE_AND_RETHROW((account)(delta))
}

void database::issue(const asset_object &token, account_id_type to, const amount_type &amount)
{
    try
    {
        auto supply = checked_add(token.current_supply, amount);
        modify(token, [&supply](asset_object &a) {
            a.current_supply = supply;
        });
        add_balance(to, token.amount(amount));
    }
    FC_CAPTURE_AND_RETHROW((token.symbol)(to)(amount))
}

amount_type database::transfer(account_id_type from, account_id_type to, const asset &amount)
{
    try
    {
        const asset_object &token = amount.asset_id(*this);
        GAVEL_ASSERT(!token.is_restricted(from), transfer_restricted_exception,
                     "'from' account ${a} is restricted from transferring ${t}", ("a", from)("t", token.symbol));
        GAVEL_ASSERT(!token.is_restricted(to), transfer_restricted_exception,
                     "'to' account ${a} is restricted from receiving ${t}", ("a", to)("t", token.symbol));

        sub_balance(from, amount);
        const amount_type received = token.amount_received(amount.amount);
        add_balance(to, token.amount(received));
        if (received != amount.amount)
        {
            auto supply = checked_sub(token.current_supply, amount.amount - received);
            modify(token, [&supply](asset_object &a) {
                a.current_supply = supply;
            });
        }

        token_transferred(from, to, token.amount(received));
        return received;
    }
    FC_CAPTURE_AND_RETHROW((from)(to)(amount))
}

amount_type database::collect(account_id_type from, const asset &amount)
{
    try
    {
        const amount_type before = get_balance(GAVEL_AUCTION_HOUSE_ACCOUNT, amount.asset_id).amount;
        transfer(from, GAVEL_AUCTION_HOUSE_ACCOUNT, amount);
        const amount_type after = get_balance(GAVEL_AUCTION_HOUSE_ACCOUNT, amount.asset_id).amount;
        return checked_sub(after, before);
    }
    FC_CAPTURE_AND_RETHROW((from)(amount))
}

amount_type database::collect_exact(account_id_type from, const asset &amount)
{
    try
    {
        const amount_type received = collect(from, amount);
        GAVEL_ASSERT(received >= amount.amount, unsupported_token_exception,
                     "received ${r} of ${a}, tokens that charge on transfer cannot be escrowed",
                     ("r", received)("a", amount.amount));
        return received;
    }
    FC_CAPTURE_AND_RETHROW((from)(amount))
}

void database::pay_out(account_id_type to, const asset &amount)
{
    if (amount.amount == 0)
        return;
    transfer(GAVEL_AUCTION_HOUSE_ACCOUNT, to, amount);
}

} // namespace chain
} // namespace gavel
