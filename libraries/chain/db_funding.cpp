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

void database::add_funding(const lot_object &lot, const amount_type &amount)
{
    try
    {
        auto funding = checked_add(lot.funding, amount);
        modify(lot, [&funding](lot_object &l) {
            l.funding = funding;
        });
    }
    FC_CAPTURE_AND_RETHROW((lot.id)(amount))
}

void database::release_funding(const lot_object &lot, const amount_type &amount)
{
    try
    {
        if (lot.funding < amount)
        {
            elog("lot ${l} releases ${a} with only ${f} funded", ("l", lot.id)("a", amount)("f", lot.funding));
            FC_THROW_EXCEPTION(funding_underflow_exception, "lot ${l} releases ${a} with only ${f} funded",
                               ("l", lot.id)("a", amount)("f", lot.funding));
        }
        modify(lot, [&amount](lot_object &l) {
            l.funding -= amount;
        });
    }
    FC_CAPTURE_AND_RETHROW((lot.id)(amount))
}

void database::release_payout(const lot_object &lot, const amount_type &amount)
{
    try
    {
        if (lot.payouts_pending < amount)
        {
            elog("lot ${l} pays out ${a} with only ${p} owed to bidders", ("l", lot.id)("a", amount)("p", lot.payouts_pending));
            FC_THROW_EXCEPTION(funding_underflow_exception, "lot ${l} pays out ${a} with only ${p} owed to bidders",
                               ("l", lot.id)("a", amount)("p", lot.payouts_pending));
        }
        modify(lot, [&amount](lot_object &l) {
            l.payouts_pending -= amount;
        });
    }
    FC_CAPTURE_AND_RETHROW((lot.id)(amount))
}

} // namespace chain
} // namespace gavel
