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
#include <gavel/chain/asset_evaluator.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/account_object.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel
{
namespace chain
{

void_result asset_create_evaluator::do_evaluate(const asset_create_operation &op)
{
    try
    {
        database &d = db();
        const auto &asset_indx = d.get_index_type<asset_index>().indices().get<by_symbol>();
        auto asset_symbol_itr = asset_indx.find(op.symbol);
        GAVEL_ASSERT(asset_symbol_itr == asset_indx.end(), invalid_params_exception,
                     "token symbol ${s} is already in use", ("s", op.symbol));
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((op))
}

object_id_result asset_create_evaluator::do_apply(const asset_create_operation &op)
{
    try
    {
        const asset_object &new_asset = db().create<asset_object>([&](asset_object &a) {
            a.issuer = op.issuer;
            a.symbol = op.symbol;
            a.precision = op.precision;
            a.transfer_fee_percent = op.transfer_fee_percent;
        });
        ilog("token ${s} created by ${i}", ("s", op.symbol)("i", op.issuer));
        return new_asset.id;
    }
    FC_CAPTURE_AND_RETHROW((op))
}

void_result asset_issue_evaluator::do_evaluate(const asset_issue_operation &o)
{
    try
    {
        const database &d = db();

        const asset_object &a = o.asset_to_issue.asset_id(d);
        GAVEL_ASSERT(o.issuer == a.issuer, not_permitted_exception,
                     "only ${i} may issue ${s}", ("i", a.issuer)("s", a.symbol));
        FC_ASSERT(d.find(o.issue_to_account) != nullptr, "unknown account ${a}", ("a", o.issue_to_account));

        asset_to_issue = &a;
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((o))
}

void_result asset_issue_evaluator::do_apply(const asset_issue_operation &o)
{
    try
    {
        db().issue(*asset_to_issue, o.issue_to_account, o.asset_to_issue.amount);
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((o))
}

} // namespace chain
} // namespace gavel
