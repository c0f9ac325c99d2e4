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
#include <gavel/chain/transfer_evaluator.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/database.hpp>
#include <gavel/chain/exceptions.hpp>

namespace gavel
{
namespace chain
{
void_result transfer_evaluator::do_evaluate(const transfer_operation &op)
{
  try
  {
    const database &d = db();

    const account_object &to_account = op.to(d);
    const asset_object &asset_type = op.amount.asset_id(d);

    GAVEL_ASSERT(!asset_type.is_restricted(op.from), transfer_restricted_exception,
                 "'from' account ${from} may not move ${asset}", ("from", op.from)("asset", asset_type.symbol));
    GAVEL_ASSERT(!asset_type.is_restricted(to_account.id), transfer_restricted_exception,
                 "'to' account ${to} may not receive ${asset}", ("to", to_account.name)("asset", asset_type.symbol));

    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((op))
}

amount_result transfer_evaluator::do_apply(const transfer_operation &o)
{
  try
  {
    return db().transfer(o.from, o.to, o.amount);
  }
  FC_CAPTURE_AND_RETHROW((o))
}

} // namespace chain
} // namespace gavel
