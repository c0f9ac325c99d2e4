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
#include <gavel/chain/evaluator.hpp>
#include <gavel/chain/exceptions.hpp>

#include <gavel/chain/account_object.hpp>

namespace gavel
{
namespace chain
{
database &generic_evaluator::db() const
{
  FC_ASSERT(_db != nullptr);
  return *_db;
}

operation_result generic_evaluator::start_evaluate(database &db, const operation &op, bool apply)
{
  try
  {
    _db = &db;
    operation_result result = this->evaluate(op);
    if (apply)
      result = this->apply(op);
    return result;
  }
  FC_CAPTURE_AND_RETHROW()
}

void generic_evaluator::prepare_actor(const account_id_type &account_id)
{
  acting_account = db().find(account_id);
  GAVEL_ASSERT(acting_account != nullptr, not_permitted_exception,
               "Unknown account ${a} cannot act", ("a", account_id));
}

} // namespace chain
} // namespace gavel
