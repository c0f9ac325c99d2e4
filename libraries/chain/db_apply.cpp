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

namespace gavel
{
namespace chain
{

operation_result database::apply_operation(const operation &op)
{
    try
    {
        operation_validate(op);
        int i_which = op.which();
        uint64_t u_which = uint64_t(i_which);
        FC_ASSERT(i_which >= 0 && u_which < _operation_evaluators.size() && _operation_evaluators[u_which],
                  "No registered evaluator for operation ${op}", ("op", op));

        auto session = start_undo_session();
        auto result = _operation_evaluators[u_which]->evaluate(*this, op, true);
        session.commit();

        applied_operation(op, result);
        return result;
    }
    FC_CAPTURE_AND_RETHROW((op))
}

database::lot_guard::lot_guard(database &db, lot_id_type lot)
    : _db(db), _lot(lot)
{
    if (!_db._lots_in_flight.insert(lot).second)
    {
        wlog("rejected reentrant call on lot ${l}", ("l", lot));
        FC_THROW_EXCEPTION(reentrancy_exception, "lot ${l} is already being processed", ("l", lot));
    }
}

database::lot_guard::~lot_guard()
{
    _db._lots_in_flight.erase(_lot);
}

} // namespace chain
} // namespace gavel
