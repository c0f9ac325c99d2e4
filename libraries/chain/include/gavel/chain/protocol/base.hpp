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
#pragma once
#include <gavel/chain/protocol/types.hpp>
#include <gavel/chain/protocol/asset.hpp>
#include <gavel/chain/protocol/auction.hpp>

namespace gavel
{
namespace chain
{

/**
    *  @defgroup operations Operations
    *  @brief A set of valid comands for mutating the engine state.
    *
    *  An operation can be thought of like a function that will modify the
    *  shared state of the engine.  The members of each struct are like function
    *  arguments and each operation can potentially generate a return value.
    *
    *  Each operation is a fully defined state transition: it either applies completely
    *  or leaves no trace, including any token movement it attempted.
    *
    *  @subsection defined_authority Explicit Actor
    *
    *    Each operation names the account on whose behalf it runs.  Role checks
    *    (seller, curator, bidder, governance) compare against that account.
    *
    *  @{
    */

struct void_result
{
};

struct object_id_result
{
  object_id_result() {}
  object_id_result(object_id_type id) : result(id) {}
  object_id_type result;
};

struct amount_result
{
  amount_result() {}
  amount_result(amount_type a) : result(a) {}
  amount_type result;
};

struct settlement_result
{
  settlement_result() {}
  settlement_result(const settlement &s) : result(s) {}
  settlement result;
};

struct bid_claims_result
{
  vector<bid_claim> result;
};

typedef fc::static_variant<void_result, object_id_result, amount_result, settlement_result, bid_claims_result> operation_result;

struct base_operation
{
  void validate() const {}
};

///@}

} // namespace chain
} // namespace gavel

FC_REFLECT_TYPENAME(gavel::chain::operation_result)
FC_REFLECT(gavel::chain::void_result, )
FC_REFLECT(gavel::chain::object_id_result, (result))
FC_REFLECT(gavel::chain::amount_result, (result))
FC_REFLECT(gavel::chain::settlement_result, (result))
FC_REFLECT(gavel::chain::bid_claims_result, (result))
