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
#include <fc/container/flat_fwd.hpp>
#include <fc/container/flat.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <memory>
#include <vector>
#include <deque>
#include <cstdint>

#include <gavel/db/object_id.hpp>
#include <gavel/db/object.hpp>
#include <gavel/chain/config.hpp>

namespace gavel
{
namespace chain
{
using namespace gavel::db;
using std::deque;
using std::make_pair;
using std::map;
using std::pair;
using std::set;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::vector;
using fc::flat_map;
using fc::flat_set;
using fc::optional;
using fc::static_variant;
using fc::time_point_sec;
using fc::variant;
using fc::variant_object;

struct void_t
{
};

/**
 *  Token amounts are unsigned and limited to GAVEL_AMOUNT_BITS; the 128 bit
 *  carrier leaves headroom so that a single add or percent product can be
 *  checked before it is stored.
 */
typedef boost::multiprecision::uint128_t amount_type;

enum reserved_spaces
{
    relative_protocol_ids = 0,
    protocol_ids = 1,
    implementation_ids = 2,
    RESERVED_SPACES_COUNT = 3
};

inline bool is_relative(object_id_type o) { return o.space() == 0; }

/**
    *  List all object types from all namespaces here so they can
    *  be easily reflected and displayed in debug output.
    */
enum object_type
{
    null_object_type = 0,
    base_object_type = 1,
    account_object_type = 2,
    asset_object_type = 3,
    lot_object_type = 4,
    bid_object_type = 5,
    OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
};

enum impl_object_type
{
    impl_global_property_object_type = 0,
    impl_account_balance_object_type = 1,
    impl_fee_config_object_type = 2,
    impl_curator_fee_object_type = 3,
    impl_reward_balance_object_type = 4
};

class account_object;
class asset_object;
class lot_object;
class bid_object;

typedef object_id<protocol_ids, account_object_type, account_object> account_id_type;
typedef object_id<protocol_ids, asset_object_type, asset_object> asset_id_type;
typedef object_id<protocol_ids, lot_object_type, lot_object> lot_id_type;
typedef object_id<protocol_ids, bid_object_type, bid_object> bid_id_type;

class global_property_object;
class account_balance_object;
class fee_config_object;
class curator_fee_object;
class reward_balance_object;

typedef object_id<implementation_ids, impl_global_property_object_type, global_property_object> global_property_id_type;
typedef object_id<implementation_ids, impl_account_balance_object_type, account_balance_object> account_balance_id_type;
typedef object_id<implementation_ids, impl_fee_config_object_type, fee_config_object> fee_config_id_type;
typedef object_id<implementation_ids, impl_curator_fee_object_type, curator_fee_object> curator_fee_id_type;
typedef object_id<implementation_ids, impl_reward_balance_object_type, reward_balance_object> reward_balance_id_type;

} // namespace chain
} // namespace gavel

namespace fc
{
void to_variant(const gavel::chain::amount_type &var, fc::variant &vo);
void from_variant(const fc::variant &var, gavel::chain::amount_type &vo);
} // namespace fc

FC_REFLECT_ENUM(gavel::chain::object_type,
                (null_object_type)(base_object_type)(account_object_type)(asset_object_type)(lot_object_type)(bid_object_type)(OBJECT_TYPE_COUNT))
FC_REFLECT_ENUM(gavel::chain::impl_object_type,
                (impl_global_property_object_type)(impl_account_balance_object_type)(impl_fee_config_object_type)
                (impl_curator_fee_object_type)(impl_reward_balance_object_type))

FC_REFLECT_TYPENAME(gavel::chain::amount_type)
FC_REFLECT_TYPENAME(gavel::chain::account_id_type)
FC_REFLECT_TYPENAME(gavel::chain::asset_id_type)
FC_REFLECT_TYPENAME(gavel::chain::lot_id_type)
FC_REFLECT_TYPENAME(gavel::chain::bid_id_type)
FC_REFLECT_TYPENAME(gavel::chain::global_property_id_type)
FC_REFLECT_TYPENAME(gavel::chain::account_balance_id_type)
FC_REFLECT_TYPENAME(gavel::chain::fee_config_id_type)
FC_REFLECT_TYPENAME(gavel::chain::curator_fee_id_type)
FC_REFLECT_TYPENAME(gavel::chain::reward_balance_id_type)
FC_REFLECT(gavel::chain::void_t, )
