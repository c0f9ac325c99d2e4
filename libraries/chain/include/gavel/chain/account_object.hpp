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
#include <gavel/chain/protocol/asset.hpp>
#include <gavel/db/generic_index.hpp>

namespace gavel { namespace chain {

/**
 * @brief Tracks the balance of a single account/asset pair
 * @ingroup object
 *
 * This object is indexed on owner and asset_type, and on asset_type alone so that
 * every holder of a token can be walked when its supply is audited.
 */
class account_balance_object : public abstract_object<account_balance_object>
{
 public:
   static const uint8_t space_id = implementation_ids;
   static const uint8_t type_id = impl_account_balance_object_type;

   account_id_type owner;
   asset_id_type   asset_type;
   amount_type     balance;

   asset get_balance() const { return asset(balance, asset_type); }
};

/**
 * @brief This class represents an account on the object graph
 * @ingroup object
 * @ingroup protocol
 *
 * Sellers, bidders, curators, referrers and the protocol itself are all accounts.
 */
class account_object : public gavel::db::abstract_object<account_object>
{
 public:
   static const uint8_t space_id = protocol_ids;
   static const uint8_t type_id = account_object_type;

   /// The account's name. This name must be unique among all account names on the graph. May not be empty.
   string name;

   account_id_type get_id() const { return id; }
};

struct by_name;
struct by_account_asset;
struct by_asset_balance;

typedef multi_index_container<
    account_balance_object,
    indexed_by<
        ordered_unique<
            tag<by_id>, member<object, object_id_type, &object::id>>,
        ordered_unique<
            tag<by_account_asset>,
            composite_key<
                account_balance_object,
                member<account_balance_object, account_id_type, &account_balance_object::owner>,
                member<account_balance_object, asset_id_type, &account_balance_object::asset_type>>>,
        ordered_unique<
            tag<by_asset_balance>,
            composite_key<
                account_balance_object,
                member<account_balance_object, asset_id_type, &account_balance_object::asset_type>,
                member<account_balance_object, amount_type, &account_balance_object::balance>,
                member<account_balance_object, account_id_type, &account_balance_object::owner>>,
            composite_key_compare<
                std::less<asset_id_type>,
                std::greater<amount_type>,
                std::less<account_id_type>>>>>
    account_balance_object_multi_index_type;

/**
 * @ingroup object_index
 */
typedef generic_index<account_balance_object, account_balance_object_multi_index_type> account_balance_index;

typedef multi_index_container<
    account_object,
    indexed_by<
        ordered_unique<
            tag<by_id>,
            member<object, object_id_type, &object::id>>,
        ordered_unique<
            tag<by_name>,
            member<account_object, string, &account_object::name>>>>
    account_multi_index_type;

/**
 * @ingroup object_index
 */
typedef generic_index<account_object, account_multi_index_type> account_index;

} // namespace chain
} // namespace gavel

FC_REFLECT_DERIVED(gavel::chain::account_object,
                   (gavel::db::object),
                   (name))

FC_REFLECT_DERIVED(gavel::chain::account_balance_object,
                   (gavel::db::object),
                   (owner)(asset_type)(balance))
