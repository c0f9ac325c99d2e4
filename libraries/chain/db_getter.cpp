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
#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/global_property_object.hpp>
#include <gavel/chain/lot_object.hpp>

namespace gavel
{
namespace chain
{

const global_property_object &database::get_global_properties() const
{
    return get(global_property_id_type());
}

const chain_parameters &database::get_chain_parameters() const
{
    return get_global_properties().parameters;
}

time_point_sec database::head_time() const
{
    return get_global_properties().time;
}

const account_object &database::get_account(const string &name) const
{
    const auto &accounts_by_name = get_index_type<account_index>().indices().get<by_name>();
    auto itr = accounts_by_name.find(name);
    FC_ASSERT(itr != accounts_by_name.end(), "not find account: ${account}", ("account", name));
    return *itr;
}

const asset_object &database::get_asset(const string &symbol) const
{
    const auto &assets_by_symbol = get_index_type<asset_index>().indices().get<by_symbol>();
    auto itr = assets_by_symbol.find(symbol);
    FC_ASSERT(itr != assets_by_symbol.end(), "not find asset: ${symbol}", ("symbol", symbol));
    return *itr;
}

const lot_object &database::get_lot(lot_id_type id) const
{
    const lot_object *lot = find(id);
    GAVEL_ASSERT(lot != nullptr, invalid_lot_id_exception, "lot ${l} does not exist", ("l", id));
    return *lot;
}

const bid_object &database::get_bid(const lot_object &lot, bid_id_type id) const
{
    const bid_object *bid = find(id);
    GAVEL_ASSERT(bid != nullptr && bid->lot == lot.id, invalid_bid_id_exception,
                 "bid ${b} does not exist on lot ${l}", ("b", id)("l", lot.id));
    return *bid;
}

curation_status database::get_curation_status(const lot_object &lot) const
{
    if (!lot.fees.has_curator())
        return no_curator;
    if (lot.fees.curated)
        return curator_approved;
    const auto &idx = get_index_type<curator_fee_index>().indices().get<by_curator>();
    if (idx.find(boost::make_tuple(lot.fees.curator, lot.auction_type)) != idx.end())
        return curator_fee_locked;
    return curator_set;
}

} // namespace chain
} // namespace gavel
