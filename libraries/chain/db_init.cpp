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

#include <gavel/chain/account_evaluator.hpp>
#include <gavel/chain/asset_evaluator.hpp>
#include <gavel/chain/transfer_evaluator.hpp>
#include <gavel/chain/fee_evaluator.hpp>
#include <gavel/chain/lot_evaluator.hpp>
#include <gavel/chain/settlement_evaluator.hpp>
#include <gavel/chain/fixed_price_auctions.hpp>

namespace gavel
{
namespace chain
{

void database::initialize_evaluators()
{
    _operation_evaluators.resize(255);
    register_evaluator<account_create_evaluator>();
    register_evaluator<asset_create_evaluator>();
    register_evaluator<asset_issue_evaluator>();
    register_evaluator<transfer_evaluator>();
    register_evaluator<fee_config_update_evaluator>();
    register_evaluator<curator_fee_update_evaluator>();
    register_evaluator<rewards_claim_evaluator>();
    register_evaluator<lot_create_evaluator>();
    register_evaluator<lot_cancel_evaluator>();
    register_evaluator<lot_curate_evaluator>();
    register_evaluator<bid_evaluator>();
    register_evaluator<bid_refund_evaluator>();
    register_evaluator<purchase_evaluator>();
    register_evaluator<lot_settle_evaluator>();
    register_evaluator<proceeds_claim_evaluator>();
    register_evaluator<bids_claim_evaluator>();
}

void database::initialize_indexes()
{
    //Protocol object indexes
    add_index<asset_index>();
    add_index<account_index>();
    add_index<lot_index>();
    add_index<bid_index>();

    //Implementation object indexes
    add_index<global_property_index>();
    add_index<account_balance_index>();
    add_index<fee_config_index>();
    add_index<curator_fee_index>();
    add_index<reward_balance_index>();
}

void database::initialize_auction_modules()
{
    register_auction_module(std::make_shared<fixed_price_sale>());
    register_auction_module(std::make_shared<fixed_price_batch>());
}

void database::register_auction_module(shared_ptr<auction_module> module)
{
    FC_ASSERT(module != nullptr);
    auto keycode = module->keycode();
    FC_ASSERT(_auction_modules.find(keycode) == _auction_modules.end(),
              "auction module ${k} already registered", ("k", keycode));
    _auction_modules[keycode] = module;
}

const auction_module *database::find_auction_module(const string &keycode) const
{
    auto itr = _auction_modules.find(keycode);
    if (itr == _auction_modules.end())
        return nullptr;
    return itr->second.get();
}

const auction_module &database::get_auction_module(const string &keycode) const
{
    const auto *module = find_auction_module(keycode);
    FC_ASSERT(module != nullptr, "no auction module registered for ${k}", ("k", keycode));
    return *module;
}

void database::register_callbacks(const string &name, shared_ptr<lot_callbacks> callbacks)
{
    FC_ASSERT(callbacks != nullptr);
    FC_ASSERT(_callbacks.find(name) == _callbacks.end(), "callbacks ${n} already registered", ("n", name));
    _callbacks[name] = callbacks;
}

lot_callbacks *database::find_callbacks(const string &name) const
{
    auto itr = _callbacks.find(name);
    if (itr == _callbacks.end())
        return nullptr;
    return itr->second.get();
}

lot_callbacks *database::get_lot_callbacks(const lot_object &lot) const
{
    if (!lot.callbacks.valid())
        return nullptr;
    auto *callbacks = find_callbacks(*lot.callbacks);
    FC_ASSERT(callbacks != nullptr, "callbacks ${n} of lot ${l} are no longer registered",
              ("n", *lot.callbacks)("l", lot.id));
    return callbacks;
}

void database::init_genesis(const genesis_state_type &genesis_state)
{
    try
    {
        genesis_state.validate();
        FC_ASSERT(get_index_type<account_index>().indices().empty(), "genesis state already applied");

        // Create reserved accounts
        FC_ASSERT(create<account_object>([](account_object &a) {
                      a.name = "auction-house";
                  }).get_id() == GAVEL_AUCTION_HOUSE_ACCOUNT);
        FC_ASSERT(create<account_object>([](account_object &a) {
                      a.name = "protocol";
                  }).get_id() == GAVEL_PROTOCOL_ACCOUNT);
        FC_ASSERT(create<account_object>([](account_object &a) {
                      a.name = "null-account";
                  }).get_id() == GAVEL_NULL_ACCOUNT);

        create<global_property_object>([&](global_property_object &p) {
            p.parameters = genesis_state.initial_parameters;
            p.time = genesis_state.initial_timestamp;
        });

        for (const auto &account : genesis_state.initial_accounts)
        {
            create<account_object>([&](account_object &a) {
                a.name = account.name;
            });
        }

        for (const auto &token : genesis_state.initial_assets)
        {
            const auto &issuer = get_account(token.issuer_name);
            create<asset_object>([&](asset_object &a) {
                a.symbol = token.symbol;
                a.precision = token.precision;
                a.issuer = issuer.id;
                a.transfer_fee_percent = token.transfer_fee_percent;
                for (const auto &name : token.restricted_accounts)
                    a.restricted_accounts.insert(get_account(name).id);
            });
        }

        for (const auto &balance : genesis_state.initial_account_balances)
            issue(get_asset(balance.asset_symbol), get_account(balance.owner_name).id, balance.amount);

        for (const auto &config : genesis_state.initial_fee_configs)
        {
            set_fee(config.auction_type, max_curator_fee_type, config.max_curator_fee);
            set_fee(config.auction_type, protocol_fee_type, config.protocol_fee);
            set_fee(config.auction_type, referrer_fee_type, config.referrer_fee);
        }

        ilog("genesis applied: ${a} accounts, ${t} tokens, ${f} fee configurations",
             ("a", genesis_state.initial_accounts.size())("t", genesis_state.initial_assets.size())
             ("f", genesis_state.initial_fee_configs.size()));
    }
    FC_CAPTURE_AND_RETHROW()
}

} // namespace chain
} // namespace gavel
