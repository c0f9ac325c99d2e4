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
#include <gavel/chain/global_property_object.hpp>
#include <gavel/chain/account_object.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/lot_object.hpp>
#include <gavel/chain/genesis_state.hpp>
#include <gavel/chain/evaluator.hpp>
#include <gavel/chain/auction_module.hpp>
#include <gavel/chain/lot_callbacks.hpp>

#include <gavel/db/object_database.hpp>
#include <gavel/db/object.hpp>
#include <fc/signals.hpp>

#include <gavel/chain/protocol/operations.hpp>

#include <fc/log/logger.hpp>
#include <map>

namespace gavel
{
namespace chain
{
using gavel::db::abstract_object;
using gavel::db::object;
class op_evaluator;

/**
    *   @class database
    *   @brief tracks the state of every lot, bid, fee and token balance
    *
    *   Every state change is an operation applied through apply_operation, which either
    *   commits completely or leaves no trace.  The engine methods below are what the
    *   evaluators call; they assume the operation has passed validate().
    */
class database : public db::object_database
{
  public:
    //////////////////// db_management.cpp ////////////////////

    database();
    ~database();

    /**
          * @brief Initialize an empty database from a genesis state
          *
          * Creates the reserved accounts, then the accounts, tokens, balances and fee
          * configurations the genesis state lists.
          */
    void init_genesis(const genesis_state_type &genesis_state = genesis_state_type());

    /// moves the engine clock forward; lots start and conclude against it
    void set_head_time(time_point_sec t);

    //////////////////// db_apply.cpp ////////////////////

    /**
          *  Validates and applies one operation inside its own undo session.  Any exception
          *  reverts every change the operation made, including token movements and nested
          *  operations applied by callbacks, and is rethrown.
          */
    operation_result apply_operation(const operation &op);

    /**
          *  Emitted after an operation has been applied and committed.
          */
    fc::signal<void(const operation &, const operation_result &)> applied_operation;

    /**
          *  Emitted on every token movement, after balances have changed.  Handlers run in
          *  the middle of the operation that moved the tokens and may apply operations of
          *  their own.
          */
    fc::signal<void(account_id_type from, account_id_type to, const asset &received)> token_transferred;

    //////////////////// db_getter.cpp ////////////////////

    const global_property_object &get_global_properties() const;
    const chain_parameters &get_chain_parameters() const;
    time_point_sec head_time() const;

    const account_object &get_account(const string &name) const;
    const asset_object &get_asset(const string &symbol) const;

    /// throws invalid_lot_id_exception
    const lot_object &get_lot(lot_id_type id) const;
    /// throws invalid_bid_id_exception unless the bid exists and belongs to @ref lot
    const bid_object &get_bid(const lot_object &lot, bid_id_type id) const;

    lot_status get_lot_status(const lot_object &lot) const { return lot.get_status(head_time()); }
    curation_status get_curation_status(const lot_object &lot) const;

    //////////////////// db_init.cpp ////////////////////

    void initialize_evaluators();
    void initialize_indexes();
    void initialize_auction_modules();

    template <typename EvaluatorType>
    void register_evaluator()
    {
        _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value].reset(new op_evaluator_impl<EvaluatorType>());
    }

    void register_auction_module(shared_ptr<auction_module> module);
    const auction_module *find_auction_module(const string &keycode) const;
    const auction_module &get_auction_module(const string &keycode) const;

    void register_callbacks(const string &name, shared_ptr<lot_callbacks> callbacks);
    lot_callbacks *find_callbacks(const string &name) const;
    /// the callbacks attached to @ref lot, or nullptr
    lot_callbacks *get_lot_callbacks(const lot_object &lot) const;

    //////////////////// db_balance.cpp ////////////////////

    /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
    asset get_balance(account_id_type owner, asset_id_type asset_id) const;
    /// This is an overloaded method.
    asset get_balance(const account_object &owner, const asset_object &asset_obj) const;

    /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          */
    void add_balance(account_id_type account, const asset &delta);
    /// throws insufficient_balance_exception when the account holds less than @ref delta
    void sub_balance(account_id_type account, const asset &delta);

    /// mints new supply to @ref to
    void issue(const asset_object &token, account_id_type to, const amount_type &amount);

    /**
          *  Moves tokens between accounts, burning the token's transfer fee on the way.
          *  @return the amount @ref to was credited
          */
    amount_type transfer(account_id_type from, account_id_type to, const asset &amount);

    /**
          *  Pulls @ref amount from @ref from into the auction house.
          *  @return the increase of the auction house balance, which is what may be credited
          */
    amount_type collect(account_id_type from, const asset &amount);
    /// as collect, but a shortfall throws unsupported_token_exception
    amount_type collect_exact(account_id_type from, const asset &amount);

    /// sends @ref amount from the auction house; a zero amount moves nothing
    void pay_out(account_id_type to, const asset &amount);

    //////////////////// db_fees.cpp ////////////////////

    /// throws invalid_fee_exception when the result would charge more than 100%
    void set_fee(const string &auction_type, fee_type kind, uint32_t percent);
    const fee_config_object *find_fee_config(const string &auction_type) const;
    uint32_t get_fee(const string &auction_type, fee_type kind) const;

    /// copies the auction type's protocol and referrer fees into @ref lot, once
    void lock_in_fees(const lot_object &lot);

    static fee_split compute_fee_split(const amount_type &gross, uint32_t protocol_percent,
                                       uint32_t referrer_percent, bool has_referrer);

    void accrue_reward(account_id_type recipient, asset_id_type token, const amount_type &amount);
    amount_type get_reward_balance(account_id_type recipient, asset_id_type token) const;
    /// pays out and clears the reward balance
    amount_type claim_rewards(account_id_type recipient, asset_id_type token);

    //////////////////// db_funding.cpp ////////////////////

    void add_funding(const lot_object &lot, const amount_type &amount);
    /// throws funding_underflow_exception when @ref lot holds less than @ref amount
    void release_funding(const lot_object &lot, const amount_type &amount);
    /// the same for base owed to winning bidders
    void release_payout(const lot_object &lot, const amount_type &amount);

    //////////////////// db_curation.cpp ////////////////////

    void set_curator_fee(account_id_type curator, const string &auction_type, uint32_t percent);
    uint32_t get_curator_fee(account_id_type curator, const string &auction_type) const;

    /// @return the curator reserve escrowed for @ref lot
    amount_type curate(account_id_type curator, const lot_object &lot);
    /// the curator's share of @ref sold base
    amount_type compute_curator_fee(const lot_object &lot, const amount_type &sold) const;

    //////////////////// db_lot.cpp ////////////////////

    const lot_object &create_lot(const lot_create_operation &op);
    void cancel_lot(account_id_type seller, const lot_object &lot);
    const bid_object &place_bid(const bid_operation &op);
    void refund_bid(account_id_type bidder, const lot_object &lot, const bid_object &bid);
    amount_type purchase(const purchase_operation &op);

    /// the account base tokens come from and return to
    account_id_type base_account(const lot_object &lot) const;
    /// the account the seller's quote proceeds go to
    account_id_type quote_account(const lot_object &lot) const;

    //////////////////// db_settle.cpp ////////////////////

    settlement settle(const lot_object &lot);

    //////////////////// db_claim.cpp ////////////////////

    /// @return the quote proceeds paid out
    amount_type claim_proceeds(account_id_type seller, const lot_object &lot);
    vector<bid_claim> claim_bids(account_id_type bidder, const lot_object &lot, const vector<bid_id_type> &bids);

  protected:
    /**
          *  Marks a lot as being processed for the lifetime of the guard.  A second guard on
          *  the same lot, created while the first one lives, throws reentrancy_exception.
          */
    class lot_guard
    {
      public:
        lot_guard(database &db, lot_id_type lot);
        ~lot_guard();

      private:
        database &_db;
        lot_id_type _lot;
    };

  private:
    void verify_settlement(const lot_object &lot, const settlement &result,
                           const vector<const bid_object *> &live_bids,
                           const vector<bid_claim> &outcomes) const;

    vector<unique_ptr<op_evaluator>> _operation_evaluators;
    std::map<string, shared_ptr<auction_module>> _auction_modules;
    std::map<string, shared_ptr<lot_callbacks>> _callbacks;
    flat_set<lot_id_type> _lots_in_flight;
};

} // namespace chain
} // namespace gavel
