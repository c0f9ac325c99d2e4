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

#include <gavel/chain/protocol/chain_parameters.hpp>
#include <gavel/chain/protocol/types.hpp>

#include <fc/filesystem.hpp>

#include <string>
#include <vector>

namespace gavel { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string())
         : name(name)
      {}
      string name;
   };
   struct initial_asset_type {
      string symbol;
      string issuer_name;

      uint8_t precision = GAVEL_INTERNAL_PRECISION_DIGITS;
      uint32_t transfer_fee_percent = 0;
      /// Must correspond to initial accounts
      vector<string> restricted_accounts;
   };
   struct initial_account_balances_type
   {
      string owner_name;
      string asset_symbol;
      amount_type amount;
   };
   struct initial_fee_config_type
   {
      string auction_type;
      uint32_t protocol_fee = 0;
      uint32_t referrer_fee = 0;
      uint32_t max_curator_fee = 0;
   };

   time_point_sec                           initial_timestamp;
   chain_parameters                         initial_parameters;
   vector<initial_account_type>             initial_accounts;
   vector<initial_asset_type>               initial_assets;
   vector<initial_account_balances_type>    initial_account_balances;
   vector<initial_fee_config_type>          initial_fee_configs;

   /// throws invalid_params_exception on names, symbols or references that cannot be applied
   void validate()const;
};

/**
 *  Reads and validates a genesis state stored as JSON.
 */
genesis_state_type read_genesis_file( const fc::path& genesis_file );

} } // namespace gavel::chain

FC_REFLECT(gavel::chain::genesis_state_type::initial_account_type, (name))

FC_REFLECT(gavel::chain::genesis_state_type::initial_asset_type,
           (symbol)(issuer_name)(precision)(transfer_fee_percent)(restricted_accounts))

FC_REFLECT(gavel::chain::genesis_state_type::initial_account_balances_type,
           (owner_name)(asset_symbol)(amount))

FC_REFLECT(gavel::chain::genesis_state_type::initial_fee_config_type,
           (auction_type)(protocol_fee)(referrer_fee)(max_curator_fee))

FC_REFLECT(gavel::chain::genesis_state_type,
           (initial_timestamp)(initial_parameters)(initial_accounts)(initial_assets)(initial_account_balances)
           (initial_fee_configs))
