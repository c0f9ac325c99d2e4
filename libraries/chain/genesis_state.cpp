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
#include <gavel/chain/genesis_state.hpp>
#include <gavel/chain/exceptions.hpp>
#include <gavel/chain/protocol/account.hpp>
#include <gavel/chain/protocol/asset_ops.hpp>

#include <fc/io/json.hpp>

namespace gavel { namespace chain {

void chain_parameters::validate()const
{
   GAVEL_ASSERT( max_bids_per_claim > 0 && max_bids_per_claim <= GAVEL_DEFAULT_MAX_BIDS_PER_CLAIM,
                 invalid_params_exception, "max_bids_per_claim ${m} out of range", ("m",max_bids_per_claim) );
}

void genesis_state_type::validate()const
{ try {
   initial_parameters.validate();

   set<string> names = { "auction-house", "protocol", "null-account" };
   for( const auto& account : initial_accounts )
   {
      GAVEL_ASSERT( is_valid_name( account.name ), invalid_params_exception, "invalid account name ${n}", ("n",account.name) );
      GAVEL_ASSERT( names.insert( account.name ).second, invalid_params_exception, "duplicate account ${n}", ("n",account.name) );
   }

   set<string> symbols;
   for( const auto& token : initial_assets )
   {
      GAVEL_ASSERT( is_valid_symbol( token.symbol ), invalid_params_exception, "invalid symbol ${s}", ("s",token.symbol) );
      GAVEL_ASSERT( symbols.insert( token.symbol ).second, invalid_params_exception, "duplicate symbol ${s}", ("s",token.symbol) );
      GAVEL_ASSERT( token.precision >= GAVEL_MIN_ASSET_PRECISION_DIGITS && token.precision <= GAVEL_MAX_ASSET_PRECISION_DIGITS,
                    unsupported_token_exception, "token decimals ${p} out of range", ("p",token.precision) );
      GAVEL_ASSERT( token.transfer_fee_percent < GAVEL_100_PERCENT, invalid_params_exception,
                    "transfer fee ${f} of ${s} would burn the whole transfer", ("f",token.transfer_fee_percent)("s",token.symbol) );
      GAVEL_ASSERT( names.count( token.issuer_name ), invalid_params_exception, "unknown issuer ${n}", ("n",token.issuer_name) );
      for( const auto& name : token.restricted_accounts )
         GAVEL_ASSERT( names.count( name ), invalid_params_exception, "unknown restricted account ${n}", ("n",name) );
   }

   for( const auto& balance : initial_account_balances )
   {
      GAVEL_ASSERT( names.count( balance.owner_name ), invalid_params_exception, "unknown owner ${n}", ("n",balance.owner_name) );
      GAVEL_ASSERT( symbols.count( balance.asset_symbol ), invalid_params_exception, "unknown token ${s}", ("s",balance.asset_symbol) );
      GAVEL_ASSERT( balance.amount <= GAVEL_MAX_AMOUNT, overflow_exception, "balance ${a} exceeds the amount width", ("a",balance.amount) );
   }

   set<string> auction_types;
   for( const auto& config : initial_fee_configs )
   {
      GAVEL_ASSERT( !config.auction_type.empty(), invalid_params_exception, "auction type required" );
      GAVEL_ASSERT( auction_types.insert( config.auction_type ).second, invalid_params_exception,
                    "duplicate fee configuration for ${t}", ("t",config.auction_type) );
      GAVEL_ASSERT( config.max_curator_fee <= GAVEL_100_PERCENT, invalid_fee_exception,
                    "max curator fee ${f} exceeds 100%", ("f",config.max_curator_fee) );
      GAVEL_ASSERT( uint64_t(config.protocol_fee) + config.referrer_fee <= GAVEL_100_PERCENT, invalid_fee_exception,
                    "protocol and referrer fees of ${t} exceed 100%", ("t",config.auction_type) );
   }
} FC_CAPTURE_AND_RETHROW() }

genesis_state_type read_genesis_file( const fc::path& genesis_file )
{ try {
   FC_ASSERT( fc::exists( genesis_file ), "genesis file ${f} does not exist", ("f",genesis_file.generic_string()) );
   ilog( "reading genesis state from ${f}", ("f",genesis_file.generic_string()) );
   auto genesis = fc::json::from_file( genesis_file ).as<genesis_state_type>();
   genesis.validate();
   return genesis;
} FC_CAPTURE_AND_RETHROW( (genesis_file) ) }

} } // gavel::chain
