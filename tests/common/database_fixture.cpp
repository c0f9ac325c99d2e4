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
#include <boost/test/unit_test.hpp>

#include <gavel/chain/account_object.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/lot_object.hpp>

#include <iostream>

#include "database_fixture.hpp"

uint32_t GAVEL_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace gavel { namespace chain {

using std::cout;
using std::cerr;

database_fixture::database_fixture()
{
   try {
      int argc = boost::unit_test::framework::master_test_suite().argc;
      char** argv = boost::unit_test::framework::master_test_suite().argv;
      for( int i=1; i<argc; i++ )
      {
         const std::string arg = argv[i];
         if( arg == "--record-assert-trip" )
            fc::enable_record_assert_trip = true;
         if( arg == "--show-test-names" )
            std::cout << "running test " << boost::unit_test::framework::current_test_case().p_name << std::endl;
      }

      genesis_state.initial_timestamp = time_point_sec( GAVEL_TESTING_GENESIS_TIMESTAMP );
      genesis_state.initial_accounts.emplace_back( "treasury" );

      db = std::make_shared<chain::database>();
      db->init_genesis( genesis_state );
   }
   catch ( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
      throw;
   }
}

database_fixture::~database_fixture()
{
   try
   {
      // If we're unwinding due to an exception, don't do any more checks.
      // This way, boost test's last checkpoint tells us approximately where the error was.
      if( !std::uncaught_exception() )
         verify_house_balances( *db );
      return;
   } FC_CAPTURE_AND_RETHROW()
}

void database_fixture::verify_house_balances( const chain::database& db )
{
   std::map<asset_id_type, amount_type> owed;
   std::map<asset_id_type, amount_type> total_balances;

   for( const lot_object& lot : db.get_index_type<lot_index>().indices() )
   {
      owed[lot.base_token] += lot.funding + lot.payouts_pending;
      owed[lot.quote_token] += lot.proceeds_pending;
   }
   for( const bid_object& bid : db.get_index_type<bid_index>().indices() )
   {
      if( !bid.is_live() )
         continue;
      const lot_object& lot = bid.lot( db );
      const bool settled = lot.state == settled_lot || lot.state == claimed_lot;
      owed[lot.quote_token] += settled ? bid.refund : bid.amount;
   }
   for( const reward_balance_object& r : db.get_index_type<reward_balance_index>().indices() )
      owed[r.asset_type] += r.balance;

   for( const account_balance_object& b : db.get_index_type<account_balance_index>().indices() )
      total_balances[b.asset_type] += b.balance;

   for( const asset_object& token : db.get_index_type<asset_index>().indices() )
   {
      const asset_id_type id = token.get_id();
      BOOST_CHECK_EQUAL( db.get_balance( GAVEL_AUCTION_HOUSE_ACCOUNT, id ).amount, owed[id] );
      BOOST_CHECK_EQUAL( total_balances[id], token.current_supply );
   }
}

void database_fixture::advance_time( uint32_t seconds )
{
   db->set_head_time( db->head_time() + seconds );
}

const asset_object& database_fixture::get_asset( const string& symbol )const
{
   return db->get_asset( symbol );
}

const account_object& database_fixture::get_account( const string& name )const
{
   return db->get_account( name );
}

const account_object& database_fixture::create_account( const string& name )
{
   account_create_operation op;
   op.name = name;
   auto result = db->apply_operation( op );
   return db->get<account_object>( result.get<object_id_result>().result );
}

const asset_object& database_fixture::create_token( const string& symbol, uint8_t precision, uint32_t transfer_fee_percent )
{ try {
   asset_create_operation op;
   op.issuer = get_account( "treasury" ).get_id();
   op.symbol = symbol;
   op.precision = precision;
   op.transfer_fee_percent = transfer_fee_percent;
   auto result = db->apply_operation( op );
   return db->get<asset_object>( result.get<object_id_result>().result );
} FC_CAPTURE_AND_RETHROW( (symbol)(precision)(transfer_fee_percent) ) }

void database_fixture::issue( account_id_type recipient, const asset_object& token, const amount_type& amount )
{
   asset_issue_operation op;
   op.issuer = token.issuer;
   op.asset_to_issue = token.amount( amount );
   op.issue_to_account = recipient;
   db->apply_operation( op );
}

amount_type database_fixture::transfer( account_id_type from, account_id_type to, const asset& amount )
{
   transfer_operation op;
   op.from = from;
   op.to = to;
   op.amount = amount;
   return db->apply_operation( op ).get<amount_result>().result;
}

amount_type database_fixture::balance( account_id_type owner, const asset_object& token )const
{
   return db->get_balance( owner, token.get_id() ).amount;
}

void database_fixture::set_fee( const string& auction_type, fee_type type, uint32_t percent )
{
   fee_config_update_operation op;
   op.auction_type = auction_type;
   op.type = type;
   op.percent = percent;
   db->apply_operation( op );
}

void database_fixture::set_curator_fee( account_id_type curator, const string& auction_type, uint32_t percent )
{
   curator_fee_update_operation op;
   op.curator = curator;
   op.auction_type = auction_type;
   op.percent = percent;
   db->apply_operation( op );
}

amount_type database_fixture::claim_rewards( account_id_type recipient, const asset_object& token )
{
   rewards_claim_operation op;
   op.recipient = recipient;
   op.token = token.get_id();
   return db->apply_operation( op ).get<amount_result>().result;
}

lot_create_operation database_fixture::make_lot( account_id_type seller, const string& auction_type,
                                                 const asset_object& base, const asset_object& quote,
                                                 const amount_type& capacity, const amount_type& price,
                                                 uint32_t duration )
{
   lot_create_operation op;
   op.seller = seller;
   op.auction_type = auction_type;
   op.base_token = base.get_id();
   op.quote_token = quote.get_id();
   op.duration = duration;
   op.capacity = capacity;
   op.params.price = price;
   return op;
}

const lot_object& database_fixture::create_lot( const lot_create_operation& op )
{
   auto result = db->apply_operation( op );
   return db->get<lot_object>( result.get<object_id_result>().result );
}

void database_fixture::cancel_lot( account_id_type seller, const lot_object& lot )
{
   lot_cancel_operation op;
   op.seller = seller;
   op.lot = lot.get_id();
   db->apply_operation( op );
}

void database_fixture::curate( account_id_type curator, const lot_object& lot )
{
   lot_curate_operation op;
   op.curator = curator;
   op.lot = lot.get_id();
   db->apply_operation( op );
}

bid_id_type database_fixture::bid( account_id_type bidder, const lot_object& lot, const amount_type& amount,
                                   account_id_type referrer )
{
   bid_operation op;
   op.bidder = bidder;
   op.lot = lot.get_id();
   op.referrer = referrer;
   op.amount = amount;
   return db->apply_operation( op ).get<object_id_result>().result;
}

void database_fixture::refund_bid( account_id_type bidder, const lot_object& lot, bid_id_type bid )
{
   bid_refund_operation op;
   op.bidder = bidder;
   op.lot = lot.get_id();
   op.bid = bid;
   db->apply_operation( op );
}

amount_type database_fixture::purchase( account_id_type buyer, const lot_object& lot, const amount_type& amount,
                                        const amount_type& min_amount_out, account_id_type referrer )
{
   purchase_operation op;
   op.buyer = buyer;
   op.lot = lot.get_id();
   op.recipient = buyer;
   op.referrer = referrer;
   op.amount = amount;
   op.min_amount_out = min_amount_out;
   return db->apply_operation( op ).get<amount_result>().result;
}

settlement database_fixture::settle( const lot_object& lot )
{
   lot_settle_operation op;
   op.caller = lot.seller;
   op.lot = lot.get_id();
   return db->apply_operation( op ).get<settlement_result>().result;
}

amount_type database_fixture::claim_proceeds( account_id_type seller, const lot_object& lot )
{
   proceeds_claim_operation op;
   op.seller = seller;
   op.lot = lot.get_id();
   return db->apply_operation( op ).get<amount_result>().result;
}

vector<bid_claim> database_fixture::claim_bids( account_id_type bidder, const lot_object& lot,
                                                const vector<bid_id_type>& bids )
{
   bids_claim_operation op;
   op.bidder = bidder;
   op.lot = lot.get_id();
   op.bids = bids;
   return db->apply_operation( op ).get<bid_claims_result>().result;
}

} } // gavel::chain
