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

#include <gavel/chain/database.hpp>
#include <gavel/chain/exceptions.hpp>
#include <gavel/chain/fixed_price_auctions.hpp>
#include <gavel/chain/fixed_point.hpp>

#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/lot_object.hpp>

#include "../common/database_fixture.hpp"

using namespace gavel::chain;
using namespace gavel::db;

namespace {

/// a batch module that can be told to report settlements the engine must refuse
class misreporting_batch : public fixed_price_batch
{
   public:
      enum fault
      {
         no_fault,
         oversell,
         unbalanced_outcomes,
         overpaid_claim
      };
      fault mode = no_fault;

      virtual string keycode()const override { return "BAD"; }

      virtual settlement settle( const database& db, const lot_object& lot, vector<bid_claim>& bid_outcomes )const override
      {
         settlement result = fixed_price_batch::settle( db, lot, bid_outcomes );
         if( mode == oversell )
            result.total_out = lot.capacity + 1;
         if( mode == unbalanced_outcomes && !bid_outcomes.empty() )
            bid_outcomes.front().payout += 1;
         return result;
      }

      virtual bid_claim claim_bid( const database& db, const lot_object& lot, const bid_object& bid )const override
      {
         bid_claim claim = fixed_price_batch::claim_bid( db, lot, bid );
         if( mode == overpaid_claim )
            claim.payout = lot.payouts_pending + 1;
         return claim;
      }
};

}

BOOST_FIXTURE_TEST_SUITE( settlement_tests, database_fixture )

/**
 * One bid fills the whole lot at 2 quote per base, no fees, no curator.
 */
BOOST_AUTO_TEST_CASE( single_bid_fills_lot )
{
   try {
      ACTORS( (seller)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( alice_id, quote, units( 20 ) );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid_id_type b = bid( alice_id, lot, units( 20 ) );
      BOOST_CHECK_EQUAL( balance( GAVEL_AUCTION_HOUSE_ACCOUNT, quote ), units( 20 ) );

      advance_time( 3600 );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_concluded );
      settlement result = settle( lot );

      BOOST_CHECK_EQUAL( result.total_in, units( 20 ) );
      BOOST_CHECK_EQUAL( result.total_out, units( 10 ) );
      BOOST_CHECK( !result.has_partial_fill() );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_settled );
      BOOST_CHECK_EQUAL( lot.sold, units( 10 ) );
      BOOST_CHECK_EQUAL( lot.purchased, units( 20 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 20 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), 0 );

      auto claims = claim_bids( alice_id, lot, { b } );
      BOOST_REQUIRE_EQUAL( claims.size(), 1u );
      BOOST_CHECK_EQUAL( claims[0].paid, units( 20 ) );
      BOOST_CHECK_EQUAL( claims[0].payout, units( 10 ) );
      BOOST_CHECK_EQUAL( claims[0].refund, 0 );
      BOOST_CHECK_EQUAL( balance( alice_id, base ), units( 10 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, quote ), 0 );

      BOOST_CHECK_EQUAL( balance( GAVEL_AUCTION_HOUSE_ACCOUNT, base ), 0 );
      BOOST_CHECK_EQUAL( balance( GAVEL_AUCTION_HOUSE_ACCOUNT, quote ), 0 );
   } FC_LOG_AND_RETHROW()
}

/**
 * A curated lot that falls short of its minimum fill does not settle: the seller gets the
 * capacity and the whole curator reserve back and every bid is refunded in full.
 */
BOOST_AUTO_TEST_CASE( lot_below_minimum_fill_does_not_settle )
{
   try {
      ACTORS( (seller)(curator)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 100 );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, max_curator_fee_type, 1000 );
      set_curator_fee( curator_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, 90 );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) );
      op.curator = curator_id;
      op.params.min_fill_percent = 50000;
      const lot_object& lot = create_lot( op );
      curate( curator_id, lot );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 90 ) - 9 * decimal_factor( 15 ) );

      bid_id_type b = bid( alice_id, lot, units( 2 ) );
      advance_time( 3600 );
      settlement result = settle( lot );

      BOOST_CHECK( !result.settled() );
      BOOST_CHECK_EQUAL( result.total_out, 0 );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_settled );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 100 ) );
      BOOST_CHECK_EQUAL( balance( curator_id, base ), 0 );
      BOOST_CHECK_EQUAL( lot.funding, 0 );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 0 );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 0 );

      auto claims = claim_bids( alice_id, lot, { b } );
      BOOST_CHECK_EQUAL( claims[0].payout, 0 );
      BOOST_CHECK_EQUAL( claims[0].refund, units( 2 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, quote ), units( 100 ) );
      BOOST_CHECK_EQUAL( b( *db ).status, bid_refunded );
   } FC_LOG_AND_RETHROW()
}

/**
 * The bid crossing capacity is filled partially at settlement: its bidder receives the
 * remaining base and the unused quote at once, and fees only see what was kept.
 */
BOOST_AUTO_TEST_CASE( partial_fill )
{
   try {
      ACTORS( (seller)(alice)(bob) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( alice_id, quote, units( 100 ) );
      issue( bob_id, quote, units( 100 ) );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 100 );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid_id_type alice_bid = bid( alice_id, lot, units( 18 ) );
      bid_id_type bob_bid = bid( bob_id, lot, units( 6 ) );

      advance_time( 3600 );
      settlement result = settle( lot );

      BOOST_CHECK_EQUAL( result.total_in, units( 24 ) );
      BOOST_CHECK_EQUAL( result.total_out, units( 10 ) );
      BOOST_REQUIRE( result.has_partial_fill() );
      BOOST_CHECK( *result.pf_bid == bob_bid );
      BOOST_CHECK( result.pf_bidder == bob_id );
      BOOST_CHECK_EQUAL( result.pf_refund, units( 4 ) );
      BOOST_CHECK_EQUAL( result.pf_payout, units( 1 ) );

      BOOST_CHECK_EQUAL( balance( bob_id, base ), units( 1 ) );
      BOOST_CHECK_EQUAL( balance( bob_id, quote ), units( 98 ) );
      BOOST_CHECK_EQUAL( bob_bid( *db ).status, bid_claimed );

      // the fee is charged on 20, not on 24
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 20 ) - 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( lot.purchased, units( 20 ) );
      BOOST_CHECK_EQUAL( lot.payouts_pending, units( 9 ) );

      GAVEL_REQUIRE_THROW( claim_bids( bob_id, lot, { bob_bid } ), invalid_bid_id_exception );
      auto claims = claim_bids( alice_id, lot, { alice_bid } );
      BOOST_CHECK_EQUAL( claims[0].payout, units( 9 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, base ), units( 9 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, quote ), units( 82 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( bids_after_capacity_are_refunded )
{
   try {
      ACTORS( (seller)(alice)(bob) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( alice_id, quote, units( 100 ) );
      issue( bob_id, quote, units( 100 ) );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid( alice_id, lot, units( 20 ) );
      bid_id_type late = bid( bob_id, lot, units( 6 ) );
      advance_time( 3600 );
      settlement result = settle( lot );
      BOOST_CHECK( !result.has_partial_fill() );
      BOOST_CHECK_EQUAL( result.total_in, units( 20 ) );

      auto claims = claim_bids( bob_id, lot, { late } );
      BOOST_CHECK_EQUAL( claims[0].payout, 0 );
      BOOST_CHECK_EQUAL( claims[0].refund, units( 6 ) );
      BOOST_CHECK_EQUAL( balance( bob_id, quote ), units( 100 ) );
   } FC_LOG_AND_RETHROW()
}

/**
 * Every quote token paid in and every base token escrowed ends up with exactly one party,
 * with rounding spread over odd amounts, fees, a referrer, a curator and a partial fill.
 */
BOOST_AUTO_TEST_CASE( settlement_conserves_tokens )
{
   try {
      ACTORS( (seller)(curator)(alice)(bob)(carol)(referrer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );
      issue( bob_id, quote, units( 100 ) );
      issue( carol_id, quote, units( 100 ) );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 137 );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type, 211 );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, max_curator_fee_type, 1000 );
      set_curator_fee( curator_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, 77 );

      const amount_type capacity = units( 7 ) + 3;
      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, capacity, units( 3 ) + 7 );
      op.curator = curator_id;
      const lot_object& lot = create_lot( op );
      curate( curator_id, lot );
      const amount_type reserve = lot.curator_reserve;
      BOOST_CHECK_EQUAL( reserve, percent_of( capacity, 77 ) );

      vector<bid_id_type> alice_bids{ bid( alice_id, lot, units( 5 ) + 11, referrer_id ) };
      vector<bid_id_type> bob_bids{ bid( bob_id, lot, units( 13 ) + 1 ) };
      vector<bid_id_type> carol_bids{ bid( carol_id, lot, units( 9 ), referrer_id ),
                                      bid( carol_id, lot, units( 1 ), referrer_id ) };

      const amount_type seller_base_before = balance( seller_id, base );
      advance_time( 3600 );
      settlement result = settle( lot );
      BOOST_REQUIRE( result.has_partial_fill() );
      BOOST_CHECK( result.pf_bidder == carol_id );

      claim_bids( alice_id, lot, alice_bids );
      claim_bids( bob_id, lot, bob_bids );
      claim_bids( carol_id, lot, { carol_bids[1] } );

      const amount_type effective_in = result.total_in - result.pf_refund;
      const amount_type rewards = db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ) +
                                  db->get_reward_balance( referrer_id, quote.get_id() );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ) + rewards, effective_in );

      const amount_type spent = units( 300 ) - balance( alice_id, quote ) - balance( bob_id, quote ) - balance( carol_id, quote );
      BOOST_CHECK_EQUAL( spent, effective_in );

      const amount_type seller_base_returned = balance( seller_id, base ) - seller_base_before;
      const amount_type bidder_payouts = balance( alice_id, base ) + balance( bob_id, base ) + balance( carol_id, base );
      BOOST_CHECK_EQUAL( bidder_payouts, result.total_out );
      BOOST_CHECK_EQUAL( seller_base_returned + bidder_payouts + balance( curator_id, base ), capacity + reserve );
      BOOST_CHECK_EQUAL( balance( curator_id, base ), percent_of( result.total_out, 77 ) );

      BOOST_CHECK_EQUAL( lot.funding, 0 );
      BOOST_CHECK_EQUAL( lot.payouts_pending, 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( settle_preconditions )
{
   try {
      ACTORS( (seller)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      const lot_object& sale = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid( alice_id, lot, units( 4 ) );

      GAVEL_REQUIRE_THROW( settle( lot ), invalid_state_exception );

      lot_settle_operation op;
      op.caller = alice_id;
      op.lot = lot_id_type( 99 );
      GAVEL_REQUIRE_THROW( db->apply_operation( op ), invalid_lot_id_exception );

      advance_time( 3600 );
      GAVEL_REQUIRE_THROW( settle( sale ), not_implemented_exception );

      // anyone may settle
      op.lot = lot.get_id();
      db->apply_operation( op );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_settled );
      GAVEL_REQUIRE_THROW( settle( lot ), invalid_state_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( module_output_is_verified )
{
   try {
      ACTORS( (seller)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );

      auto module = std::make_shared<misreporting_batch>();
      db->register_auction_module( module );

      const lot_object& lot = create_lot( make_lot( seller_id, "BAD", base, quote, units( 10 ), units( 2 ) ) );
      bid_id_type b = bid( alice_id, lot, units( 20 ) );
      advance_time( 3600 );

      module->mode = misreporting_batch::oversell;
      GAVEL_REQUIRE_THROW( settle( lot ), accounting_exception );
      module->mode = misreporting_batch::unbalanced_outcomes;
      GAVEL_REQUIRE_THROW( settle( lot ), accounting_exception );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_concluded );
      BOOST_CHECK_EQUAL( lot.funding, units( 10 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 0 );

      module->mode = misreporting_batch::no_fault;
      settle( lot );
      BOOST_CHECK_EQUAL( lot.payouts_pending, units( 10 ) );

      module->mode = misreporting_batch::overpaid_claim;
      GAVEL_REQUIRE_THROW( claim_bids( alice_id, lot, { b } ), funding_underflow_exception );
      BOOST_CHECK( b( *db ).is_live() );
      BOOST_CHECK_EQUAL( lot.payouts_pending, units( 10 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, base ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
