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

#include <gavel/chain/fee_object.hpp>
#include <gavel/chain/lot_object.hpp>

#include "../common/database_fixture.hpp"

using namespace gavel::chain;
using namespace gavel::db;

BOOST_FIXTURE_TEST_SUITE( fee_tests, database_fixture )

BOOST_AUTO_TEST_CASE( fee_config_governance )
{
   try {
      ACTORS( (alice) );

      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 100 );
      BOOST_CHECK_EQUAL( db->get_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type ), 100 );
      BOOST_CHECK_EQUAL( db->get_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type ), 0 );
      BOOST_CHECK_EQUAL( db->get_fee( GAVEL_FIXED_PRICE_SALE_KEYCODE, protocol_fee_type ), 0 );

      fee_config_update_operation op;
      op.governor = alice_id;
      op.auction_type = GAVEL_FIXED_PRICE_BATCH_KEYCODE;
      op.type = protocol_fee_type;
      op.percent = 0;
      GAVEL_REQUIRE_THROW( db->apply_operation( op ), not_permitted_exception );
      BOOST_CHECK_EQUAL( db->get_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type ), 100 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fee_bounds )
{
   try {
      GAVEL_REQUIRE_THROW( set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, GAVEL_100_PERCENT + 1 ), invalid_fee_exception );

      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 60000 );
      GAVEL_REQUIRE_THROW( set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type, 50000 ), invalid_fee_exception );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type, 40000 );
      BOOST_CHECK_EQUAL( db->get_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type ), 40000 );

      // the max curator fee is bounded on its own
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, max_curator_fee_type, GAVEL_100_PERCENT );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fee_split )
{
   try {
      const amount_type gross = units( 20 );

      auto split = database::compute_fee_split( gross, 100, 105, true );
      BOOST_CHECK_EQUAL( split.protocol_fee, 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( split.referrer_fee, 21 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( split.net, gross - 41 * decimal_factor( 15 ) );

      // an absent referrer's share stays with the seller
      split = database::compute_fee_split( gross, 100, 105, false );
      BOOST_CHECK_EQUAL( split.protocol_fee, 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( split.referrer_fee, 0 );
      BOOST_CHECK_EQUAL( split.net, gross - 2 * decimal_factor( 16 ) );

      // floors, never rounds up
      split = database::compute_fee_split( 999, 100, 100, true );
      BOOST_CHECK_EQUAL( split.protocol_fee, 0 );
      BOOST_CHECK_EQUAL( split.referrer_fee, 0 );
      BOOST_CHECK_EQUAL( split.net, 999 );

      GAVEL_REQUIRE_THROW( database::compute_fee_split( gross, 60000, 50000, true ), invalid_fee_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( protocol_fee_is_monotonic )
{
   try {
      const amount_type effective_in = units( 20 );
      amount_type last = 0;
      for( uint32_t percent = 1; percent <= 1000; ++percent )
      {
         const auto split = database::compute_fee_split( effective_in, percent, 0, false );
         BOOST_CHECK_GT( split.protocol_fee, last );
         last = split.protocol_fee;
      }
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( referrer_and_protocol_rewards )
{
   try {
      ACTORS( (seller)(alice)(referrer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );

      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 100 );
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type, 105 );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid_id_type b = bid( alice_id, lot, units( 20 ), referrer_id );
      advance_time( 3600 );
      settle( lot );

      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 20 ) - 41 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( referrer_id, quote.get_id() ), 21 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, base.get_id() ), 0 );

      BOOST_CHECK_EQUAL( claim_rewards( referrer_id, quote ), 21 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( balance( referrer_id, quote ), 21 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( referrer_id, quote.get_id() ), 0 );
      BOOST_CHECK_EQUAL( claim_rewards( referrer_id, quote ), 0 );
      BOOST_CHECK_EQUAL( balance( referrer_id, quote ), 21 * decimal_factor( 15 ) );

      BOOST_CHECK_EQUAL( claim_rewards( GAVEL_PROTOCOL_ACCOUNT, quote ), 2 * decimal_factor( 16 ) );
      BOOST_CHECK_EQUAL( balance( GAVEL_PROTOCOL_ACCOUNT, quote ), 2 * decimal_factor( 16 ) );

      auto claims = claim_bids( alice_id, lot, { b } );
      BOOST_REQUIRE_EQUAL( claims.size(), 1u );
      BOOST_CHECK_EQUAL( claims[0].payout, units( 10 ) );
      BOOST_CHECK_EQUAL( balance( alice_id, base ), units( 10 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fees_lock_in_at_first_bid )
{
   try {
      ACTORS( (seller)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );

      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 100 );
      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      BOOST_CHECK( !lot.fees.fees_locked );

      bid( alice_id, lot, units( 20 ) );
      BOOST_CHECK( lot.fees.fees_locked );
      BOOST_CHECK_EQUAL( lot.fees.protocol_fee, 100 );

      // a later change does not reach the locked lot
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, protocol_fee_type, 5000 );
      advance_time( 3600 );
      settle( lot );

      BOOST_CHECK_EQUAL( lot.fees.protocol_fee, 100 );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 2 * decimal_factor( 16 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( referrer_fee_floors_per_bid )
{
   try {
      ACTORS( (seller)(alice)(bob)(referrer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 1 ) );
      issue( bob_id, quote, units( 1 ) );

      // 0.1%: 1999 pays a fee of 1, 3998 would pay 3
      set_fee( GAVEL_FIXED_PRICE_BATCH_KEYCODE, referrer_fee_type, 100 );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid( alice_id, lot, 1999, referrer_id );
      bid( bob_id, lot, 1999, referrer_id );
      advance_time( 3600 );
      settle( lot );

      BOOST_CHECK_EQUAL( db->get_reward_balance( referrer_id, quote.get_id() ), 2 );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 0 );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 3996 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
