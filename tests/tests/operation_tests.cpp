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

#include <gavel/chain/account_object.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/lot_object.hpp>

#include "../common/database_fixture.hpp"

using namespace gavel::chain;
using namespace gavel::db;

BOOST_FIXTURE_TEST_SUITE( operation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( valid_name_test )
{
   BOOST_CHECK( is_valid_name( "a" ) );
   BOOST_CHECK( is_valid_name( "alice" ) );
   BOOST_CHECK( is_valid_name( "auction-house" ) );
   BOOST_CHECK( is_valid_name( "a0-9" ) );

   BOOST_CHECK( !is_valid_name( "" ) );
   BOOST_CHECK( !is_valid_name( "A" ) );
   BOOST_CHECK( !is_valid_name( "0a" ) );
   BOOST_CHECK( !is_valid_name( "-a" ) );
   BOOST_CHECK( !is_valid_name( "a-" ) );
   BOOST_CHECK( !is_valid_name( "a.b" ) );
   BOOST_CHECK( !is_valid_name( "aBc" ) );
   BOOST_CHECK( !is_valid_name( std::string( GAVEL_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) ) );
}

BOOST_AUTO_TEST_CASE( valid_symbol_test )
{
   BOOST_CHECK( is_valid_symbol( "USD" ) );
   BOOST_CHECK( is_valid_symbol( "WETH9" ) );

   BOOST_CHECK( !is_valid_symbol( "US" ) );
   BOOST_CHECK( !is_valid_symbol( "usd" ) );
   BOOST_CHECK( !is_valid_symbol( "9USD" ) );
   BOOST_CHECK( !is_valid_symbol( "US.D" ) );
   BOOST_CHECK( !is_valid_symbol( "ABCDEFGHIJKLMNOPQ" ) );
}

BOOST_AUTO_TEST_CASE( create_account_and_token )
{
   try {
      ACTORS( (alice) );
      BOOST_CHECK( alice.name == "alice" );
      BOOST_CHECK( get_account( "alice" ).get_id() == alice_id );
      GAVEL_REQUIRE_THROW( create_account( "alice" ), invalid_params_exception );
      GAVEL_REQUIRE_THROW( create_account( "Alice" ), invalid_params_exception );

      const asset_object& usd = create_token( "USD", 6 );
      BOOST_CHECK_EQUAL( usd.precision, 6 );
      BOOST_CHECK( usd.issuer == get_account( "treasury" ).get_id() );
      GAVEL_REQUIRE_THROW( create_token( "USD" ), invalid_params_exception );
      GAVEL_REQUIRE_THROW( create_token( "LOW", 5 ), unsupported_token_exception );
      GAVEL_REQUIRE_THROW( create_token( "HIGH", 19 ), unsupported_token_exception );

      issue( alice_id, usd, 1000 );
      BOOST_CHECK_EQUAL( balance( alice_id, usd ), 1000 );
      BOOST_CHECK_EQUAL( usd.current_supply, 1000 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( only_the_issuer_issues )
{
   try {
      ACTORS( (alice) );
      const asset_object& usd = create_token( "USD" );

      asset_issue_operation op;
      op.issuer = alice_id;
      op.asset_to_issue = usd.amount( 1 );
      op.issue_to_account = alice_id;
      GAVEL_REQUIRE_THROW( db->apply_operation( op ), not_permitted_exception );
      BOOST_CHECK_EQUAL( usd.current_supply, 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( unknown_actor_is_rejected )
{
   try {
      const asset_object& usd = create_token( "USD" );
      transfer_operation op;
      op.from = account_id_type( 99 );
      op.to = get_account( "treasury" ).get_id();
      op.amount = usd.amount( 1 );
      GAVEL_REQUIRE_THROW( db->apply_operation( op ), not_permitted_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( transfer_test )
{
   try {
      ACTORS( (alice)(bob) );
      const asset_object& usd = create_token( "USD" );
      issue( alice_id, usd, 500 );

      BOOST_CHECK_EQUAL( transfer( alice_id, bob_id, usd.amount( 200 ) ), 200 );
      BOOST_CHECK_EQUAL( balance( alice_id, usd ), 300 );
      BOOST_CHECK_EQUAL( balance( bob_id, usd ), 200 );

      GAVEL_REQUIRE_THROW( transfer( alice_id, bob_id, usd.amount( 301 ) ), insufficient_balance_exception );
      GAVEL_REQUIRE_THROW( transfer( alice_id, bob_id, usd.amount( 0 ) ), invalid_params_exception );
      GAVEL_REQUIRE_THROW( transfer( alice_id, alice_id, usd.amount( 1 ) ), fc::exception );
      BOOST_CHECK_EQUAL( balance( alice_id, usd ), 300 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fee_on_transfer_burns )
{
   try {
      ACTORS( (alice)(bob) );
      // 1% fee on every transfer
      const asset_object& fot = create_token( "FOT", 18, GAVEL_1_PERCENT );
      issue( alice_id, fot, 10000 );

      BOOST_CHECK_EQUAL( transfer( alice_id, bob_id, fot.amount( 1000 ) ), 990 );
      BOOST_CHECK_EQUAL( balance( alice_id, fot ), 9000 );
      BOOST_CHECK_EQUAL( balance( bob_id, fot ), 990 );
      BOOST_CHECK_EQUAL( fot.current_supply, 9990 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( restricted_accounts_cannot_transfer )
{
   try {
      ACTORS( (alice)(bob) );
      const asset_object& usd = create_token( "USD" );
      issue( alice_id, usd, 100 );
      db->modify( usd, [&]( asset_object& a ) {
         a.restricted_accounts.insert( bob_id );
      });

      GAVEL_REQUIRE_THROW( transfer( alice_id, bob_id, usd.amount( 10 ) ), transfer_restricted_exception );
      BOOST_CHECK_EQUAL( balance( alice_id, usd ), 100 );
      BOOST_CHECK_EQUAL( balance( bob_id, usd ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( lot_create_validation )
{
   try {
      ACTORS( (seller)(curator) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) );
      op.validate();

      REQUIRE_OP_VALIDATION_FAILURE_2( op, auction_type, "", invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, quote_token, base.get_id(), invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, capacity, 0, invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, capacity, GAVEL_MAX_AMOUNT + 1, overflow_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, duration, 0, invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, curator, seller_id, invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, curator, GAVEL_NULL_ACCOUNT, invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, callbacks, string(), invalid_params_exception );
      REQUIRE_OP_VALIDATION_FAILURE_2( op, params.min_fill_percent, GAVEL_100_PERCENT + 1, invalid_params_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( lot_create_evaluation )
{
   try {
      ACTORS( (seller) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );

      lot_create_operation op = make_lot( seller_id, "DUTCH", base, quote, units( 10 ), units( 2 ) );
      GAVEL_REQUIRE_THROW( create_lot( op ), lot_create_unknown_auction_type );

      op.auction_type = GAVEL_FIXED_PRICE_BATCH_KEYCODE;
      op.callbacks = string( "nobody" );
      GAVEL_REQUIRE_THROW( create_lot( op ), lot_create_unknown_callbacks );
      op.callbacks.reset();

      op.params.price = 0;
      GAVEL_REQUIRE_THROW( create_lot( op ), invalid_params_exception );
      op.params.price = units( 2 );

      op.start = db->head_time() - 1;
      GAVEL_REQUIRE_THROW( create_lot( op ), invalid_params_exception );
      op.start = time_point_sec();

      op.capacity = units( 101 );
      GAVEL_REQUIRE_THROW( create_lot( op ), insufficient_balance_exception );
      op.capacity = units( 10 );

      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 100 ) );

      const lot_object& lot = create_lot( op );
      BOOST_CHECK( lot.prefunded );
      BOOST_CHECK( lot.is_batch() );
      BOOST_CHECK_EQUAL( lot.funding, units( 10 ) );
      BOOST_CHECK( lot.start == db->head_time() );
      BOOST_CHECK( lot.conclusion == db->head_time() + 3600 );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_started );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 90 ) );

      const lot_object& second = create_lot( op );
      BOOST_CHECK( second.id != lot.id );
      BOOST_CHECK( second.id.instance() > lot.id.instance() );

      GAVEL_REQUIRE_THROW( db->get_lot( lot_id_type( 99 ) ), invalid_lot_id_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fee_on_transfer_base_cannot_prefund )
{
   try {
      ACTORS( (seller) );
      const asset_object& fot = create_token( "FOT", 18, GAVEL_1_PERCENT );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, fot, units( 100 ) );

      GAVEL_REQUIRE_THROW( create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, fot, quote, units( 10 ), units( 2 ) ) ),
                           unsupported_token_exception );
      BOOST_CHECK_EQUAL( balance( seller_id, fot ), units( 100 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( cancel_lot_test )
{
   try {
      ACTORS( (seller)(alice) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) );
      op.start = db->head_time() + 60;
      const lot_object& lot = create_lot( op );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_created );

      GAVEL_REQUIRE_THROW( cancel_lot( alice_id, lot ), not_permitted_exception );
      cancel_lot( seller_id, lot );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_cancelled );
      BOOST_CHECK_EQUAL( lot.funding, 0 );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 100 ) );
      GAVEL_REQUIRE_THROW( cancel_lot( seller_id, lot ), market_not_active_exception );

      // a started batch lot can no longer be cancelled
      const lot_object& running = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      GAVEL_REQUIRE_THROW( cancel_lot( seller_id, running ), market_not_active_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( bids_claim_validation )
{
   bids_claim_operation op;
   op.bidder = account_id_type( 3 );
   op.lot = lot_id_type( 0 );
   GAVEL_REQUIRE_THROW( op.validate(), invalid_params_exception );

   op.bids = { bid_id_type( 1 ), bid_id_type( 2 ) };
   op.validate();
   op.bids.push_back( bid_id_type( 1 ) );
   GAVEL_REQUIRE_THROW( op.validate(), invalid_bid_id_exception );

   op.bids.clear();
   for( uint32_t i = 0; i <= GAVEL_DEFAULT_MAX_BIDS_PER_CLAIM; ++i )
      op.bids.push_back( bid_id_type( i ) );
   GAVEL_REQUIRE_THROW( op.validate(), invalid_params_exception );
}

BOOST_AUTO_TEST_SUITE_END()
