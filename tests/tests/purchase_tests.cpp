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
#include <gavel/chain/lot_callbacks.hpp>

#include <gavel/chain/global_property_object.hpp>
#include <gavel/chain/lot_object.hpp>

#include "../common/database_fixture.hpp"

using namespace gavel::chain;
using namespace gavel::db;

BOOST_FIXTURE_TEST_SUITE( purchase_tests, database_fixture )

BOOST_AUTO_TEST_CASE( purchase_with_fees_and_referrer )
{
   try {
      ACTORS( (seller)(buyer)(referrer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );
      set_fee( GAVEL_FIXED_PRICE_SALE_KEYCODE, protocol_fee_type, 100 );
      set_fee( GAVEL_FIXED_PRICE_SALE_KEYCODE, referrer_fee_type, 50 );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      BOOST_CHECK_EQUAL( purchase( buyer_id, lot, units( 4 ), units( 2 ), referrer_id ), units( 2 ) );

      BOOST_CHECK_EQUAL( balance( buyer_id, base ), units( 2 ) );
      BOOST_CHECK_EQUAL( balance( buyer_id, quote ), units( 96 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 4 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( referrer_id, quote.get_id() ), 2 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 4 ) - 6 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( lot.sold, units( 2 ) );
      BOOST_CHECK_EQUAL( lot.purchased, units( 4 ) );
      BOOST_CHECK_EQUAL( lot.funding, units( 8 ) );
      BOOST_CHECK( lot.fees.fees_locked );

      // without a referrer the seller keeps the referrer share
      purchase( buyer_id, lot, units( 4 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 8 ) - 10 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( db->get_reward_balance( referrer_id, quote.get_id() ), 2 * decimal_factor( 15 ) );

      BOOST_CHECK_EQUAL( claim_rewards( referrer_id, quote ), 2 * decimal_factor( 15 ) );
      BOOST_CHECK_EQUAL( balance( referrer_id, quote ), 2 * decimal_factor( 15 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_below_minimum_out_leaves_no_trace )
{
   try {
      ACTORS( (seller)(buyer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );
      set_fee( GAVEL_FIXED_PRICE_SALE_KEYCODE, protocol_fee_type, 100 );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, lot, units( 4 ), units( 2 ) + 1 ), purchase_amount_out_below_minimum );

      BOOST_CHECK_EQUAL( balance( buyer_id, quote ), units( 100 ) );
      BOOST_CHECK_EQUAL( balance( buyer_id, base ), 0 );
      BOOST_CHECK_EQUAL( lot.sold, 0 );
      BOOST_CHECK_EQUAL( lot.funding, units( 10 ) );
      BOOST_CHECK( !lot.fees.fees_locked );
      BOOST_CHECK_EQUAL( db->get_reward_balance( GAVEL_PROTOCOL_ACCOUNT, quote.get_id() ), 0 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_until_sold_out )
{
   try {
      ACTORS( (seller)(buyer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, lot, units( 22 ) ), invalid_params_exception );

      purchase( buyer_id, lot, units( 4 ) );
      purchase( buyer_id, lot, units( 16 ) );
      BOOST_CHECK( lot.sold_out() );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_concluded );
      BOOST_CHECK_EQUAL( lot.funding, 0 );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, lot, units( 2 ) ), market_not_active_exception );
      GAVEL_REQUIRE_THROW( cancel_lot( seller_id, lot ), market_not_active_exception );

      BOOST_CHECK_EQUAL( balance( buyer_id, base ), units( 10 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 20 ) );

      BOOST_CHECK_EQUAL( claim_proceeds( seller_id, lot ), 0 );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_claimed );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_requires_running_atomic_lot )
{
   try {
      ACTORS( (seller)(buyer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 100 ) );
      issue( buyer_id, quote, units( 100 ) );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) );
      op.start = db->head_time() + 60;
      const lot_object& pending = create_lot( op );
      const lot_object& batch = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );

      GAVEL_REQUIRE_THROW( purchase( buyer_id, pending, units( 2 ) ), market_not_active_exception );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, batch, units( 2 ) ), not_implemented_exception );
      GAVEL_REQUIRE_THROW( bid( buyer_id, pending, units( 2 ) ), not_implemented_exception );

      advance_time( 60 );
      BOOST_CHECK_EQUAL( purchase( buyer_id, pending, units( 2 ) ), units( 1 ) );
      advance_time( 3600 );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, pending, units( 2 ) ), market_not_active_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( cancel_running_sale )
{
   try {
      ACTORS( (seller)(buyer)(mallory) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      purchase( buyer_id, lot, units( 6 ) );

      GAVEL_REQUIRE_THROW( cancel_lot( mallory_id, lot ), not_permitted_exception );
      cancel_lot( seller_id, lot );
      BOOST_CHECK_EQUAL( db->get_lot_status( lot ), lot_cancelled );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 7 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 6 ) );
      BOOST_CHECK_EQUAL( lot.funding, 0 );

      GAVEL_REQUIRE_THROW( purchase( buyer_id, lot, units( 2 ) ), market_not_active_exception );
      GAVEL_REQUIRE_THROW( cancel_lot( seller_id, lot ), market_not_active_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( held_proceeds_are_claimed_after_conclusion )
{
   try {
      ACTORS( (seller)(buyer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( seller_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );
      db->modify( db->get_global_properties(), []( global_property_object& p ) {
         p.parameters.push_proceeds = false;
      });

      const lot_object& lot = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      purchase( buyer_id, lot, units( 4 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 0 );
      BOOST_CHECK_EQUAL( lot.proceeds_pending, units( 4 ) );

      GAVEL_REQUIRE_THROW( claim_proceeds( seller_id, lot ), invalid_state_exception );
      advance_time( 3600 );
      BOOST_CHECK_EQUAL( claim_proceeds( seller_id, lot ), units( 4 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), units( 4 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, base ), units( 8 ) );
      GAVEL_REQUIRE_THROW( claim_proceeds( seller_id, lot ), invalid_state_exception );
   } FC_LOG_AND_RETHROW()
}

/**
 * A lot whose callbacks send base tokens is not prefunded: every purchase draws base from
 * the custody account, and quote proceeds go there too.
 */
BOOST_AUTO_TEST_CASE( custody_account_supplies_base )
{
   try {
      ACTORS( (seller)(buyer)(vault) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( vault_id, base, units( 10 ) );
      issue( buyer_id, quote, units( 100 ) );

      auto callbacks = std::make_shared<test_callbacks>();
      callbacks->flags = send_base_tokens | receive_quote_tokens | on_purchase_callback;
      callbacks->custody = vault_id;
      db->register_callbacks( "vault", callbacks );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 20 ), units( 2 ) );
      op.callbacks = string( "vault" );
      const lot_object& lot = create_lot( op );
      BOOST_CHECK( !lot.prefunded );
      BOOST_CHECK_EQUAL( lot.funding, 0 );
      BOOST_CHECK_EQUAL( balance( vault_id, base ), units( 10 ) );
      BOOST_CHECK_EQUAL( callbacks->calls["create"], 0 );

      purchase( buyer_id, lot, units( 4 ) );
      BOOST_CHECK_EQUAL( balance( buyer_id, base ), units( 2 ) );
      BOOST_CHECK_EQUAL( balance( vault_id, base ), units( 8 ) );
      BOOST_CHECK_EQUAL( balance( vault_id, quote ), units( 4 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 0 );
      BOOST_CHECK_EQUAL( callbacks->calls["purchase"], 1 );

      // the vault cannot cover this one
      GAVEL_REQUIRE_THROW( purchase( buyer_id, lot, units( 18 ) ), insufficient_balance_exception );
      BOOST_CHECK_EQUAL( balance( buyer_id, quote ), units( 96 ) );
      BOOST_CHECK_EQUAL( callbacks->calls["purchase"], 1 );

      op.callbacks = string( "missing" );
      GAVEL_REQUIRE_THROW( create_lot( op ), lot_create_unknown_callbacks );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( custody_account_funds_batch_lot )
{
   try {
      ACTORS( (seller)(alice)(vault) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "QUOTE" );
      issue( vault_id, base, units( 10 ) );
      issue( alice_id, quote, units( 100 ) );

      auto callbacks = std::make_shared<test_callbacks>();
      callbacks->flags = send_base_tokens | receive_quote_tokens | on_create_callback | on_bid_callback | on_settle_callback;
      callbacks->custody = vault_id;
      db->register_callbacks( "vault", callbacks );

      lot_create_operation op = make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) );
      op.callbacks = string( "vault" );
      const lot_object& lot = create_lot( op );
      BOOST_CHECK( lot.prefunded );
      BOOST_CHECK_EQUAL( balance( vault_id, base ), 0 );
      BOOST_CHECK_EQUAL( callbacks->calls["create"], 1 );

      bid( alice_id, lot, units( 8 ) );
      BOOST_CHECK_EQUAL( callbacks->calls["bid"], 1 );
      advance_time( 3600 );
      settle( lot );
      BOOST_CHECK_EQUAL( callbacks->calls["settle"], 1 );

      BOOST_CHECK_EQUAL( balance( vault_id, base ), units( 6 ) );
      BOOST_CHECK_EQUAL( balance( vault_id, quote ), units( 8 ) );
      BOOST_CHECK_EQUAL( balance( seller_id, quote ), 0 );
   } FC_LOG_AND_RETHROW()
}

/**
 * Tokens that burn part of every transfer are credited at what the auction house actually
 * received.
 */
BOOST_AUTO_TEST_CASE( bid_credits_amount_received )
{
   try {
      ACTORS( (seller)(alice)(buyer) );
      const asset_object& base = create_token( "BASE" );
      const asset_object& quote = create_token( "TAXED", 18, GAVEL_1_PERCENT );
      issue( seller_id, base, units( 100 ) );
      issue( alice_id, quote, units( 100 ) );
      issue( buyer_id, quote, units( 100 ) );

      const lot_object& batch = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_BATCH_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      bid_id_type b = bid( alice_id, batch, units( 10 ) );
      BOOST_CHECK_EQUAL( b( *db ).amount, units( 10 ) - units( 1 ) / 10 );
      BOOST_CHECK_EQUAL( balance( alice_id, quote ), units( 90 ) );

      const lot_object& sale = create_lot( make_lot( seller_id, GAVEL_FIXED_PRICE_SALE_KEYCODE, base, quote, units( 10 ), units( 2 ) ) );
      BOOST_CHECK_EQUAL( purchase( buyer_id, sale, units( 10 ) ), ( units( 10 ) - units( 1 ) / 10 ) / 2 );
      GAVEL_REQUIRE_THROW( purchase( buyer_id, sale, units( 10 ), units( 5 ) ), purchase_amount_out_below_minimum );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
