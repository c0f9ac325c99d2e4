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

#include <fc/exception/exception.hpp>
#include <gavel/chain/protocol/operations.hpp>

#define GAVEL_ASSERT( expr, exc_type, FORMAT, ... )                   \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END


#define GAVEL_DECLARE_OP_BASE_EXCEPTIONS( op_name )                   \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      gavel::chain::operation_validate_exception,                     \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      gavel::chain::operation_evaluate_exception,                     \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define GAVEL_DECLARE_OP_VALIDATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      gavel::chain::op_name ## _validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

#define GAVEL_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      gavel::chain::op_name ## _evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace gavel { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "auction engine exception" )
   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,          gavel::chain::chain_exception, 3010000, "database query exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,      gavel::chain::chain_exception, 3040000, "operation validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,      gavel::chain::chain_exception, 3050000, "operation evaluation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( utility_exception,                 gavel::chain::chain_exception, 3060000, "utility method exception" )
   FC_DECLARE_DERIVED_EXCEPTION( accounting_exception,              gavel::chain::chain_exception, 3080000, "accounting invariant violated" )
   FC_DECLARE_DERIVED_EXCEPTION( token_exception,                   gavel::chain::chain_exception, 3090000, "token movement failed" )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_lot_id_exception,          gavel::chain::database_query_exception, 3010001, "invalid lot id" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_bid_id_exception,          gavel::chain::database_query_exception, 3010002, "invalid bid id" )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_params_exception,          gavel::chain::operation_validate_exception, 3040001, "invalid parameters" )
   FC_DECLARE_DERIVED_EXCEPTION( unsupported_token_exception,       gavel::chain::invalid_params_exception, 3040002, "unsupported token" )

   FC_DECLARE_DERIVED_EXCEPTION( invalid_state_exception,           gavel::chain::operation_evaluate_exception, 3050001, "invalid lot state" )
   FC_DECLARE_DERIVED_EXCEPTION( market_not_active_exception,       gavel::chain::invalid_state_exception, 3050002, "market not active" )
   FC_DECLARE_DERIVED_EXCEPTION( reentrancy_exception,              gavel::chain::invalid_state_exception, 3050003, "reentrant call" )
   FC_DECLARE_DERIVED_EXCEPTION( not_permitted_exception,           gavel::chain::operation_evaluate_exception, 3050004, "not permitted" )
   FC_DECLARE_DERIVED_EXCEPTION( not_bidder_exception,              gavel::chain::not_permitted_exception, 3050005, "not the bidder" )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_fee_exception,             gavel::chain::operation_evaluate_exception, 3050006, "invalid fee" )
   FC_DECLARE_DERIVED_EXCEPTION( not_implemented_exception,         gavel::chain::operation_evaluate_exception, 3050007, "not implemented by auction module" )

   FC_DECLARE_DERIVED_EXCEPTION( overflow_exception,                gavel::chain::utility_exception, 3060001, "amount overflow" )

   FC_DECLARE_DERIVED_EXCEPTION( funding_underflow_exception,       gavel::chain::accounting_exception, 3080001, "funding underflow" )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception,    gavel::chain::token_exception, 3090001, "insufficient balance" )
   FC_DECLARE_DERIVED_EXCEPTION( transfer_restricted_exception,     gavel::chain::token_exception, 3090002, "transfer restricted" )

   GAVEL_DECLARE_OP_BASE_EXCEPTIONS( lot_create );
   GAVEL_DECLARE_OP_EVALUATE_EXCEPTION( unknown_auction_type, lot_create, 1, "no auction module registered for auction type" )
   GAVEL_DECLARE_OP_EVALUATE_EXCEPTION( unknown_callbacks, lot_create, 2, "no callbacks registered under that name" )

   GAVEL_DECLARE_OP_BASE_EXCEPTIONS( purchase );
   GAVEL_DECLARE_OP_EVALUATE_EXCEPTION( amount_out_below_minimum, purchase, 1, "amount out below minimum" )

} } // gavel::chain
