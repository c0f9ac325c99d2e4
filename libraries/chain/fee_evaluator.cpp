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
#include <gavel/chain/fee_evaluator.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/fee_object.hpp>

namespace gavel { namespace chain {

void_result fee_config_update_evaluator::do_evaluate( const fee_config_update_operation& o )
{ try {
   GAVEL_ASSERT( o.governor == GAVEL_PROTOCOL_ACCOUNT, not_permitted_exception,
                 "fees are governed by the protocol account, not ${a}", ("a", o.governor) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result fee_config_update_evaluator::do_apply( const fee_config_update_operation& o )
{ try {
   db().set_fee( o.auction_type, o.type, o.percent );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result curator_fee_update_evaluator::do_evaluate( const curator_fee_update_operation& o )
{ try {
   FC_ASSERT( db().find( o.curator ) != nullptr, "unknown curator ${c}", ("c", o.curator) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result curator_fee_update_evaluator::do_apply( const curator_fee_update_operation& o )
{ try {
   db().set_curator_fee( o.curator, o.auction_type, o.percent );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result rewards_claim_evaluator::do_evaluate( const rewards_claim_operation& o )
{ try {
   o.token( db() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

amount_result rewards_claim_evaluator::do_apply( const rewards_claim_operation& o )
{ try {
   return db().claim_rewards( o.recipient, o.token );
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // gavel::chain
