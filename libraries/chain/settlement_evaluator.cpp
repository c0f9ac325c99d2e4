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
#include <gavel/chain/settlement_evaluator.hpp>
#include <gavel/chain/lot_object.hpp>

namespace gavel { namespace chain {

void_result lot_settle_evaluator::do_evaluate( const lot_settle_operation& o )
{ try {
   _lot = &db().get_lot( o.lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

settlement_result lot_settle_evaluator::do_apply( const lot_settle_operation& o )
{ try {
   return db().settle( *_lot );
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result proceeds_claim_evaluator::do_evaluate( const proceeds_claim_operation& o )
{ try {
   _lot = &db().get_lot( o.lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

amount_result proceeds_claim_evaluator::do_apply( const proceeds_claim_operation& o )
{ try {
   return db().claim_proceeds( o.seller, *_lot );
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bids_claim_evaluator::do_evaluate( const bids_claim_operation& o )
{ try {
   _lot = &db().get_lot( o.lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

bid_claims_result bids_claim_evaluator::do_apply( const bids_claim_operation& o )
{ try {
   bid_claims_result result;
   result.result = db().claim_bids( o.bidder, *_lot, o.bids );
   return result;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // gavel::chain
