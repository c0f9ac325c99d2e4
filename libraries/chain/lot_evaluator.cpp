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
#include <gavel/chain/lot_evaluator.hpp>
#include <gavel/chain/asset_object.hpp>
#include <gavel/chain/lot_object.hpp>

namespace gavel { namespace chain {

void_result lot_create_evaluator::do_evaluate( const lot_create_operation& o )
{ try {
   const database& d = db();
   o.base_token( d );
   o.quote_token( d );
   if( o.curator.valid() )
      FC_ASSERT( d.find( *o.curator ) != nullptr, "unknown curator ${c}", ("c", *o.curator) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_result lot_create_evaluator::do_apply( const lot_create_operation& o )
{ try {
   return db().create_lot( o ).id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result lot_cancel_evaluator::do_evaluate( const lot_cancel_operation& o )
{ try {
   _lot = &db().get_lot( o.lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result lot_cancel_evaluator::do_apply( const lot_cancel_operation& o )
{ try {
   db().cancel_lot( o.seller, *_lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result lot_curate_evaluator::do_evaluate( const lot_curate_operation& o )
{ try {
   _lot = &db().get_lot( o.lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result lot_curate_evaluator::do_apply( const lot_curate_operation& o )
{ try {
   db().curate( o.curator, *_lot );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_evaluator::do_evaluate( const bid_operation& o )
{ try {
   db().get_lot( o.lot );
   if( o.referrer != GAVEL_NULL_ACCOUNT )
      FC_ASSERT( db().find( o.referrer ) != nullptr, "unknown referrer ${r}", ("r", o.referrer) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_result bid_evaluator::do_apply( const bid_operation& o )
{ try {
   return db().place_bid( o ).id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_refund_evaluator::do_evaluate( const bid_refund_operation& o )
{ try {
   const database& d = db();
   _lot = &d.get_lot( o.lot );
   _bid = &d.get_bid( *_lot, o.bid );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_refund_evaluator::do_apply( const bid_refund_operation& o )
{ try {
   db().refund_bid( o.bidder, *_lot, *_bid );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result purchase_evaluator::do_evaluate( const purchase_operation& o )
{ try {
   const database& d = db();
   d.get_lot( o.lot );
   FC_ASSERT( d.find( o.recipient ) != nullptr, "unknown recipient ${r}", ("r", o.recipient) );
   if( o.referrer != GAVEL_NULL_ACCOUNT )
      FC_ASSERT( d.find( o.referrer ) != nullptr, "unknown referrer ${r}", ("r", o.referrer) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

amount_result purchase_evaluator::do_apply( const purchase_operation& o )
{ try {
   return db().purchase( o );
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // gavel::chain
