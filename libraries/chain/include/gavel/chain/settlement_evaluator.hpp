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
#include <gavel/chain/protocol/operations.hpp>
#include <gavel/chain/evaluator.hpp>
#include <gavel/chain/database.hpp>

namespace gavel { namespace chain {

   class lot_settle_evaluator : public evaluator<lot_settle_evaluator>
   {
      public:
         typedef lot_settle_operation operation_type;

         void_result       do_evaluate( const lot_settle_operation& o );
         settlement_result do_apply( const lot_settle_operation& o );

         const lot_object* _lot = nullptr;
   };

   class proceeds_claim_evaluator : public evaluator<proceeds_claim_evaluator>
   {
      public:
         typedef proceeds_claim_operation operation_type;

         void_result   do_evaluate( const proceeds_claim_operation& o );
         amount_result do_apply( const proceeds_claim_operation& o );

         const lot_object* _lot = nullptr;
   };

   class bids_claim_evaluator : public evaluator<bids_claim_evaluator>
   {
      public:
         typedef bids_claim_operation operation_type;

         void_result       do_evaluate( const bids_claim_operation& o );
         bid_claims_result do_apply( const bids_claim_operation& o );

         const lot_object* _lot = nullptr;
   };

} } // gavel::chain
