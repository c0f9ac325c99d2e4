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

   class lot_create_evaluator : public evaluator<lot_create_evaluator>
   {
      public:
         typedef lot_create_operation operation_type;

         void_result      do_evaluate( const lot_create_operation& o );
         object_id_result do_apply( const lot_create_operation& o );
   };

   class lot_cancel_evaluator : public evaluator<lot_cancel_evaluator>
   {
      public:
         typedef lot_cancel_operation operation_type;

         void_result do_evaluate( const lot_cancel_operation& o );
         void_result do_apply( const lot_cancel_operation& o );

         const lot_object* _lot = nullptr;
   };

   class lot_curate_evaluator : public evaluator<lot_curate_evaluator>
   {
      public:
         typedef lot_curate_operation operation_type;

         void_result do_evaluate( const lot_curate_operation& o );
         void_result do_apply( const lot_curate_operation& o );

         const lot_object* _lot = nullptr;
   };

   class bid_evaluator : public evaluator<bid_evaluator>
   {
      public:
         typedef bid_operation operation_type;

         void_result      do_evaluate( const bid_operation& o );
         object_id_result do_apply( const bid_operation& o );
   };

   class bid_refund_evaluator : public evaluator<bid_refund_evaluator>
   {
      public:
         typedef bid_refund_operation operation_type;

         void_result do_evaluate( const bid_refund_operation& o );
         void_result do_apply( const bid_refund_operation& o );

         const lot_object* _lot = nullptr;
         const bid_object* _bid = nullptr;
   };

   class purchase_evaluator : public evaluator<purchase_evaluator>
   {
      public:
         typedef purchase_operation operation_type;

         void_result   do_evaluate( const purchase_operation& o );
         amount_result do_apply( const purchase_operation& o );
   };

} } // gavel::chain
