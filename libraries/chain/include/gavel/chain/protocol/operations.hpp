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
#include <gavel/chain/protocol/base.hpp>
#include <gavel/chain/protocol/account.hpp>
#include <gavel/chain/protocol/asset_ops.hpp>
#include <gavel/chain/protocol/transfer.hpp>
#include <gavel/chain/protocol/fee_ops.hpp>
#include <gavel/chain/protocol/lot_ops.hpp>
#include <gavel/chain/protocol/bid_ops.hpp>

namespace gavel { namespace chain {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            account_create_operation,          //0
            asset_create_operation,            //1
            asset_issue_operation,             //2
            transfer_operation,                //3
            fee_config_update_operation,       //4
            curator_fee_update_operation,      //5
            rewards_claim_operation,           //6
            lot_create_operation,              //7
            lot_cancel_operation,              //8
            lot_curate_operation,              //9
            bid_operation,                     //10
            bid_refund_operation,              //11
            purchase_operation,                //12
            lot_settle_operation,              //13
            proceeds_claim_operation,          //14
            bids_claim_operation               //15
         > operation;

   void operation_validate( const operation& op );

   /// the account on whose behalf @ref op runs
   account_id_type operation_actor( const operation& op );

} } // gavel::chain

FC_REFLECT_TYPENAME( gavel::chain::operation )
