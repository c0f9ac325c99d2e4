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

#define GAVEL_MIN_ACCOUNT_NAME_LENGTH 1
#define GAVEL_MAX_ACCOUNT_NAME_LENGTH 63

#define GAVEL_MIN_ASSET_SYMBOL_LENGTH 3
#define GAVEL_MAX_ASSET_SYMBOL_LENGTH 16

/** percentage fields are fixed point with a denominator of 100,000 */
#define GAVEL_100_PERCENT                       100000
#define GAVEL_1_PERCENT                         (GAVEL_100_PERCENT/100)

/** amounts are unsigned and may not exceed 96 bits */
#define GAVEL_AMOUNT_BITS                       96
#define GAVEL_MAX_AMOUNT                        ((gavel::chain::amount_type(1) << GAVEL_AMOUNT_BITS) - 1)

/** all prices and cross token math are carried at 18 decimals */
#define GAVEL_INTERNAL_PRECISION_DIGITS         18
#define GAVEL_MIN_ASSET_PRECISION_DIGITS        6
#define GAVEL_MAX_ASSET_PRECISION_DIGITS        18

#define GAVEL_DEFAULT_PUSH_PROCEEDS             true
#define GAVEL_DEFAULT_MAX_BIDS_PER_CLAIM        100

/** auction module keycodes shipped with the engine */
#define GAVEL_FIXED_PRICE_SALE_KEYCODE          "FPS"
#define GAVEL_FIXED_PRICE_BATCH_KEYCODE         "FPB"

///@{
/// Reserved account IDs with special meaning
/// Holds every token escrowed by the engine: lot funding, bids, pending proceeds and rewards
#define GAVEL_AUCTION_HOUSE_ACCOUNT (gavel::chain::account_id_type(0))
/// Governs fee configuration and receives protocol fees
#define GAVEL_PROTOCOL_ACCOUNT (gavel::chain::account_id_type(1))
/// Represents the absence of a referrer or curator
#define GAVEL_NULL_ACCOUNT (gavel::chain::account_id_type(2))
///@}
