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

#define HONZON_SYMBOL "HONZON"

#define HONZON_NATIVE_SYMBOL "NATIVE"
#define HONZON_STABLE_SYMBOL "AUSD"
#define HONZON_NATIVE_PRECISION 12
#define HONZON_STABLE_PRECISION 12

#define HONZON_MIN_ACCOUNT_NAME_LENGTH 3
#define HONZON_MAX_ACCOUNT_NAME_LENGTH 63

#define HONZON_MIN_BLOCK_INTERVAL   1 /* seconds */
#define HONZON_MAX_BLOCK_INTERVAL  30 /* seconds */
#define HONZON_DEFAULT_BLOCK_INTERVAL  6 /* seconds */

#define HONZON_MIN_UNDO_HISTORY 10
#define HONZON_MAX_UNDO_HISTORY 10000

/** fixed point rates and ratios carry 18 decimals */
#define HONZON_FIXED_POINT_DECIMALS 18

/** auctions, counted in blocks */
#define HONZON_DEFAULT_AUCTION_TIME_TO_CLOSE       100
#define HONZON_DEFAULT_AUCTION_DURATION_SOFT_CAP   2000
/** 5% expressed as numerator / denominator */
#define HONZON_DEFAULT_MINIMUM_INCREMENT_NUMERATOR    1
#define HONZON_DEFAULT_MINIMUM_INCREMENT_DENOMINATOR  20
#define HONZON_DEFAULT_MAX_AUCTIONS_COUNT          5

/** 150% */
#define HONZON_DEFAULT_LIQUIDATION_RATIO_NUMERATOR    3
#define HONZON_DEFAULT_LIQUIDATION_RATIO_DENOMINATOR  2
/** 10% */
#define HONZON_DEFAULT_LIQUIDATION_PENALTY_NUMERATOR    1
#define HONZON_DEFAULT_LIQUIDATION_PENALTY_DENOMINATOR  10
#define HONZON_DEFAULT_MINIMUM_DEBIT_VALUE         2
#define HONZON_DEFAULT_MINIMUM_COLLATERAL_AMOUNT   0
#define HONZON_DEFAULT_DEPOSIT_PER_AUTHORIZATION   100

#define HONZON_MAX_AUTHORIZATIONS_PER_ACCOUNT      64

/** positions visited by the end of block keeper, 0 disables it */
#define HONZON_DEFAULT_KEEPER_MAX_ITERATIONS       1000

// counter for the generic auction module
#define HONZON_MAX_AUCTION_ID  uint32_t(-1)

///@{
/**
 * Reserved account IDs with special meaning, created by init_genesis in this order
 */
/// Governance origin: collateral params, treasury tuning, emergency shutdown and price feeds
#define HONZON_COMMITTEE_ACCOUNT (honzon::chain::account_id_type(0))
/// Custody of the collateral backing live positions
#define HONZON_LOANS_ACCOUNT (honzon::chain::account_id_type(1))
/// Custody of pooled collateral, bid revenue and surplus
#define HONZON_CDP_TREASURY_ACCOUNT (honzon::chain::account_id_type(2))
/// Receives surplus extracted by governance
#define HONZON_TREASURY_ACCOUNT (honzon::chain::account_id_type(3))
/// Custody of liquidated collateral bought by the issuance buffer
#define HONZON_ISSUANCE_BUFFER_ACCOUNT (honzon::chain::account_id_type(4))
///@}

#define HONZON_COMMITTEE_ACCOUNT_NAME    "committee-account"
#define HONZON_LOANS_ACCOUNT_NAME        "loans-account"
#define HONZON_CDP_TREASURY_ACCOUNT_NAME "cdp-treasury"
#define HONZON_TREASURY_ACCOUNT_NAME     "treasury"
#define HONZON_ISSUANCE_BUFFER_ACCOUNT_NAME "issuance-buffer"

/// the single collateral asset
#define HONZON_NATIVE_ASSET (honzon::chain::asset_id_type(0))
/// the stable currency issued against collateral
#define HONZON_STABLE_ASSET (honzon::chain::asset_id_type(1))
