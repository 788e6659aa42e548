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
#include <honzon/chain/protocol/base.hpp>
#include <honzon/chain/protocol/auction.hpp>
#include <honzon/chain/protocol/cdp_engine.hpp>
#include <honzon/chain/protocol/cdp_treasury.hpp>
#include <honzon/chain/protocol/emergency_shutdown.hpp>
#include <honzon/chain/protocol/honzon.hpp>
#include <honzon/chain/protocol/issuance_buffer.hpp>
#include <honzon/chain/protocol/loans.hpp>
#include <honzon/chain/protocol/transfer.hpp>

namespace honzon { namespace chain {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            transfer_operation,                                      // 0
            price_feed_publish_operation,                            // 1
            adjust_loan_operation,                                   // 2
            transfer_loan_from_operation,                            // 3
            authorize_loan_operation,                                // 4
            unauthorize_loan_operation,                              // 5
            unauthorize_all_loans_operation,                         // 6
            liquidate_cdp_operation,                                 // 7
            settle_cdp_operation,                                    // 8
            set_collateral_params_operation,                         // 9
            emergency_shutdown_operation,                            // 10
            open_collateral_refund_operation,                        // 11
            refund_collaterals_operation,                            // 12
            auction_bid_operation,                                   // 13
            set_expected_collateral_auction_size_operation,          // 14
            set_debit_offset_buffer_operation,                       // 15
            extract_surplus_to_treasury_operation,                   // 16
            auction_collateral_operation,                            // 17
            cancel_collateral_auction_operation,                     // 18
            position_updated_operation,                              // 19 VIRTUAL
            confiscate_collateral_and_debit_operation,               // 20 VIRTUAL
            transfer_loan_operation,                                 // 21 VIRTUAL
            liquidate_unsafe_cdp_operation,                          // 22 VIRTUAL
            settle_cdp_in_debit_operation,                           // 23 VIRTUAL
            liquidation_ratio_updated_operation,                     // 24 VIRTUAL
            required_collateral_ratio_updated_operation,             // 25 VIRTUAL
            maximum_total_debit_value_updated_operation,             // 26 VIRTUAL
            interest_rate_per_sec_updated_operation,                 // 27 VIRTUAL
            liquidation_penalty_updated_operation,                   // 28 VIRTUAL
            new_collateral_auction_operation,                        // 29 VIRTUAL
            cancel_auction_operation,                                // 30 VIRTUAL
            collateral_auction_dealt_operation,                      // 31 VIRTUAL
            collateral_auction_aborted_operation,                    // 32 VIRTUAL
            auction_bid_placed_operation,                            // 33 VIRTUAL
            expected_collateral_auction_size_updated_operation,      // 34 VIRTUAL
            debit_offset_buffer_updated_operation,                   // 35 VIRTUAL
            shutdown_operation,                                      // 36 VIRTUAL
            open_refund_operation,                                   // 37 VIRTUAL
            refund_operation,                                        // 38 VIRTUAL
            loan_authorization_operation,                            // 39 VIRTUAL
            loan_unauthorization_operation,                          // 40 VIRTUAL
            loan_unauthorization_all_operation,                      // 41 VIRTUAL
            adjust_loan_by_debit_value_operation,                    // 42
            transfer_debit_operation,                                // 43
            fund_issuance_buffer_operation,                          // 44
            defund_issuance_buffer_operation,                        // 45
            set_issuance_discount_operation,                         // 46
            set_issuance_quota_operation,                            // 47
            debit_transferred_operation,                             // 48 VIRTUAL
            issuance_buffer_funded_operation,                        // 49 VIRTUAL
            issuance_buffer_defunded_operation,                      // 50 VIRTUAL
            issuance_discount_updated_operation,                     // 51 VIRTUAL
            issuance_quota_updated_operation,                        // 52 VIRTUAL
            collateral_bought_by_issuance_buffer_operation           // 53 VIRTUAL
         > operation;

   void operation_validate( const operation& op );
   account_id_type operation_signer( const operation& op );

} } // honzon::chain

FC_REFLECT_TYPENAME( honzon::chain::operation )
