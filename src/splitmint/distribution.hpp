// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_DISTRIBUTION_HPP_INCLUDED
#define SPLITMINT_DISTRIBUTION_HPP_INCLUDED

#include <span>
#include <vector>

#include "errors.hpp"
#include "identification.hpp"

namespace splitmint {

class PaymentLedger;

struct Payout {
   address_t recipient;
   amount_t amount;

   bool operator==( const Payout &rhs ) const = default;
};

std::vector< Payout > make_payouts( std::span< const address_t > recipients, std::span< const amount_t > amounts );

struct DistributionReceipt {
   amount_t commissions_total;
   amount_t residual;
   std::size_t transfers;   // including the residual one
};

// Checks everything that can be checked before any funds move, returning the residual. Throws PaymentError.
amount_t validate_payouts( std::span< const Payout > payouts, amount_t declared_total, const address_t &residual_beneficiary );

// Moves payouts[i].amount from `payer` to each payouts[i].recipient in order, then the rest of `declared_total` to `residual_beneficiary`.
// Throws PaymentError on the first refused transfer. Transfers that went through before that are NOT reversed here: the caller is expected to run
// this inside a unit of work spanning `ledger`, and to roll that back.
DistributionReceipt distribute( PaymentLedger &ledger,
                                const address_t &payer,
                                std::span< const Payout > payouts,
                                amount_t declared_total,
                                const address_t &residual_beneficiary );

// same, over parallel recipient and amount lists
DistributionReceipt distribute( PaymentLedger &ledger,
                                const address_t &payer,
                                std::span< const address_t > recipients,
                                std::span< const amount_t > amounts,
                                amount_t declared_total,
                                const address_t &residual_beneficiary );

}   // namespace splitmint

#endif   // SPLITMINT_DISTRIBUTION_HPP_INCLUDED
