// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <limits>

#include "../utils/string.hpp"

#include "distribution.hpp"
#include "ledger.hpp"
#include "log.hpp"

namespace splitmint {

std::vector< Payout > make_payouts( std::span< const address_t > recipients, std::span< const amount_t > amounts )
{
   if ( recipients.size() != amounts.size() )
      throw PaymentError( payment_failure_kind::length_mismatch );
   std::vector< Payout > payouts;
   payouts.reserve( recipients.size() );
   for ( std::size_t i = 0; i < recipients.size(); ++i )
      payouts.push_back( { recipients[ i ], amounts[ i ] } );
   return payouts;
}

amount_t validate_payouts( std::span< const Payout > payouts, const amount_t declared_total, const address_t &residual_beneficiary )
{
   amount_t sum = 0;
   for ( std::size_t i = 0; i < payouts.size(); ++i ) {
      const auto &p = payouts[ i ];
      if ( is_null_address( p.recipient ) )
         throw PaymentError( payment_failure_kind::invalid_recipient, i );
      if ( p.amount > std::numeric_limits< amount_t >::max() - sum )
         throw PaymentError( payment_failure_kind::amounts_exceed_total );   // overflowing the sum certainly means exceeding the total too
      sum += p.amount;
   }
   if ( sum > declared_total )
      throw PaymentError( payment_failure_kind::amounts_exceed_total );
   if ( is_null_address( residual_beneficiary ) )
      throw PaymentError( payment_failure_kind::invalid_recipient );
   return declared_total - sum;
}

DistributionReceipt distribute( PaymentLedger &ledger,
                                const address_t &payer,
                                std::span< const Payout > payouts,
                                const amount_t declared_total,
                                const address_t &residual_beneficiary )
{
   const amount_t residual = validate_payouts( payouts, declared_total, residual_beneficiary );   // will throw if invalid, before any funds move

   for ( std::size_t i = 0; i < payouts.size(); ++i ) {
      const auto &p = payouts[ i ];
      if ( !ledger.transfer_from( payer, p.recipient, p.amount ) ) {
         if ( splitmint_debug_payment )
            PrintToLog( "%s(): commission transfer #%d of %d from %s to %s refused\n",
                        __func__,
                        i,
                        p.amount,
                        utils::abbreviate_for_display( payer ),
                        utils::abbreviate_for_display( p.recipient ) );
         throw PaymentError( payment_failure_kind::transfer_failed, i );
      }
   }

   if ( !ledger.transfer_from( payer, residual_beneficiary, residual ) ) {
      if ( splitmint_debug_payment )
         PrintToLog( "%s(): residual transfer of %d from %s refused\n", __func__, residual, utils::abbreviate_for_display( payer ) );
      throw PaymentError( payment_failure_kind::residual_transfer_failed );
   }

   if ( splitmint_debug_payment )
      PrintToLog( "%s(): %d from %s split into %d commission(s) and a residual of %d\n",
                  __func__,
                  declared_total,
                  utils::abbreviate_for_display( payer ),
                  payouts.size(),
                  residual );

   return { declared_total - residual, residual, payouts.size() + 1 };
}

DistributionReceipt distribute( PaymentLedger &ledger,
                                const address_t &payer,
                                std::span< const address_t > recipients,
                                std::span< const amount_t > amounts,
                                const amount_t declared_total,
                                const address_t &residual_beneficiary )
{
   const auto payouts = make_payouts( recipients, amounts );
   return distribute( ledger, payer, payouts, declared_total, residual_beneficiary );
}

}   // namespace splitmint
