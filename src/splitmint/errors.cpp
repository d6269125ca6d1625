// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <boost/format.hpp>

#include "errors.hpp"

namespace splitmint {

std::string_view describe( const payment_failure_kind kind ) noexcept
{
   switch ( kind ) {
      case payment_failure_kind::transfer_failed:
         return "TransferFailed";
      case payment_failure_kind::amounts_exceed_total:
         return "AmountsExceedTotal";
      case payment_failure_kind::residual_transfer_failed:
         return "ResidualTransferFailed";
      case payment_failure_kind::length_mismatch:
         return "LengthMismatch";
      case payment_failure_kind::invalid_recipient:
         return "InvalidRecipient";
   }
   return "Unknown";
}

std::string describe( const PaymentFailure &failure )
{
   if ( failure.index )
      return str( boost::format( "%1%{index=%2%}" ) % describe( failure.kind ) % *failure.index );
   return std::string( describe( failure.kind ) );
}

PaymentError::PaymentError( PaymentFailure failure )
   : std::runtime_error( "Payment distribution failed: " + describe( failure ) )
   , failure_( failure )
{}

std::string_view describe( const mint_errc code ) noexcept
{
   switch ( code ) {
      case mint_errc::authorization:
         return "AuthorizationError";
      case mint_errc::supply_exceeded:
         return "SupplyExceeded";
      case mint_errc::already_minted:
         return "AlreadyMinted";
      case mint_errc::below_minimum:
         return "BelowMinimum";
      case mint_errc::payment_failed:
         return "PaymentFailed";
      case mint_errc::transfer_blocked:
         return "TransferBlocked";
      case mint_errc::already_unlocked:
         return "AlreadyUnlocked";
      case mint_errc::reentrant:
         return "Reentrant";
      case mint_errc::invalid_configuration:
         return "InvalidConfiguration";
      case mint_errc::nonexistent_token:
         return "NonexistentToken";
      case mint_errc::not_token_owner:
         return "NotTokenOwner";
   }
   return "Unknown";
}

MintError::MintError( const mint_errc code, const std::string &what )
   : std::runtime_error( str( boost::format( "%1%: %2%" ) % describe( code ) % what ) )
   , code_( code )
{}

MintError::MintError( const PaymentError &cause )
   : std::runtime_error( str( boost::format( "%1%: %2%" ) % describe( mint_errc::payment_failed ) % cause.what() ) )
   , code_( mint_errc::payment_failed )
   , payment_failure_( cause.failure() )
{}

}   // namespace splitmint
