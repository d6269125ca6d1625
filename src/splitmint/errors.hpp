// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_ERRORS_HPP_INCLUDED
#define SPLITMINT_ERRORS_HPP_INCLUDED

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace splitmint {

enum class payment_failure_kind {
   transfer_failed,            // a commission transfer was refused; index is set
   amounts_exceed_total,
   residual_transfer_failed,
   length_mismatch,            // recipients and amounts differ in length
   invalid_recipient           // null recipient address; index is set, absent for the residual beneficiary
};

struct PaymentFailure {
   payment_failure_kind kind;
   std::optional< std::size_t > index;

   bool operator==( const PaymentFailure &rhs ) const noexcept = default;
};

std::string_view describe( payment_failure_kind kind ) noexcept;
std::string describe( const PaymentFailure &failure );

class PaymentError : public std::runtime_error {
public:
   explicit PaymentError( PaymentFailure failure );
   PaymentError( payment_failure_kind kind, std::optional< std::size_t > index = std::nullopt )
      : PaymentError( PaymentFailure{ kind, index } )
   {}

   [[nodiscard]] const PaymentFailure &failure() const noexcept { return failure_; }
   [[nodiscard]] payment_failure_kind kind() const noexcept { return failure_.kind; }
   [[nodiscard]] std::optional< std::size_t > index() const noexcept { return failure_.index; }

private:
   PaymentFailure failure_;
};

enum class mint_errc {
   authorization,
   supply_exceeded,
   already_minted,
   below_minimum,
   payment_failed,
   transfer_blocked,
   already_unlocked,
   reentrant,
   invalid_configuration,
   nonexistent_token,
   not_token_owner
};

std::string_view describe( mint_errc code ) noexcept;

class MintError : public std::runtime_error {
public:
   MintError( mint_errc code, const std::string &what );

   // payment_failed, keeping the distribution failure that caused it
   explicit MintError( const PaymentError &cause );

   [[nodiscard]] mint_errc code() const noexcept { return code_; }
   [[nodiscard]] const std::optional< PaymentFailure > &payment_failure() const noexcept { return payment_failure_; }

private:
   mint_errc code_;
   std::optional< PaymentFailure > payment_failure_;
};

// unreadable or malformed settings file
class ConfigurationError : public std::runtime_error {
public:
   using std::runtime_error::runtime_error;
};

}   // namespace splitmint

#endif   // SPLITMINT_ERRORS_HPP_INCLUDED
