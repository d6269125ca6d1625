// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_LEDGER_HPP_INCLUDED
#define SPLITMINT_LEDGER_HPP_INCLUDED

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "identification.hpp"

namespace splitmint {

// A participant of a unit of work. Changes made between begin_unit() and commit_unit() are either all kept or, upon rollback_unit(), all discarded.
// Units do not nest.
class Transactional {
public:
   virtual void begin_unit() = 0;
   virtual void commit_unit() = 0;
   virtual void rollback_unit() noexcept = 0;

protected:
   ~Transactional() = default;
};

// Fungible payment transfer capability. Each instance is opened for one spender (the party on whose behalf transfer_from() moves funds), which is the
// controller's own address when used for minting.
class PaymentLedger : public Transactional {
public:
   virtual ~PaymentLedger() = default;

   // identity of the payment asset
   [[nodiscard]] virtual const address_t &asset_address() const noexcept = 0;

   // Debits `owner` and credits `recipient` by `amount`, consuming the same amount of the allowance `owner` granted to the spender.
   // Returns false, with nothing changed, if either the balance or the allowance is insufficient. Exceptions thrown by a recipient notification
   // propagate to the caller unchanged.
   [[nodiscard]] virtual bool transfer_from( const address_t &owner, const address_t &recipient, amount_t amount ) = 0;

   [[nodiscard]] virtual amount_t balance_of( const address_t &holder ) const = 0;
   [[nodiscard]] virtual amount_t allowance( const address_t &owner, const address_t &spender ) const = 0;
};

// Non-fungible ownership and metadata store. Trusted for atomicity and ID uniqueness once an ID is created.
// Operations on an ID that is not live, or on an ID that already is for create(), throw std::invalid_argument or std::domain_error.
class TokenStore : public Transactional {
public:
   virtual ~TokenStore() = default;

   virtual void create( token_id_t id, const address_t &owner, std::string uri ) = 0;
   virtual void set_uri( token_id_t id, std::string uri ) = 0;
   virtual void transfer( token_id_t id, const address_t &from, const address_t &to ) = 0;
   virtual void burn( token_id_t id ) = 0;

   [[nodiscard]] virtual bool exists( token_id_t id ) const = 0;
   [[nodiscard]] virtual std::optional< address_t > owner_of( token_id_t id ) const = 0;
   [[nodiscard]] virtual std::optional< std::string > uri_of( token_id_t id ) const = 0;
   [[nodiscard]] virtual std::vector< token_id_t > tokens_of( const address_t &owner ) const = 0;
   [[nodiscard]] virtual std::size_t size() const = 0;
};

}   // namespace splitmint

#endif   // SPLITMINT_LEDGER_HPP_INCLUDED
