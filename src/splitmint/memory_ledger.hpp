// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_MEMORY_LEDGER_HPP_INCLUDED
#define SPLITMINT_MEMORY_LEDGER_HPP_INCLUDED

#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ledger.hpp"

namespace splitmint {

class MemoryPaymentLedger final : public PaymentLedger {
public:
   // Called after every credit made by transfer_from(), while the transfer is still part of the caller's unit of work.
   // Mirrors a token-receiver callback: it may call back into anything, and whatever it throws propagates out of transfer_from().
   using ReceiveHook = std::function< void( const address_t &from, const address_t &to, amount_t amount ) >;

   MemoryPaymentLedger( address_t asset_address, address_t spender );

   const address_t &asset_address() const noexcept override { return asset_address_; }
   const address_t &spender() const noexcept { return spender_; }

   bool transfer_from( const address_t &owner, const address_t &recipient, amount_t amount ) override;
   amount_t balance_of( const address_t &holder ) const override;
   amount_t allowance( const address_t &owner, const address_t &spender ) const override;

   // setup operations, outside of any unit of work
   void credit( const address_t &holder, amount_t amount );
   void approve( const address_t &owner, const address_t &spender, amount_t amount );
   void set_receive_hook( ReceiveHook hook ) { receive_hook_ = std::move( hook ); }

   void begin_unit() override;
   void commit_unit() override;
   void rollback_unit() noexcept override;

private:
   using balances_t = std::unordered_map< address_t, amount_t >;
   using allowances_t = std::map< std::pair< address_t, address_t >, amount_t >;   // (owner, spender) -> remaining

   // Values as of the unit's beginning, of every entry the open unit changed. std::nullopt for entries it added.
   struct UnitJournal {
      std::unordered_map< address_t, std::optional< amount_t > > balances;
      std::map< std::pair< address_t, address_t >, std::optional< amount_t > > allowances;
   };

   address_t asset_address_;
   address_t spender_;
   balances_t balances_;
   allowances_t allowances_;
   std::optional< UnitJournal > unit_journal_;
   ReceiveHook receive_hook_;

   amount_t &balance_entry( const address_t &holder );
   amount_t &allowance_entry( const address_t &owner, const address_t &spender );
};

class MemoryTokenStore final : public TokenStore {
public:
   void create( token_id_t id, const address_t &owner, std::string uri ) override;
   void set_uri( token_id_t id, std::string uri ) override;
   void transfer( token_id_t id, const address_t &from, const address_t &to ) override;
   void burn( token_id_t id ) override;

   bool exists( token_id_t id ) const override { return tokens_.contains( id ); }
   std::optional< address_t > owner_of( token_id_t id ) const override;
   std::optional< std::string > uri_of( token_id_t id ) const override;
   std::vector< token_id_t > tokens_of( const address_t &owner ) const override;
   std::size_t size() const override { return tokens_.size(); }

   void begin_unit() override;
   void commit_unit() override;
   void rollback_unit() noexcept override;

private:
   struct Entry {
      address_t owner;
      std::string uri;
   };

   using tokens_t = std::map< token_id_t, Entry >;   // ordered, so that enumeration is by ascending ID

   tokens_t tokens_;

   // The open unit's undo information: the entries as of the unit's beginning (std::nullopt for ones it created), and the nodes of the
   // tokens it burnt, which a rollback reinserts without allocating.
   bool unit_open_ = false;
   std::map< token_id_t, std::optional< Entry > > unit_before_;
   std::vector< tokens_t::node_type > unit_burnt_;

   void remember( token_id_t id );
   Entry &live_entry( token_id_t id );
};

}   // namespace splitmint

#endif   // SPLITMINT_MEMORY_LEDGER_HPP_INCLUDED
