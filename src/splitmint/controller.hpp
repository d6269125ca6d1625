// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_CONTROLLER_HPP_INCLUDED
#define SPLITMINT_CONTROLLER_HPP_INCLUDED

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../utils/lock_proof.hpp"

#include "configuration.hpp"
#include "events.hpp"
#include "identification.hpp"
#include "ledger.hpp"

namespace splitmint {

// The mint protocol and the per-token transfer lock.
// Every mutating operation takes the calling address first, runs as one unit of work over the payment ledger, the token store and the controller's
// own state, and either fully commits or throws with nothing changed. All of them except transfer() are reserved to the administrator.
// Calling a mutating operation from within another one (e.g. from a payment receive hook, or from a thread that hook started and waits for)
// fails with mint_errc::reentrant. Otherwise calls from other threads wait for the running one to finish.
class Controller {
public:
   using Clock = std::function< timestamp_t() >;

   // `payment_ledger` must be opened for this controller as its spender, and must be for configuration.payment_asset.
   // Both ledgers must outlive the controller, or at least its last use of them.
   Controller( address_t administrator,
               const MintConfiguration &configuration,
               PaymentLedger &payment_ledger,
               TokenStore &token_store,
               Clock clock = system_clock_seconds );

   // The buyer pays declared_total: amounts[i] to recipients[i], and the rest to the administrator. The token is then created for the buyer, locked.
   void mint_with_payment( const address_t &caller,
                           const address_t &buyer,
                           token_id_t token_id,
                           std::span< const address_t > recipients,
                           std::span< const amount_t > amounts,
                           std::string uri,
                           amount_t declared_total );

   // no payment, token created locked
   void privileged_mint( const address_t &caller, const address_t &to, token_id_t token_id, std::string uri );
   // no payment, token created unlocked
   void gift_mint( const address_t &caller, const address_t &to, token_id_t token_id, std::string uri );

   void set_lock( const address_t &caller, token_id_t token_id, bool blocked );
   void unlock_and_transfer( const address_t &caller, token_id_t token_id, const address_t &to );

   // the only mutating operation open to non-administrators: the owner moving an unlocked token
   void transfer( const address_t &caller, const address_t &from, const address_t &to, token_id_t token_id );

   // The ID stays minted, so it can never be minted again
   void burn( const address_t &caller, token_id_t token_id );

   void set_max_supply( const address_t &caller, token_id_t max_supply );
   void set_min_mint_amount( const address_t &caller, amount_t min_mint_amount );
   void set_payment_ledger( const address_t &caller, PaymentLedger &payment_ledger );
   void set_token_uri( const address_t &caller, token_id_t token_id, std::string uri );
   void transfer_administration( const address_t &caller, const address_t &new_administrator );

   MintConfiguration configuration() const;
   token_id_t max_supply() const { return configuration().max_supply; }
   amount_t min_mint_amount() const { return configuration().min_mint_amount; }
   address_t payment_asset() const { return configuration().payment_asset; }
   address_t administrator() const;

   bool is_locked( token_id_t token_id ) const;
   bool is_minted( token_id_t token_id ) const;
   std::uint64_t total_minted() const;

   std::optional< address_t > owner_of( token_id_t token_id ) const;
   std::optional< std::string > token_uri( token_id_t token_id ) const;
   std::vector< token_id_t > tokens_of( const address_t &owner ) const;

   void add_events_observer( EventsObserver &o );
   void remove_events_observer( EventsObserver &o );

   static timestamp_t system_clock_seconds();

private:
   struct State {
      address_t administrator;
      MintConfiguration configuration;
      PaymentLedger *payment_ledger;
      std::uint64_t total_minted = 0;
   };

   // The controller's own participant in units of work.
   // The scalar state is copied when a unit begins, while the token ID sets are journaled change by change, so a unit costs in proportion to
   // what it touches, not to how many tokens exist.
   class StateBook final : public Transactional {
   public:
      explicit StateBook( State state )
         : state_( std::move( state ) )
      {}

      State &state() noexcept { return state_; }
      const State &state() const noexcept { return state_; }

      bool is_minted( token_id_t token_id ) const { return minted_.contains( token_id ); }
      bool is_locked( token_id_t token_id ) const { return locked_.contains( token_id ); }
      std::optional< token_id_t > highest_minted() const;

      void add_minted( token_id_t token_id ) { change( &StateBook::minted_, token_id, true ); }
      void set_locked( token_id_t token_id, bool locked ) { change( &StateBook::locked_, token_id, locked ); }

      void begin_unit() override;
      void commit_unit() override;
      void rollback_unit() noexcept override;

   private:
      using ids_t = std::set< token_id_t >;

      struct Undo {
         ids_t StateBook::*ids;
         token_id_t token_id;
         ids_t::node_type removed;   // empty if the change was an insertion
      };

      State state_;
      ids_t minted_;   // every ID ever minted, never shrinks
      ids_t locked_;   // live tokens only
      std::optional< State > unit_snapshot_;
      std::vector< Undo > journal_;   // changes made by the open unit, if any

      void change( ids_t StateBook::*ids, token_id_t token_id, bool present );
   };

   class UnitScope;
   class ExternalCallScope;

   using events_t = std::vector< Event >;

   TokenStore &token_store_;
   const Clock clock_;

   mutable std::shared_mutex mutex_;
   StateBook book_;                                    // protected by mutex_
   std::atomic< std::thread::id > unit_owner_;         // the thread running a mutating operation, if any
   std::unique_lock< std::shared_mutex > *active_lock_ = nullptr;   // that operation's lock on mutex_, valid for unit_owner_ only
   std::atomic< bool > calling_out_ = false;                        // the running operation is inside a payment ledger call

   mutable std::shared_mutex observers_mutex_;
   std::vector< EventsObserver * > events_observers_;   // protected by observers_mutex_

   using read_lock_proof = utils::read_lock_proof< &Controller::mutex_ >;
   using write_lock_proof = utils::write_lock_proof< &Controller::mutex_ >;

   // Runs `body( write_lock_proof, events_t & )` as one unit of work, then delivers the collected events
   template < typename Body >
   void execute( const char *operation, bool log_failures, Body &&body );

   template < typename F >
   auto with_read_access( F &&f ) const;

   void require_administrator( const address_t &caller, read_lock_proof ) const;
   void check_mintable( token_id_t token_id, const MintConfiguration &configuration, read_lock_proof ) const;
   void require_live( token_id_t token_id, read_lock_proof ) const;
   void record_mint( const address_t &to, token_id_t token_id, std::string uri, bool locked, write_lock_proof );
   void free_mint( const char *operation,
                   const address_t &caller,
                   const address_t &to,
                   token_id_t token_id,
                   std::string uri,
                   bool locked );

   void notify( const events_t &events ) const;
};

}   // namespace splitmint

#endif   // SPLITMINT_CONTROLLER_HPP_INCLUDED
