// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_EVENTS_HPP_INCLUDED
#define SPLITMINT_EVENTS_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <variant>

#include "configuration.hpp"
#include "identification.hpp"

namespace splitmint {

using timestamp_t = std::int64_t;   // seconds since the epoch

struct MintCompleted {
   address_t buyer;
   token_id_t token_id;
   amount_t amount;   // 0 for the mints that take no payment
   timestamp_t timestamp;
   bool locked;
};

struct LockChanged {
   token_id_t token_id;
   bool locked;
};

struct Unlocked {
   token_id_t token_id;
   address_t from;
   address_t to;
};

struct Transferred {
   token_id_t token_id;
   address_t from;
   address_t to;
};

struct Burned {
   token_id_t token_id;
   address_t last_owner;
};

struct ConfigurationChanged {
   MintConfiguration old_configuration;
   MintConfiguration new_configuration;
};

struct AdministratorChanged {
   address_t old_administrator;
   address_t new_administrator;
};

using Event = std::variant< MintCompleted, LockChanged, Unlocked, Transferred, Burned, ConfigurationChanged, AdministratorChanged >;

std::string describe( const Event &event );

class EventsObserver {
public:
   void notify( const Event &event ) { process_event( event ); }

protected:
   ~EventsObserver() = default;

private:
   // Only ever called for events of units of work that got committed, after the commit, and outside of the controller's lock - so an override
   // may call back into the controller, including its mutating operations.
   // An exception thrown from here does not keep the other observers from being notified. The controller rethrows the first such exception
   // to its caller once all of them have been.
   virtual void process_event( const Event &event ) = 0;
};

}   // namespace splitmint

#endif   // SPLITMINT_EVENTS_HPP_INCLUDED
