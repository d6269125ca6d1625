// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <algorithm>
#include <chrono>
#include <exception>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/format.hpp>

#include "../utils/string.hpp"

#include "controller.hpp"
#include "distribution.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "unit_of_work.hpp"

namespace splitmint {

using utils::abbreviate_for_display;

// Holds the controller's mutex exclusively for the duration of one mutating operation, and marks the current thread as the one running it.
// While the running operation is calling out to the payment ledger, a call that finds the mutex taken is treated as made from within that
// operation, since the callee may be waiting on it.
class Controller::UnitScope {
public:
   explicit UnitScope( Controller &c )
      : controller_( c )
      , lock_( c.mutex_, std::defer_lock )
   {
      if ( c.unit_owner_.load() == std::this_thread::get_id() )
         throw MintError( mint_errc::reentrant, "another operation is still in progress on this thread" );
      if ( !lock_.try_lock() ) {
         if ( c.calling_out_.load() )
            throw MintError( mint_errc::reentrant, "another operation is calling out to the payment ledger" );
         lock_.lock();
      }
      c.unit_owner_.store( std::this_thread::get_id() );
      c.active_lock_ = &lock_;
   }

   ~UnitScope()
   {
      controller_.active_lock_ = nullptr;
      controller_.unit_owner_.store( std::thread::id() );
   }

   write_lock_proof proof() { return { controller_, lock_ }; }

private:
   Controller &controller_;
   std::unique_lock< std::shared_mutex > lock_;

   UnitScope( const UnitScope & ) = delete;
   void operator=( const UnitScope & ) = delete;
};

// Marks the running operation as calling out to the payment ledger, whose hooks run foreign code
class Controller::ExternalCallScope {
public:
   ExternalCallScope( Controller &c, write_lock_proof )
      : controller_( c )
   {
      controller_.calling_out_.store( true );
   }

   ~ExternalCallScope() { controller_.calling_out_.store( false ); }

private:
   Controller &controller_;

   ExternalCallScope( const ExternalCallScope & ) = delete;
   void operator=( const ExternalCallScope & ) = delete;
};

std::optional< token_id_t > Controller::StateBook::highest_minted() const
{
   if ( minted_.empty() )
      return std::nullopt;
   return *minted_.rbegin();
}

void Controller::StateBook::change( ids_t StateBook::*const ids, const token_id_t token_id, const bool present )
{
   auto &set = this->*ids;
   if ( set.contains( token_id ) == present )
      return;
   if ( !unit_snapshot_ ) {
      if ( present )
         set.insert( token_id );
      else
         set.erase( token_id );
      return;
   }

   // room for the undo entry first, so that a recorded change is never lost
   journal_.reserve( journal_.size() + 1 );
   if ( present ) {
      journal_.push_back( { ids, token_id, {} } );
      set.insert( token_id );
   }
   else
      journal_.push_back( { ids, token_id, set.extract( token_id ) } );
}

void Controller::StateBook::begin_unit()
{
   if ( unit_snapshot_ )
      throw std::logic_error( "Controller state: a unit of work is already open" );
   unit_snapshot_ = state_;
   journal_.clear();
}

void Controller::StateBook::commit_unit()
{
   if ( !unit_snapshot_ )
      throw std::logic_error( "Controller state: no unit of work to commit" );
   unit_snapshot_.reset();
   journal_.clear();
}

void Controller::StateBook::rollback_unit() noexcept
{
   if ( !unit_snapshot_ )
      return;
   // reinserting the extracted nodes allocates nothing
   for ( auto it = journal_.rbegin(); it != journal_.rend(); ++it ) {
      auto &set = this->*it->ids;
      if ( it->removed )
         set.insert( std::move( it->removed ) );
      else
         set.erase( it->token_id );
   }
   journal_.clear();
   state_ = std::move( *unit_snapshot_ );
   unit_snapshot_.reset();
}

Controller::Controller( address_t administrator,
                        const MintConfiguration &configuration,
                        PaymentLedger &payment_ledger,
                        TokenStore &token_store,
                        Clock clock )
   : token_store_( token_store )
   , clock_( std::move( clock ) )
   , book_( State{ std::move( administrator ), configuration, &payment_ledger, 0 } )
{
   const auto &s = book_.state();
   if ( is_null_address( s.administrator ) )
      throw MintError( mint_errc::invalid_configuration, "administrator address is required" );
   validate( s.configuration );
   if ( payment_ledger.asset_address() != s.configuration.payment_asset )
      throw MintError( mint_errc::invalid_configuration,
                       str( boost::format( "payment ledger is for asset %1%, not %2%" ) % payment_ledger.asset_address() %
                            s.configuration.payment_asset ) );
   if ( !clock_ )
      throw MintError( mint_errc::invalid_configuration, "a clock is required" );

   if ( splitmint_debug_config )
      PrintToLog( "%s(): administrator %s, configuration %s\n", __func__, abbreviate_for_display( s.administrator ), s.configuration );
}

timestamp_t Controller::system_clock_seconds()
{
   return std::chrono::duration_cast< std::chrono::seconds >( std::chrono::system_clock::now().time_since_epoch() ).count();
}

template < typename Body >
void Controller::execute( const char *const operation, const bool log_failures, Body &&body )
{
   events_t events;
   try {
      UnitScope scope( *this );
      UnitOfWork unit{ book_.state().payment_ledger, &token_store_, &book_ };
      body( scope.proof(), events );
      unit.commit();
   }
   catch ( const std::exception &e ) {
      if ( log_failures )
         PrintToLog( "%s() failed: %s\n", operation, e.what() );
      throw;
   }
   notify( events );
}

template < typename F >
auto Controller::with_read_access( F &&f ) const
{
   if ( unit_owner_.load() == std::this_thread::get_id() )
      // called back from within the running operation, which already holds mutex_ exclusively
      return f( read_lock_proof( *this, *active_lock_ ) );

   std::shared_lock lock( mutex_ );
   return f( read_lock_proof( *this, lock ) );
}

void Controller::require_administrator( const address_t &caller, read_lock_proof ) const
{
   if ( caller != book_.state().administrator )
      throw MintError( mint_errc::authorization, "caller " + abbreviate_for_display( caller ) + " is not the administrator" );
}

void Controller::check_mintable( const token_id_t token_id, const MintConfiguration &configuration, read_lock_proof ) const
{
   if ( token_id < first_token_id || token_id > configuration.max_supply )
      throw MintError( mint_errc::supply_exceeded,
                       str( boost::format( "token ID %1% is outside of [%2%, %3%]" ) % token_id % first_token_id % configuration.max_supply ) );
   if ( book_.is_minted( token_id ) || token_store_.exists( token_id ) )
      throw MintError( mint_errc::already_minted, str( boost::format( "token ID %1% has already been minted" ) % token_id ) );
}

void Controller::require_live( const token_id_t token_id, read_lock_proof ) const
{
   if ( !token_store_.exists( token_id ) )
      throw MintError( mint_errc::nonexistent_token, str( boost::format( "no token with ID %1%" ) % token_id ) );
}

void Controller::record_mint( const address_t &to, const token_id_t token_id, std::string uri, const bool locked, write_lock_proof )
{
   token_store_.create( token_id, to, std::move( uri ) );
   book_.add_minted( token_id );
   book_.set_locked( token_id, locked );
   ++book_.state().total_minted;
}

void Controller::mint_with_payment( const address_t &caller,
                                    const address_t &buyer,
                                    const token_id_t token_id,
                                    std::span< const address_t > recipients,
                                    std::span< const amount_t > amounts,
                                    std::string uri,
                                    const amount_t declared_total )
{
   execute( __func__, splitmint_debug_mint, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      const auto configuration = book_.state().configuration;
      check_mintable( token_id, configuration, wlp );
      if ( is_null_address( buyer ) )
         throw MintError( mint_errc::invalid_configuration, "buyer address is required" );
      if ( declared_total < configuration.min_mint_amount )
         throw MintError( mint_errc::below_minimum,
                          str( boost::format( "declared total %1% is below the minimum of %2%" ) % declared_total % configuration.min_mint_amount ) );

      const address_t residual_beneficiary = book_.state().administrator;
      try {
         ExternalCallScope calling_out( *this, wlp );
         distribute( *book_.state().payment_ledger, buyer, recipients, amounts, declared_total, residual_beneficiary );
      }
      catch ( const PaymentError &e ) {
         throw MintError( e );
      }

      record_mint( buyer, token_id, std::move( uri ), true, wlp );
      events.push_back( MintCompleted{ buyer, token_id, declared_total, clock_(), true } );

      if ( splitmint_debug_mint )
         PrintToLog( "mint_with_payment(): token %s minted for %s against %d, locked, commissions to %s\n",
                     token_id,
                     abbreviate_for_display( buyer ),
                     declared_total,
                     utils::join_for_display( recipients ) );
   } );
}

void Controller::free_mint( const char *const operation,
                            const address_t &caller,
                            const address_t &to,
                            const token_id_t token_id,
                            std::string uri,
                            const bool locked )
{
   execute( operation, splitmint_debug_mint, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      const auto configuration = book_.state().configuration;
      check_mintable( token_id, configuration, wlp );
      if ( is_null_address( to ) )
         throw MintError( mint_errc::invalid_configuration, "recipient address is required" );

      record_mint( to, token_id, std::move( uri ), locked, wlp );
      events.push_back( MintCompleted{ to, token_id, 0, clock_(), locked } );

      if ( splitmint_debug_mint )
         PrintToLog( "%s(): token %s minted for %s, %s\n", operation, token_id, abbreviate_for_display( to ), locked ? "locked" : "unlocked" );
   } );
}

void Controller::privileged_mint( const address_t &caller, const address_t &to, const token_id_t token_id, std::string uri )
{
   free_mint( __func__, caller, to, token_id, std::move( uri ), true );
}

void Controller::gift_mint( const address_t &caller, const address_t &to, const token_id_t token_id, std::string uri )
{
   free_mint( __func__, caller, to, token_id, std::move( uri ), false );
}

void Controller::set_lock( const address_t &caller, const token_id_t token_id, const bool blocked )
{
   execute( __func__, splitmint_debug_lock, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      if ( !token_store_.exists( token_id ) ) {
         // nothing to lock: each mint decides the lock state of the token it creates
         if ( splitmint_debug_lock )
            PrintToLog( "set_lock(): no live token %s, nothing changed\n", token_id );
         return;
      }
      book_.set_locked( token_id, blocked );
      events.push_back( LockChanged{ token_id, blocked } );

      if ( splitmint_debug_lock )
         PrintToLog( "set_lock(): token %s %s\n", token_id, blocked ? "locked" : "unlocked" );
   } );
}

void Controller::unlock_and_transfer( const address_t &caller, const token_id_t token_id, const address_t &to )
{
   execute( __func__, splitmint_debug_lock, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      if ( is_null_address( to ) )
         throw MintError( mint_errc::invalid_configuration, "recipient address is required" );
      require_live( token_id, wlp );
      if ( !book_.is_locked( token_id ) )
         throw MintError( mint_errc::already_unlocked, str( boost::format( "token %1% is not locked" ) % token_id ) );

      const auto from = token_store_.owner_of( token_id ).value();
      book_.set_locked( token_id, false );
      token_store_.transfer( token_id, from, to );
      events.push_back( Unlocked{ token_id, from, to } );

      if ( splitmint_debug_lock )
         PrintToLog( "unlock_and_transfer(): token %s unlocked and moved from %s to %s\n",
                     token_id,
                     abbreviate_for_display( from ),
                     abbreviate_for_display( to ) );
   } );
}

void Controller::transfer( const address_t &caller, const address_t &from, const address_t &to, const token_id_t token_id )
{
   execute( __func__, splitmint_debug_lock, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_live( token_id, wlp );
      if ( book_.is_locked( token_id ) )
         throw MintError( mint_errc::transfer_blocked, str( boost::format( "token %1% is locked" ) % token_id ) );
      if ( caller != from || token_store_.owner_of( token_id ) != from )
         throw MintError( mint_errc::not_token_owner,
                          str( boost::format( "token %1% is not owned by %2%" ) % token_id % abbreviate_for_display( caller ) ) );
      if ( is_null_address( to ) )
         throw MintError( mint_errc::invalid_configuration, "recipient address is required" );

      token_store_.transfer( token_id, from, to );
      events.push_back( Transferred{ token_id, from, to } );
   } );
}

void Controller::burn( const address_t &caller, const token_id_t token_id )
{
   execute( __func__, splitmint_debug_mint, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      require_live( token_id, wlp );
      const auto last_owner = token_store_.owner_of( token_id ).value();
      token_store_.burn( token_id );
      book_.set_locked( token_id, false );
      events.push_back( Burned{ token_id, last_owner } );

      if ( splitmint_debug_mint )
         PrintToLog( "burn(): token %s of %s burnt, its ID is retired\n", token_id, abbreviate_for_display( last_owner ) );
   } );
}

void Controller::set_max_supply( const address_t &caller, const token_id_t max_supply )
{
   execute( __func__, splitmint_debug_config, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      auto &s = book_.state();
      auto new_configuration = s.configuration;
      new_configuration.max_supply = max_supply;
      validate( new_configuration );
      if ( const auto highest = book_.highest_minted(); highest && *highest > max_supply )
         throw MintError( mint_errc::invalid_configuration,
                          str( boost::format( "max supply %1% is below the already minted token ID %2%" ) % max_supply % *highest ) );

      events.push_back( ConfigurationChanged{ s.configuration, new_configuration } );
      s.configuration = std::move( new_configuration );
   } );
}

void Controller::set_min_mint_amount( const address_t &caller, const amount_t min_mint_amount )
{
   execute( __func__, splitmint_debug_config, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      auto &s = book_.state();
      auto new_configuration = s.configuration;
      new_configuration.min_mint_amount = min_mint_amount;
      events.push_back( ConfigurationChanged{ s.configuration, new_configuration } );
      s.configuration = std::move( new_configuration );
   } );
}

void Controller::set_payment_ledger( const address_t &caller, PaymentLedger &payment_ledger )
{
   execute( __func__, splitmint_debug_config, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      auto &s = book_.state();
      auto new_configuration = s.configuration;
      new_configuration.payment_asset = payment_ledger.asset_address();
      validate( new_configuration );
      events.push_back( ConfigurationChanged{ s.configuration, new_configuration } );
      s.configuration = std::move( new_configuration );
      s.payment_ledger = &payment_ledger;
   } );
}

void Controller::set_token_uri( const address_t &caller, const token_id_t token_id, std::string uri )
{
   execute( __func__, splitmint_debug_mint, [ & ]( write_lock_proof wlp, events_t & ) {
      require_administrator( caller, wlp );
      require_live( token_id, wlp );
      token_store_.set_uri( token_id, std::move( uri ) );
   } );
}

void Controller::transfer_administration( const address_t &caller, const address_t &new_administrator )
{
   execute( __func__, splitmint_debug_config, [ & ]( write_lock_proof wlp, events_t &events ) {
      require_administrator( caller, wlp );
      if ( is_null_address( new_administrator ) )
         throw MintError( mint_errc::invalid_configuration, "administrator address is required" );
      auto &s = book_.state();
      events.push_back( AdministratorChanged{ s.administrator, new_administrator } );
      s.administrator = new_administrator;

      if ( splitmint_debug_config )
         PrintToLog( "transfer_administration(): administration handed over to %s\n", abbreviate_for_display( new_administrator ) );
   } );
}

MintConfiguration Controller::configuration() const
{
   return with_read_access( [ & ]( read_lock_proof ) { return book_.state().configuration; } );
}

address_t Controller::administrator() const
{
   return with_read_access( [ & ]( read_lock_proof ) { return book_.state().administrator; } );
}

bool Controller::is_locked( const token_id_t token_id ) const
{
   return with_read_access( [ & ]( read_lock_proof ) { return book_.is_locked( token_id ); } );
}

bool Controller::is_minted( const token_id_t token_id ) const
{
   return with_read_access( [ & ]( read_lock_proof ) { return book_.is_minted( token_id ); } );
}

std::uint64_t Controller::total_minted() const
{
   return with_read_access( [ & ]( read_lock_proof ) { return book_.state().total_minted; } );
}

std::optional< address_t > Controller::owner_of( const token_id_t token_id ) const
{
   return with_read_access( [ & ]( read_lock_proof ) { return token_store_.owner_of( token_id ); } );
}

std::optional< std::string > Controller::token_uri( const token_id_t token_id ) const
{
   return with_read_access( [ & ]( read_lock_proof ) { return token_store_.uri_of( token_id ); } );
}

std::vector< token_id_t > Controller::tokens_of( const address_t &owner ) const
{
   return with_read_access( [ & ]( read_lock_proof ) { return token_store_.tokens_of( owner ); } );
}

void Controller::add_events_observer( EventsObserver &o )
{
   std::lock_guard lock( observers_mutex_ );
   if ( std::ranges::find( events_observers_, &o ) == events_observers_.end() )
      events_observers_.push_back( &o );
}

void Controller::remove_events_observer( EventsObserver &o )
{
   std::lock_guard lock( observers_mutex_ );
   std::erase( events_observers_, &o );
}

void Controller::notify( const events_t &events ) const
{
   if ( events.empty() )
      return;

   std::vector< EventsObserver * > observers;
   {
      std::shared_lock lock( observers_mutex_ );
      observers = events_observers_;
   }
   // not holding observers_mutex_ while notifying, as observers are allowed to call back into mutating operations
   // Every observer gets every event. The first exception an observer throws is passed on once they all have.
   std::exception_ptr first_failure;
   for ( const auto &e : events ) {
      if ( splitmint_debug_events )
         PrintToLog( "%s(): %s\n", __func__, describe( e ) );
      for ( auto *const o : observers ) {
         try {
            o->notify( e );
         }
         catch ( ... ) {
            PrintToLog( "%s(): observer failed on %s: %s\n", __func__, describe( e ), boost::current_exception_diagnostic_information() );
            if ( !first_failure )
               first_failure = std::current_exception();
         }
      }
   }
   if ( first_failure )
      std::rethrow_exception( first_failure );
}

}   // namespace splitmint
