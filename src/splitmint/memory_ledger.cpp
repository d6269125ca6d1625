// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <limits>
#include <stdexcept>

#include "memory_ledger.hpp"

namespace splitmint {

namespace {

template < typename Journal, typename Entries >
void remember_entry( Journal &journal, const Entries &entries, const typename Entries::key_type &key )
{
   if ( journal.contains( key ) )
      return;
   const auto it = entries.find( key );
   journal.emplace( key, it == entries.end() ? std::nullopt : std::optional( it->second ) );
}

// puts every journaled entry back the way it was, allocating nothing as entries never go away during a unit
template < typename Entries, typename Journal >
void restore_entries( Entries &entries, Journal &journal ) noexcept
{
   for ( auto &[ key, before ] : journal ) {
      const auto it = entries.find( key );
      if ( it == entries.end() )
         continue;
      if ( before )
         it->second = std::move( *before );
      else
         entries.erase( it );
   }
   journal.clear();
}

}   // namespace

MemoryPaymentLedger::MemoryPaymentLedger( address_t asset_address, address_t spender )
   : asset_address_( std::move( asset_address ) )
   , spender_( std::move( spender ) )
{
   if ( is_null_address( asset_address_ ) )
      throw std::invalid_argument( "Payment ledger requires an asset address" );
   if ( is_null_address( spender_ ) )
      throw std::invalid_argument( "Payment ledger requires a spender address" );
}

bool MemoryPaymentLedger::transfer_from( const address_t &owner, const address_t &recipient, const amount_t amount )
{
   if ( is_null_address( owner ) || is_null_address( recipient ) )
      return false;

   if ( allowance( owner, spender_ ) < amount || balance_of( owner ) < amount )
      return false;
   if ( owner != recipient && balance_of( recipient ) > std::numeric_limits< amount_t >::max() - amount )
      return false;

   if ( amount ) {
      allowance_entry( owner, spender_ ) -= amount;
      balance_entry( owner ) -= amount;
      balance_entry( recipient ) += amount;
   }

   if ( receive_hook_ )
      receive_hook_( owner, recipient, amount );   // may throw, which is fine - the unit this transfer belongs to will roll back
   return true;
}

amount_t MemoryPaymentLedger::balance_of( const address_t &holder ) const
{
   const auto it = balances_.find( holder );
   return it == balances_.end() ? 0 : it->second;
}

amount_t MemoryPaymentLedger::allowance( const address_t &owner, const address_t &spender ) const
{
   const auto it = allowances_.find( { owner, spender } );
   return it == allowances_.end() ? 0 : it->second;
}

void MemoryPaymentLedger::credit( const address_t &holder, const amount_t amount )
{
   if ( is_null_address( holder ) )
      throw std::invalid_argument( "Cannot credit the null address" );
   auto &balance = balance_entry( holder );
   if ( balance > std::numeric_limits< amount_t >::max() - amount )
      throw std::overflow_error( "Balance overflow" );
   balance += amount;
}

void MemoryPaymentLedger::approve( const address_t &owner, const address_t &spender, const amount_t amount )
{
   if ( is_null_address( owner ) || is_null_address( spender ) )
      throw std::invalid_argument( "Allowance parties cannot be the null address" );
   allowance_entry( owner, spender ) = amount;
}

amount_t &MemoryPaymentLedger::balance_entry( const address_t &holder )
{
   if ( unit_journal_ )
      remember_entry( unit_journal_->balances, balances_, holder );
   return balances_[ holder ];
}

amount_t &MemoryPaymentLedger::allowance_entry( const address_t &owner, const address_t &spender )
{
   const auto key = std::make_pair( owner, spender );
   if ( unit_journal_ )
      remember_entry( unit_journal_->allowances, allowances_, key );
   return allowances_[ key ];
}

void MemoryPaymentLedger::begin_unit()
{
   if ( unit_journal_ )
      throw std::logic_error( "Payment ledger: a unit of work is already open" );
   unit_journal_.emplace();
}

void MemoryPaymentLedger::commit_unit()
{
   if ( !unit_journal_ )
      throw std::logic_error( "Payment ledger: no unit of work to commit" );
   unit_journal_.reset();
}

void MemoryPaymentLedger::rollback_unit() noexcept
{
   if ( unit_journal_ ) {
      restore_entries( balances_, unit_journal_->balances );
      restore_entries( allowances_, unit_journal_->allowances );
      unit_journal_.reset();
   }
}

void MemoryTokenStore::create( const token_id_t id, const address_t &owner, std::string uri )
{
   if ( is_null_address( owner ) )
      throw std::invalid_argument( "Token owner cannot be the null address" );
   if ( tokens_.contains( id ) )
      throw std::domain_error( "Token with given ID already exists" );
   remember( id );
   tokens_.emplace( id, Entry{ owner, std::move( uri ) } );
}

void MemoryTokenStore::set_uri( const token_id_t id, std::string uri )
{
   auto &entry = live_entry( id );
   remember( id );
   entry.uri = std::move( uri );
}

void MemoryTokenStore::transfer( const token_id_t id, const address_t &from, const address_t &to )
{
   auto &entry = live_entry( id );
   if ( entry.owner != from )
      throw std::domain_error( "Token is not owned by the transfer's source address" );
   if ( is_null_address( to ) )
      throw std::invalid_argument( "Cannot transfer a token to the null address" );
   remember( id );
   entry.owner = to;
}

void MemoryTokenStore::burn( const token_id_t id )
{
   if ( !tokens_.contains( id ) )
      throw std::invalid_argument( "No such token found to burn" );
   if ( !unit_open_ ) {
      tokens_.erase( id );
      return;
   }
   remember( id );
   unit_burnt_.reserve( unit_burnt_.size() + 1 );
   unit_burnt_.push_back( tokens_.extract( id ) );
}

std::optional< address_t > MemoryTokenStore::owner_of( const token_id_t id ) const
{
   const auto it = tokens_.find( id );
   if ( it == tokens_.end() )
      return {};
   return it->second.owner;
}

std::optional< std::string > MemoryTokenStore::uri_of( const token_id_t id ) const
{
   const auto it = tokens_.find( id );
   if ( it == tokens_.end() )
      return {};
   return it->second.uri;
}

std::vector< token_id_t > MemoryTokenStore::tokens_of( const address_t &owner ) const
{
   std::vector< token_id_t > ids;
   for ( const auto &[ id, entry ] : tokens_ )
      if ( entry.owner == owner )
         ids.push_back( id );
   return ids;
}

void MemoryTokenStore::begin_unit()
{
   if ( unit_open_ )
      throw std::logic_error( "Token store: a unit of work is already open" );
   unit_open_ = true;
}

void MemoryTokenStore::commit_unit()
{
   if ( !unit_open_ )
      throw std::logic_error( "Token store: no unit of work to commit" );
   unit_before_.clear();
   unit_burnt_.clear();
   unit_open_ = false;
}

void MemoryTokenStore::rollback_unit() noexcept
{
   if ( !unit_open_ )
      return;
   for ( auto &node : unit_burnt_ )
      tokens_.insert( std::move( node ) );
   unit_burnt_.clear();
   restore_entries( tokens_, unit_before_ );
   unit_open_ = false;
}

void MemoryTokenStore::remember( const token_id_t id )
{
   if ( unit_open_ )
      remember_entry( unit_before_, tokens_, id );
}

MemoryTokenStore::Entry &MemoryTokenStore::live_entry( const token_id_t id )
{
   const auto it = tokens_.find( id );
   if ( it == tokens_.end() )
      throw std::invalid_argument( "No such token found" );
   return it->second;
}

}   // namespace splitmint
