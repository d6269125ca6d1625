// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cassert>
#include <exception>

#include "ledger.hpp"
#include "log.hpp"
#include "unit_of_work.hpp"

namespace splitmint {

UnitOfWork::UnitOfWork( std::initializer_list< Transactional * > participants )
{
   participants_.reserve( participants.size() );
   try {
      for ( auto *const p : participants ) {
         assert( p );
         p->begin_unit();
         participants_.push_back( p );
      }
   }
   catch ( const std::exception &e ) {
      PrintToLog( "%s(): could not open a unit of work: %s\n", __func__, e.what() );
      rollback();   // the ones opened so far
      throw;
   }
}

UnitOfWork::~UnitOfWork()
{
   if ( !committed_ )
      rollback();
}

void UnitOfWork::commit()
{
   assert( !committed_ );
   for ( auto *const p : participants_ )
      p->commit_unit();
   committed_ = true;
}

void UnitOfWork::rollback() noexcept
{
   for ( auto it = participants_.rbegin(); it != participants_.rend(); ++it )
      ( *it )->rollback_unit();
   participants_.clear();
}

}   // namespace splitmint
