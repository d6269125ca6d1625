// Created by Gevorg Voskanyan for Firo Core
// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_UTILS_LOCK_PROOF_HPP_INCLUDED
#define SPLITMINT_UTILS_LOCK_PROOF_HPP_INCLUDED

#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <type_traits>

namespace utils {

template < auto >
struct member_ptr_traits : std::false_type {};

template < typename T, class C, T C::*Mmp >
struct member_ptr_traits< Mmp > : std::true_type {
   using class_type = C;
   using data_type = T;
};

template < auto MutexMemberPtr >
concept mutex_member_ptr = member_ptr_traits< MutexMemberPtr >::value && requires( typename member_ptr_traits< MutexMemberPtr >::data_type &m ) {
   m.lock();
   m.unlock();
};

enum class lock_access { read, write };

// A token that can only be obtained by showing a lock on the mutex that MutexMemberPtr designates within a given object, with at least the given access.
// Private member functions take it by value to document, and enforce, what their callers must hold.
template < auto MutexMemberPtr, lock_access Access >
   requires mutex_member_ptr< MutexMemberPtr >
class lock_proof {
   using class_type = typename member_ptr_traits< MutexMemberPtr >::class_type;
   using mutex_type = typename member_ptr_traits< MutexMemberPtr >::data_type;

public:
   // ATTENTION: all constructors are intentionally non-explicit.
   // The lock parameters are non-const references so that temporary lock objects cannot be passed.

   lock_proof( const class_type &c, std::unique_lock< mutex_type > &lock ) { verify( c, lock.owns_lock(), lock.mutex() ); }

   lock_proof( const class_type &c, std::shared_lock< mutex_type > &lock )
      requires( Access == lock_access::read )
   {
      verify( c, lock.owns_lock(), lock.mutex() );
   }

   // whoever can prove write access can read as well
   template < lock_access A >
      requires( Access == lock_access::read && A == lock_access::write )
   lock_proof( lock_proof< MutexMemberPtr, A > ) noexcept
   {}

private:
   static void verify( const class_type &c, const bool owns, const mutex_type *const m )
   {
      if ( !owns )
         throw std::logic_error( "lock_proof: supplied lock is not actually locked!" );
      if ( m != &( c.*MutexMemberPtr ) )
         throw std::logic_error( "lock_proof: supplied lock does not actually lock the expected mutex object!" );
   }
};

template < auto MutexMemberPtr >
using read_lock_proof = lock_proof< MutexMemberPtr, lock_access::read >;

template < auto MutexMemberPtr >
using write_lock_proof = lock_proof< MutexMemberPtr, lock_access::write >;

}   // namespace utils

#endif   // SPLITMINT_UTILS_LOCK_PROOF_HPP_INCLUDED
