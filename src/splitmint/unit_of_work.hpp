// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_UNIT_OF_WORK_HPP_INCLUDED
#define SPLITMINT_UNIT_OF_WORK_HPP_INCLUDED

#include <initializer_list>
#include <vector>

namespace splitmint {

class Transactional;

// Opens a unit of work on every participant, in order. Unless commit() is reached, destruction rolls all of them back, in reverse order.
class UnitOfWork {
public:
   explicit UnitOfWork( std::initializer_list< Transactional * > participants );
   ~UnitOfWork();

   void commit();

   [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
   std::vector< Transactional * > participants_;   // the ones whose unit has been begun
   bool committed_ = false;

   void rollback() noexcept;

   UnitOfWork( const UnitOfWork & ) = delete;
   UnitOfWork( UnitOfWork && ) = delete;
   void operator=( const UnitOfWork & ) = delete;
   void operator=( UnitOfWork && ) = delete;
};

}   // namespace splitmint

#endif   // SPLITMINT_UNIT_OF_WORK_HPP_INCLUDED
