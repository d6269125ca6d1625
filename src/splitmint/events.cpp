// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <boost/format.hpp>

#include "../utils/overloaded.hpp"
#include "../utils/string.hpp"

#include "events.hpp"

namespace splitmint {

std::string describe( const Event &event )
{
   using utils::abbreviate_for_display;
   return std::visit( utils::overloaded{
                         []( const MintCompleted &e ) {
                            return str( boost::format( "MintCompleted{buyer=%s, token=%s, amount=%s, timestamp=%s, locked=%s}" ) %
                                        abbreviate_for_display( e.buyer ) % e.token_id % e.amount % e.timestamp % e.locked );
                         },
                         []( const LockChanged &e ) { return str( boost::format( "LockChanged{token=%s, locked=%s}" ) % e.token_id % e.locked ); },
                         []( const Unlocked &e ) {
                            return str( boost::format( "Unlocked{token=%s, from=%s, to=%s}" ) % e.token_id % abbreviate_for_display( e.from ) %
                                        abbreviate_for_display( e.to ) );
                         },
                         []( const Transferred &e ) {
                            return str( boost::format( "Transferred{token=%s, from=%s, to=%s}" ) % e.token_id % abbreviate_for_display( e.from ) %
                                        abbreviate_for_display( e.to ) );
                         },
                         []( const Burned &e ) {
                            return str( boost::format( "Burned{token=%s, last_owner=%s}" ) % e.token_id % abbreviate_for_display( e.last_owner ) );
                         },
                         []( const ConfigurationChanged &e ) {
                            return str( boost::format( "ConfigurationChanged{%s -> %s}" ) % e.old_configuration % e.new_configuration );
                         },
                         []( const AdministratorChanged &e ) {
                            return str( boost::format( "AdministratorChanged{%s -> %s}" ) % abbreviate_for_display( e.old_administrator ) %
                                        abbreviate_for_display( e.new_administrator ) );
                         } },
                      event );
}

}   // namespace splitmint
