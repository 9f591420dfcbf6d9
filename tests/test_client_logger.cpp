/*
 *  Copyright (C) 2026 The DASS developers
 *
 *  This file is part of DASS.
 *
 *  DASS is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 *  DASS is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include <gtest/gtest.h>
#include "Client_Logger.hpp"
#include "Temp_Dir.hpp"

using namespace dass;


TEST( Client_Logger, errors_are_logged_and_remembered )
{
    Temp_Dir dir;
    Client_Logger log( "dev", Log_Level::Low );

    ASSERT_TRUE( log.set_log_filename( "dev.log", dir.path( ) ) );
    EXPECT_EQ( dir / "dev.log", log.file_name( ) );

    log.log_message( "not shown %d", 1 );
    log.log_error( "read failed: %s", "timeout" );

    EXPECT_EQ( "read failed: timeout", log.last_error( ) );

    auto events = log.recent_events( );
    ASSERT_EQ( 1u, events.size( ) );
    EXPECT_NE( std::string::npos,
               events[ 0 ].find( "dev: Error: read failed: timeout" ) );

    bool found = false;
    for ( auto const & l : read_lines( dir / "dev.log" ) )
    {
        EXPECT_EQ( std::string::npos, l.find( "not shown" ) );
        if ( l.find( "Error: read failed: timeout" ) != std::string::npos )
            found = true;
    }
    EXPECT_TRUE( found );
}


TEST( Client_Logger, data_is_dumped_at_high_level )
{
    Temp_Dir dir;
    Client_Logger log( "dev", Log_Level::High );
    ASSERT_TRUE( log.set_log_filename( dir / "dev.log" ) );

    unsigned char const frame[ ] = { 0x01, 0x03, 0xC5, 0xCD };
    log.log_data( "Sending", frame, sizeof frame );
    log.log_function_start( "connect" );

    auto lines = read_lines( dir / "dev.log" );
    bool data = false, call = false;
    for ( auto const & l : lines )
    {
        data |= l.find( "Sending: 01 03 C5 CD" ) != std::string::npos;
        call |= l.find( "Call of connect()" ) != std::string::npos;
    }
    EXPECT_TRUE( data );
    EXPECT_TRUE( call );
}


TEST( Client_Logger, only_the_newest_events_are_kept )
{
    Client_Logger log( "", Log_Level::Normal );

    for ( size_t i = 0; i < Client_Logger::s_max_events + 20; ++i )
        log.log_message( "event %lu", static_cast< unsigned long >( i ) );

    auto events = log.recent_events( );
    ASSERT_EQ( Client_Logger::s_max_events, events.size( ) );
    EXPECT_NE( std::string::npos, events.front( ).find( "event 20" ) );
    EXPECT_NE( std::string::npos,
               events.back( ).find( "event "
                                    + std::to_string(
                                          Client_Logger::s_max_events + 19 ) ) );
}


TEST( Client_Logger, no_file_without_logging )
{
    Temp_Dir dir;
    Client_Logger log( "dev", Log_Level::None );

    EXPECT_FALSE( log.set_log_filename( "dev.log", dir.path( ) ) );
    log.log_error( "still remembered" );

    EXPECT_EQ( "still remembered", log.last_error( ) );
    EXPECT_TRUE( log.recent_events( ).empty( ) );
    EXPECT_FALSE( file_exists( dir / "dev.log" ) );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
