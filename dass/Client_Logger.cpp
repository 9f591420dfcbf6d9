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


#include "Client_Logger.hpp"
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <sys/time.h>

using namespace dass;


size_t const Client_Logger::s_max_events;


/*--------------------------------------------------*
 *--------------------------------------------------*/

static
std::string
vformat( char const * fmt,
         va_list      ap )
{
    va_list ap2;
    va_copy( ap2, ap );
    int cnt = vsnprintf( nullptr, 0, fmt, ap2 );
    va_end( ap2 );

    if ( cnt <= 0 )
        return "";

    std::vector< char > buf( cnt + 1 );
    vsnprintf( buf.data( ), buf.size( ), fmt, ap );
    return std::string( buf.data( ), cnt );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

Client_Logger::Client_Logger( std::string const & device_name,
                              Log_Level           level )
    : m_device_name( device_name )
    , m_level( level )
{ }


/*--------------------------------------------------*
 * On destruction close the log file
 *--------------------------------------------------*/

Client_Logger::~Client_Logger( )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_fp )
    {
        write_line( date_and_name( ) + "Stopping logging", false );
        close_file( );
    }
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

void
Client_Logger::set_log_level( Log_Level level )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    m_level = level;
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

Log_Level
Client_Logger::log_level( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_level;
}


/*--------------------------------------------------*
 * Writes a message about entry into a function.
 * Log level must be at least 'Normal'.
 *--------------------------------------------------*/

void
Client_Logger::log_function_start( char const * function_name )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_level < Log_Level::Normal || ! open_file( ) )
        return;

    write_line( date_and_name( ) + "Call of " + function_name + "()", false );
}


/*--------------------------------------------------*
 * Writes a message about exit from a function
 * Log level must be at least 'Normal'.
 *--------------------------------------------------*/

void
Client_Logger::log_function_end( char const * function_name )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_level < Log_Level::Normal || ! open_file( ) )
        return;

    write_line( date_and_name( ) + "Exit of " + function_name + "()", false );
}


/*------------------------------------------------*
 * Writes out binary data (e.g. a Modbus frame) as a line
 * of hex bytes, preceeded by a short description. Log
 * level must be 'High'.
 *------------------------------------------------*/

void
Client_Logger::log_data( char          const * what,
                         unsigned char const * buffer,
                         size_t                length )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_level < Log_Level::High || ! open_file( ) )
        return;

    std::string line = date_and_name( ) + what + ":";
    char hex[ 4 ];
    for ( size_t i = 0; i < length; ++i )
    {
        snprintf( hex, sizeof hex, " %02X", buffer[ i ] );
        line += hex;
    }

    write_line( line, false );
}


/*------------------------------------------------*
 * Writes out an error message, log level must be at least
 * 'Low'. Also stores the message (even if no logging happens)
 * so that it can be requested later on.
 *------------------------------------------------*/

void
Client_Logger::log_error( char const * fmt,
                          ... )
{
    if ( ! fmt || ! *fmt )
        return;

    va_list ap;
    va_start( ap, fmt );
    std::string mess = vformat( fmt, ap );
    va_end( ap );

    std::lock_guard< std::mutex > lock( m_mutex );

    m_last_error = mess;

    if ( m_level < Log_Level::Low )
        return;

    write_line( date_and_name( ) + "Error: " + mess, true );
}


/*------------------------------------------------*
 * Writes out a normal message, log level must be at least
 * 'Normal'. A line-feed is appended automatically.
 *------------------------------------------------*/

void
Client_Logger::log_message( char const * fmt,
                            ... )
{
    if ( ! fmt || ! *fmt )
        return;

    std::unique_lock< std::mutex > lock( m_mutex );

    if ( m_level < Log_Level::Normal )
        return;

    lock.unlock( );

    va_list ap;
    va_start( ap, fmt );
    std::string mess = vformat( fmt, ap );
    va_end( ap );

    lock.lock( );
    write_line( date_and_name( ) + mess, true );
}


/*--------------------------------------------------*
 * Requests to open a new file for logging, the old one
 * gets closed if it was opened by us.
 *--------------------------------------------------*/

bool
Client_Logger::set_log_filename( std::string const & file_name,
                                 std::string const & dir )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if (    m_level == Log_Level::None
         || file_name.empty( )
         || ( ! dir.empty( ) && file_name[ 0 ] == '/' ) )
    {
        errno = EINVAL;
        return false;
    }

    std::string path = dir.empty( ) ? file_name : dir + "/" + file_name;

    errno = 0;
    FILE * new_fp = fopen( path.c_str( ), "w" );

    if ( ! new_fp )
        return false;

    if ( m_fp )
    {
        write_line( date_and_name( ) + "Stopping logging", false );
        close_file( );
    }

    m_fp = new_fp;
    m_name = path;
    m_is_our_file = true;
    write_line( date_and_name( ) + "Starting logging", false );
    return true;
}


/*--------------------------------------------------*
 * Requests to switch logging to an (open) FILE pointer,
 * e.g. stderr for a command line program.
 *--------------------------------------------------*/

bool
Client_Logger::set_log_file( FILE * fp )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_level == Log_Level::None )
        return true;

    if ( ! fp )
        return false;

    if ( m_fp )
    {
        write_line( date_and_name( ) + "Stopping logging", false );
        close_file( );
    }

    m_fp = fp;
    m_name.clear( );
    m_is_our_file = false;
    write_line( date_and_name( ) + "Starting logging", false );
    return true;
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

std::string
Client_Logger::last_error( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_last_error;
}


/*--------------------------------------------------*
 * Returns a copy of the most recent events, oldest first
 *--------------------------------------------------*/

std::vector< std::string >
Client_Logger::recent_events( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return std::vector< std::string >( m_events.begin( ), m_events.end( ) );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

std::string
Client_Logger::file_name( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_name;
}


/*--------------------------------------------------*
 * Must be called with the mutex held. If no file has been set
 * yet one in the temporary directory, named after the device,
 * gets opened. Failure to open it is only tried once.
 *--------------------------------------------------*/

bool
Client_Logger::open_file( )
{
    if ( m_level == Log_Level::None || ( ! m_fp && m_is_our_file ) )
        return false;

    if ( m_fp )
        return true;

    if ( m_device_name.empty( ) )
    {
        m_is_our_file = true;
        return false;
    }

    char const * dir = getenv( "TMP" );
    if ( ! dir )
        dir = "/tmp";

    m_name = dir + ( "/" + m_device_name ) + ".log";
    m_is_our_file = true;

    if ( ( m_fp = fopen( m_name.c_str( ), "w" ) ) )
        write_line( date_and_name( ) + "Starting logging", false );

    return m_fp;
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

void
Client_Logger::close_file( )
{
    if ( m_fp && m_is_our_file )
        fclose( m_fp );
    else if ( m_fp )
        fflush( m_fp );
    m_fp = nullptr;
}


/*--------------------------------------------------*
 * Must be called with the mutex held
 *--------------------------------------------------*/

void
Client_Logger::write_line( std::string const & line,
                           bool                remember )
{
    if ( remember )
    {
        m_events.push_back( line );
        if ( m_events.size( ) > s_max_events )
            m_events.pop_front( );
    }

    if ( ! open_file( ) )
        return;

    fprintf( m_fp, "%s\n", line.c_str( ) );
    fflush( m_fp );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

std::string
Client_Logger::date_and_name( ) const
{
    struct timeval tv;
    gettimeofday( &tv, nullptr );

    struct tm tm;
    localtime_r( &tv.tv_sec, &tm );

    char tc[ 32 ];
    strftime( tc, sizeof tc, "%Y-%m-%d %H:%M:%S", &tm );

    char buf[ 48 ];
    snprintf( buf, sizeof buf, "[%s.%03d] ", tc,
              static_cast< int >( tv.tv_usec / 1000 ) );

    return buf + m_device_name + ": ";
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
