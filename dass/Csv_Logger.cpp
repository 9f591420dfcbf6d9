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


#include <cerrno>
#include <cstring>
#include <ctime>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include "Csv_Logger.hpp"
#include "except.hpp"

using namespace dass;


char const * Csv_Logger::s_default_directory = "logs";
char const * Csv_Logger::s_default_prefix    = "dass_log";


/*----------------------------------------------------*
 *----------------------------------------------------*/

Csv_Logger::Csv_Logger( std::string const & directory,
                        std::string const & prefix )
    : m_directory( directory.empty( ) ? "." : directory )
    , m_prefix( prefix.empty( ) ? s_default_prefix : prefix )
{ }


/*----------------------------------------------------*
 *----------------------------------------------------*/

Csv_Logger::~Csv_Logger( )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    close_file( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Csv_Logger::start( std::vector< std::string > const & channel_names,
                   std::string                const & stem )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    close_file( );

    std::string name = file_name_from_stem( stem );
    if ( name.empty( ) )
        name = m_prefix + "_" + time_stamp( "%Y%m%d_%H%M%S" ) + ".csv";

    make_directory( m_directory );

    std::string path = m_directory + "/" + name;
    if ( ! ( m_fp = fopen( path.c_str( ), "w" ) ) )
        throw operational_error(   "Can't open log file '" + path + "': "
                                 + strerror( errno ) );

    m_path = path;
    m_rows = 0;

    struct timeval tv;
    gettimeofday( &tv, nullptr );
    m_start_steady = std::chrono::steady_clock::now( );

    struct tm tm;
    localtime_r( &tv.tv_sec, &tm );
    m_start_local_usecs =   ( static_cast< long long >( tv.tv_sec )
                              + tm.tm_gmtoff ) * 1000000LL
                          + tv.tv_usec;

    std::string header = "Timestamp";
    for ( auto const & n : channel_names )
        header += "," + quote( n );

    write_line( header );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Csv_Logger::append( std::vector< double > const & values )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( ! m_fp )
        return;

    std::string line = row_time( );
    char buf[ 32 ];
    for ( double v : values )
    {
        snprintf( buf, sizeof buf, ",%.10g", v );
        line += buf;
    }

    write_line( line );
    ++m_rows;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Csv_Logger::stop( )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    close_file( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

bool
Csv_Logger::is_open( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_fp;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Csv_Logger::path( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_path;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

size_t
Csv_Logger::rows_written( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_rows;
}


/*----------------------------------------------------*
 * A trailing ".csv" is removed first (and added back at the
 * end), so "run1" and "run1.csv" both give "run1.csv"
 *----------------------------------------------------*/

std::string
Csv_Logger::file_name_from_stem( std::string const & stem )
{
    std::string s = stem;

    if ( s.size( ) >= 4 && s.compare( s.size( ) - 4, 4, ".csv" ) == 0 )
        s.erase( s.size( ) - 4 );

    for ( auto & c : s )
        if ( ! (    ( c >= 'A' && c <= 'Z' )
                 || ( c >= 'a' && c <= 'z' )
                 || ( c >= '0' && c <= '9' )
                 || c == '.' || c == '_' || c == '-' ) )
            c = '_';

    if ( s.empty( ) || s == "." || s == ".." )
        return "";

    return s + ".csv";
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Csv_Logger::quote( std::string const & field )
{
    if ( field.find_first_of( ",\"\r\n" ) == std::string::npos )
        return field;

    std::string res = "\"";
    for ( char c : field )
    {
        if ( c == '"' )
            res += '"';
        res += c;
    }

    return res + '"';
}


/*----------------------------------------------------*
 * Must be called with the mutex held
 *----------------------------------------------------*/

void
Csv_Logger::close_file( )
{
    if ( ! m_fp )
        return;

    fclose( m_fp );
    m_fp = nullptr;
}


/*----------------------------------------------------*
 * Must be called with the mutex held
 *----------------------------------------------------*/

void
Csv_Logger::write_line( std::string const & line )
{
    if (    fprintf( m_fp, "%s\n", line.c_str( ) ) < 0
         || fflush( m_fp ) != 0 )
        throw operational_error(   "Failed to write to log file '" + m_path
                                 + "': " + strerror( errno ) );
}


/*----------------------------------------------------*
 * Creates the directory including all missing parents
 *----------------------------------------------------*/

void
Csv_Logger::make_directory( std::string const & dir )
{
    size_t pos = 0;

    while ( pos != std::string::npos )
    {
        pos = dir.find( '/', pos + 1 );
        std::string part = dir.substr( 0, pos );

        if ( part.empty( ) )
            continue;

        if ( mkdir( part.c_str( ), 0777 ) == -1 && errno != EEXIST )
            throw operational_error(   "Can't create log directory '"
                                     + part + "': " + strerror( errno ) );
    }

    struct stat st;
    if ( stat( dir.c_str( ), &st ) == -1 || ! S_ISDIR( st.st_mode ) )
        throw operational_error( "'" + dir + "' isn't a directory" );
}


/*----------------------------------------------------*
 * Must be called with the mutex held
 *----------------------------------------------------*/

std::string
Csv_Logger::row_time( ) const
{
    auto elapsed = std::chrono::duration_cast< std::chrono::microseconds >(
                     std::chrono::steady_clock::now( ) - m_start_steady );
    return format_row_time( m_start_local_usecs + elapsed.count( ) );
}


/*----------------------------------------------------*
 * Times before 1970 don't occur
 *----------------------------------------------------*/

std::string
Csv_Logger::format_row_time( long long local_usecs )
{
    time_t t = static_cast< time_t >( local_usecs / 1000000 );
    int msecs = static_cast< int >( ( local_usecs % 1000000 ) / 1000 );

    struct tm tm;
    gmtime_r( &t, &tm );

    char buf[ 40 ];
    size_t len = strftime( buf, sizeof buf, "%Y-%m-%d %H:%M:%S", &tm );
    snprintf( buf + len, sizeof buf - len, ".%03d", msecs );

    return buf;
}


/*----------------------------------------------------*
 * Current local time, used for file names
 *----------------------------------------------------*/

std::string
Csv_Logger::time_stamp( char const * format )
{
    time_t t = time( nullptr );
    struct tm tm;
    localtime_r( &t, &tm );

    char buf[ 40 ];
    strftime( buf, sizeof buf, format, &tm );
    return buf;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
