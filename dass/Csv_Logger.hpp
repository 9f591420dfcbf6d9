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


#pragma once
#if ! defined dass_Csv_Logger_hpp_
#define dass_Csv_Logger_hpp_


#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * Writes the conditioned values of a session to a CSV file,
 * one row per tick, each row flushed before append() returns.
 *----------------------------------------------------*/

class Csv_Logger
{
  public:

    Csv_Logger( std::string const & directory = s_default_directory,
                std::string const & prefix    = s_default_prefix );

    ~Csv_Logger( );

    // Opens the file and writes the header row. Without a stem the
    // file is named "<prefix>_<YYYYMMDD_HHMMSS>.csv". Throws
    // operational_error if the directory or file can't be created.

    void
    start( std::vector< std::string > const & channel_names,
           std::string                const & stem = "" );

    // Writes a row with the current time, does nothing if not started

    void
    append( std::vector< double > const & values );

    void
    stop( );

    bool
    is_open( ) const;

    std::string
    path( ) const;

    size_t
    rows_written( ) const;

    std::string const &
    directory( ) const
    {
        return m_directory;
    }

    // Turns a user supplied stem into a safe file name ending in ".csv",
    // returns an empty string if nothing usable is left

    static std::string
    file_name_from_stem( std::string const & stem );

    static std::string
    quote( std::string const & field );

    // Formats microseconds since 1970-01-01 00:00:00 (of the local
    // time zone) as "YYYY-mm-dd HH:MM:SS.mmm"

    static std::string
    format_row_time( long long local_usecs );

    static char const * s_default_directory;
    static char const * s_default_prefix;


  private:

    Csv_Logger( Csv_Logger const & ) = delete;

    Csv_Logger &
    operator = ( Csv_Logger const & ) = delete;

    void
    close_file( );

    void
    write_line( std::string const & line );

    static void
    make_directory( std::string const & dir );

    std::string
    row_time( ) const;

    static std::string
    time_stamp( char const * format );

    std::string m_directory;

    std::string m_prefix;

    FILE * m_fp = nullptr;

    std::string m_path;

    size_t m_rows = 0;

    // Row times are the local time at start() plus the time elapsed
    // since then on the monotonic clock, so they never go backwards,
    // not even when the system clock gets set or DST ends

    long long m_start_local_usecs = 0;

    std::chrono::steady_clock::time_point m_start_steady;

    mutable std::mutex m_mutex;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
