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
#if ! defined dass_Client_Logger_hpp_
#define dass_Client_Logger_hpp_


#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <vector>


namespace dass
{

/*--------------------------------------------------*
 *--------------------------------------------------*/

enum class Log_Level
{
    None,              // no logging at all (and no file opened)
    Low,               // logs errors only
    Normal,            // logs function calls, events and errors
    High               // logs function calls, all data and errors
};


/*--------------------------------------------------*
 * Diagnostic log shared by the transport and the acquisition
 * thread. Messages go to a file (by default "$TMP/<name>.log")
 * and the most recent ones are also kept in memory so that a
 * front end can display them in an activity pane. All methods
 * may be called from any thread.
 *--------------------------------------------------*/

class Client_Logger
{
  public:

    Client_Logger( std::string const & device_name,
                   Log_Level           level = Log_Level::Normal );

    virtual
    ~Client_Logger( );

    void
    set_log_level( Log_Level level );

    Log_Level
    log_level( ) const;

    bool
    set_log_filename( std::string const & file_name,
                      std::string const & dir = "" );

    bool
    set_log_file( FILE * fp );

    void
    log_function_start( char const * function_name );

    void
    log_function_end( char const * function_name );

    void
    log_data( char                const * what,
              unsigned char const       * buffer,
              size_t                      length );

    void
    log_error( char const * format,
               ... ) __attribute__ ( ( format( printf, 2, 3 ) ) );

    void
    log_message( char const * format,
                 ... ) __attribute__ ( ( format( printf, 2, 3 ) ) );

    std::string
    last_error( ) const;

    std::vector< std::string >
    recent_events( ) const;

    std::string
    file_name( ) const;

    static size_t const s_max_events = 200;


  private:

    Client_Logger( Client_Logger const & ) = delete;

    Client_Logger &
    operator = ( Client_Logger const & ) = delete;

    bool
    open_file( );

    void
    close_file( );

    void
    write_line( std::string const & line,
                bool                remember );

    std::string
    date_and_name( ) const;

    std::string m_device_name;

    Log_Level m_level;

    FILE * m_fp = nullptr;

    std::string m_name;

    bool m_is_our_file = false;     // set if logger opened the file

    std::string m_last_error;

    std::deque< std::string > m_events;

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
