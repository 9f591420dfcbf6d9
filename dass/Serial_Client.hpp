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
#if ! defined dass_Serial_Client_hpp_
#define dass_Serial_Client_hpp_


#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <termios.h>
#include "Client_Logger.hpp"


namespace dass
{

/*--------------------------------------------------*
 * Byte transport over a serial port (8N1, raw, no flow
 * control). Reads and writes never throw, they return
 * false on failure and leave a message in the log.
 *--------------------------------------------------*/

class Serial_Client
{
  public:

    Serial_Client( std::shared_ptr< Client_Logger > const & log );

    virtual
    ~Serial_Client( );

    // Names of the serial ports of the machine, sorted

    static std::vector< std::string >
    list_available( );

    // Opens the port, throws connection_error on failure. The
    // timeout (in seconds) is the default for reads.

    virtual
    void
    connect( std::string const & endpoint,
             unsigned long       baud_rate = s_default_baud_rate,
             double              timeout = s_default_timeout );

    virtual
    void
    disconnect( );

    virtual
    bool
    is_connected( ) const
    {
        return m_connected;
    }

    std::string
    endpoint( ) const;

    double
    default_timeout( ) const
    {
        return m_timeout;
    }

    bool
    write( std::vector< unsigned char > const & data );

    // Reads up to 'count' bytes, returning what arrived before the
    // timeout (a negative timeout means the default one). Only
    // fails on I/O errors or if not connected.

    bool
    read( std::vector< unsigned char > & data,
          size_t                         count,
          double                         timeout = -1 );

    static unsigned long const s_default_baud_rate = 9600;

    static constexpr double s_default_timeout = 1.0;


  protected:

    // Variants to be used with m_io_mutex already held

    bool
    write_locked( std::vector< unsigned char > const & data );

    bool
    read_locked( std::vector< unsigned char > & data,
                 size_t                         count,
                 double                         timeout );

    void
    flush_input_locked( );

    std::shared_ptr< Client_Logger > m_log;

    // Serializes complete transactions on the port

    std::mutex m_io_mutex;


  private:

    Serial_Client( Serial_Client const & ) = delete;

    Serial_Client &
    operator = ( Serial_Client const & ) = delete;

    static bool
    to_speed( unsigned long   baud_rate,
              speed_t       & speed );

    void
    close_port( );

    int m_fd = -1;

    std::atomic< bool > m_connected;

    std::string m_endpoint;

    mutable std::mutex m_name_mutex;

    double m_timeout = s_default_timeout;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
