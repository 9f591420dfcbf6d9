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
#if ! defined dass_DASS_hpp_
#define dass_DASS_hpp_


#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Session_Config.hpp"
#include "Client_Logger.hpp"
#include "Serial_Client.hpp"
#include "Modbus_Client.hpp"
#include "Channels.hpp"
#include "Scan_Plan.hpp"
#include "Acquisition.hpp"
#include "except.hpp"


namespace dass
{

enum class Connection_Type
{
    Serial,        // raw byte stream, acquisition uses the stand-in source
    Modbus         // Modbus RTU, acquisition reads via the scan plan
};


/*----------------------------------------------------*
 * A complete acquisition session: the connection, the
 * channels and the acquisition thread
 *----------------------------------------------------*/

class DASS
{
  public:

    DASS( Session_Config const & config = Session_Config( ) );

    ~DASS( );

    static std::vector< std::string >
    list_available_ports( );

    // Throws connection_error if the port can't be opened and
    // already_running during an acquisition

    void
    connect( std::string const & endpoint,
             unsigned long       baud_rate = Serial_Client::s_default_baud_rate,
             double              timeout   = Serial_Client::s_default_timeout,
             Connection_Type     type      = Connection_Type::Modbus );

    // Stops a running acquisition first

    void
    disconnect( );

    bool
    is_connected( ) const;

    std::string
    endpoint( ) const;

    Connection_Type
    connection_type( ) const;

    void
    set_scan_plan( std::vector< Source_Binding > const & bindings );

    void
    set_channel_conditioning( size_t              channel,
                              std::string const & zero,
                              std::string const & multiplier,
                              std::string const & gain );

    void
    set_channel_conditioning( size_t channel,
                              double zero,
                              double multiplier,
                              double gain );

    void
    set_channel_name( size_t              channel,
                      std::string const & name );

    void
    start( std::string const & stem = "" );

    void
    stop( );

    bool
    is_running( ) const
    {
        return acq.is_running( );
    }

    std::vector< double >
    buffer_snapshot( size_t channel ) const
    {
        return acq.buffer_snapshot( channel );
    }

    std::vector< double >
    latest_tick( ) const
    {
        return acq.latest_tick( );
    }

    // Only available with a Modbus connection, otherwise an
    // operational_error gets thrown. A failed read throws comm_failure.

    std::vector< bool >
    read_coils( uint16_t address,
                uint16_t count,
                int      slave_id = Modbus_Client::s_default_slave_id );

    std::vector< uint16_t >
    read_registers( uint16_t address,
                    uint16_t count,
                    int      slave_id = Modbus_Client::s_default_slave_id );

    // Raw access to the port, throw operational_error when not
    // connected and comm_failure on failure. read() may return less
    // than 'count' bytes if the timeout (negative for the default
    // one of the connection) expires.

    void
    write( std::vector< unsigned char > const & data );

    std::vector< unsigned char >
    read( size_t count,
          double timeout = -1 );

    Session_Config const &
    config( ) const
    {
        return m_config;
    }

    std::vector< std::string >
    recent_events( ) const
    {
        return m_log->recent_events( );
    }

    std::string
    last_error( ) const
    {
        return m_log->last_error( );
    }

    Client_Logger &
    log( )
    {
        return *m_log;
    }

  private:

    Session_Config m_config;

    std::shared_ptr< Client_Logger > m_log;

    std::shared_ptr< Channels > m_chans;
  public:
    Channels & chans;
  private:
    Acquisition m_acq;
  public:
    Acquisition & acq;


  private:

    DASS( DASS const & ) = delete;

    DASS &
    operator = ( DASS const & ) = delete;

    std::shared_ptr< Serial_Client >
    port( ) const;

    std::shared_ptr< Modbus_Client >
    modbus( ) const;

    std::shared_ptr< Serial_Client > m_port;

    std::shared_ptr< Modbus_Client > m_modbus;

    Connection_Type m_type = Connection_Type::Modbus;

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
