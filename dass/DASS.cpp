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


#include "DASS.hpp"

using namespace dass;


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
std::shared_ptr< Client_Logger >
make_logger( Session_Config const & config )
{
    std::shared_ptr< Client_Logger > log(
                     new Client_Logger( config.device_name, config.log_level ) );

    if (    ! config.diagnostics_file.empty( )
         && ! log->set_log_filename( config.diagnostics_file ) )
        throw std::invalid_argument(   "Can't open diagnostics file '"
                                     + config.diagnostics_file + "'" );

    return log;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

DASS::DASS( Session_Config const & config )
    : m_config( config )
    , m_log( make_logger( m_config ) )
    , m_chans( new Channels( m_config.channel_count ) )
    , chans( *m_chans )
    , m_acq( m_config, m_chans, m_log )
    , acq( m_acq )
{
    m_log->log_message( "Session with %lu channels created",
                        static_cast< unsigned long >( chans.size( ) ) );
}


/*----------------------------------------------------*
 * The acquisition must have ended before the port is closed
 *----------------------------------------------------*/

DASS::~DASS( )
{
    m_acq.stop( );

    std::lock_guard< std::mutex > lock( m_mutex );
    if ( m_port )
        m_port->disconnect( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< std::string >
DASS::list_available_ports( )
{
    return Serial_Client::list_available( );
}


/*----------------------------------------------------*
 * An already open connection is closed first, also when
 * opening the new one fails
 *----------------------------------------------------*/

void
DASS::connect( std::string const & endpoint,
               unsigned long       baud_rate,
               double              timeout,
               Connection_Type     type )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( m_acq.is_running( ) )
        throw already_running( "connect" );

    if ( m_port )
    {
        m_acq.set_source( nullptr );
        m_port->disconnect( );
        m_port.reset( );
        m_modbus.reset( );
    }

    std::shared_ptr< Modbus_Client > mb;
    std::shared_ptr< Serial_Client > port;

    if ( type == Connection_Type::Modbus )
    {
        mb.reset( new Modbus_Client( m_log ) );
        port = mb;
    }
    else
        port.reset( new Serial_Client( m_log ) );

    port->connect( endpoint, baud_rate, timeout );

    m_port   = port;
    m_modbus = mb;
    m_type   = type;
    m_acq.set_source( mb );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::disconnect( )
{
    m_acq.stop( );

    std::lock_guard< std::mutex > lock( m_mutex );

    if ( ! m_port )
        return;

    m_acq.set_source( nullptr );
    m_port->disconnect( );
    m_port.reset( );
    m_modbus.reset( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

bool
DASS::is_connected( ) const
{
    auto p = port( );
    return p && p->is_connected( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
DASS::endpoint( ) const
{
    auto p = port( );
    return p ? p->endpoint( ) : std::string( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Connection_Type
DASS::connection_type( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_type;
}


/*----------------------------------------------------*
 * Replaces the complete scan plan. Nothing changes if one of
 * the bindings is invalid or an acquisition is running.
 *----------------------------------------------------*/

void
DASS::set_scan_plan( std::vector< Source_Binding > const & bindings )
{
    m_acq.set_scan_plan( Scan_Plan( bindings ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::set_channel_conditioning( size_t              channel,
                                std::string const & zero,
                                std::string const & multiplier,
                                std::string const & gain )
{
    chans[ channel ].set_conditioning( zero, multiplier, gain );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::set_channel_conditioning( size_t channel,
                                double zero,
                                double multiplier,
                                double gain )
{
    chans[ channel ].set_conditioning( zero, multiplier, gain );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::set_channel_name( size_t              channel,
                        std::string const & name )
{
    chans[ channel ].set_name( name );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::start( std::string const & stem )
{
    m_acq.start( stem );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::stop( )
{
    m_acq.stop( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< bool >
DASS::read_coils( uint16_t address,
                  uint16_t count,
                  int      slave_id )
{
    auto mb = modbus( );
    if ( ! mb )
        throw operational_error( "No Modbus connection" );

    std::vector< bool > bits;
    if ( ! mb->read_coils( address, count, slave_id, bits ) )
        throw comm_failure( m_log->last_error( ) );

    return bits;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< uint16_t >
DASS::read_registers( uint16_t address,
                      uint16_t count,
                      int      slave_id )
{
    auto mb = modbus( );
    if ( ! mb )
        throw operational_error( "No Modbus connection" );

    std::vector< uint16_t > words;
    if ( ! mb->read_registers( address, count, slave_id, words ) )
        throw comm_failure( m_log->last_error( ) );

    return words;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
DASS::write( std::vector< unsigned char > const & data )
{
    auto p = port( );
    if ( ! p || ! p->is_connected( ) )
        throw operational_error( "Not connected" );

    if ( ! p->write( data ) )
        throw comm_failure( m_log->last_error( ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< unsigned char >
DASS::read( size_t count,
            double timeout )
{
    auto p = port( );
    if ( ! p || ! p->is_connected( ) )
        throw operational_error( "Not connected" );

    std::vector< unsigned char > data;
    if ( ! p->read( data, count, timeout ) )
        throw comm_failure( m_log->last_error( ) );

    return data;
}


/*----------------------------------------------------*
 * Copies of the pointers keep the client alive while it's
 * used even if another thread disconnects meanwhile
 *----------------------------------------------------*/

std::shared_ptr< Serial_Client >
DASS::port( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_port;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::shared_ptr< Modbus_Client >
DASS::modbus( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_modbus;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
