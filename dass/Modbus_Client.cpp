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


#include "Modbus_Client.hpp"
#include "Modbus_Frame.hpp"

using namespace dass;


int const Modbus_Client::s_default_slave_id;


/*--------------------------------------------------*
 *--------------------------------------------------*/

Modbus_Client::Modbus_Client( std::shared_ptr< Client_Logger > const & log )
    : Serial_Client( log )
{ }


/*--------------------------------------------------*
 * Reads 'count' holding registers (function code 3)
 *--------------------------------------------------*/

bool
Modbus_Client::read_registers( uint16_t                  address,
                               uint16_t                  count,
                               int                       slave_id,
                               std::vector< uint16_t > & words )
{
    if ( count == 0 || count > Modbus_Frame::MAX_REGISTERS )
    {
        m_log->log_error( "Invalid number of registers to read: %u",
                          static_cast< unsigned int >( count ) );
        return false;
    }

    std::vector< unsigned char > reply;
    if ( ! transact( slave_id, Modbus_Frame::READ_HOLDING_REGISTERS,
                     address, count, reply ) )
        return false;

    std::string error;
    if ( ! Modbus_Frame::parse_registers( reply, slave_id, count,
                                          words, error ) )
    {
        m_log->log_error( "Reading %u register(s) at %u from slave %d "
                          "failed: %s", static_cast< unsigned int >( count ),
                          static_cast< unsigned int >( address ), slave_id,
                          error.c_str( ) );
        return false;
    }

    return true;
}


/*--------------------------------------------------*
 * Reads 'count' coils (function code 1)
 *--------------------------------------------------*/

bool
Modbus_Client::read_coils( uint16_t              address,
                           uint16_t              count,
                           int                   slave_id,
                           std::vector< bool > & bits )
{
    if ( count == 0 || count > Modbus_Frame::MAX_COILS )
    {
        m_log->log_error( "Invalid number of coils to read: %u",
                          static_cast< unsigned int >( count ) );
        return false;
    }

    std::vector< unsigned char > reply;
    if ( ! transact( slave_id, Modbus_Frame::READ_COILS,
                     address, count, reply ) )
        return false;

    std::string error;
    if ( ! Modbus_Frame::parse_coils( reply, slave_id, count, bits, error ) )
    {
        m_log->log_error( "Reading %u coil(s) at %u from slave %d failed: %s",
                          static_cast< unsigned int >( count ),
                          static_cast< unsigned int >( address ), slave_id,
                          error.c_str( ) );
        return false;
    }

    return true;
}


/*--------------------------------------------------*
 * Sends a read request and collects the reply. The first
 * three bytes tell if it's an exception (two more bytes to
 * come) or how many data bytes follow. The whole exchange
 * happens with the port locked, so requests from different
 * threads can't get mixed up.
 *--------------------------------------------------*/

bool
Modbus_Client::transact( int                            slave_id,
                         unsigned char                  function,
                         uint16_t                       address,
                         uint16_t                       count,
                         std::vector< unsigned char > & reply )
{
    if ( slave_id < 1 || slave_id > 247 )
    {
        m_log->log_error( "Invalid Modbus slave ID %d", slave_id );
        return false;
    }

    std::lock_guard< std::mutex > lock( m_io_mutex );

    flush_input_locked( );

    if ( ! write_locked( Modbus_Frame::read_request( slave_id, function,
                                                     address, count ) ) )
        return false;

    double timeout = default_timeout( );

    if ( ! read_locked( reply, Modbus_Frame::HEAD_LENGTH, timeout ) )
        return false;

    if ( reply.size( ) < Modbus_Frame::HEAD_LENGTH )
    {
        m_log->log_error( "No reply from slave %d within %.3f s",
                          slave_id, timeout );
        return false;
    }

    size_t rest = Modbus_Frame::CRC_LENGTH;
    if ( ! ( reply[ 1 ] & Modbus_Frame::EXCEPTION_FLAG ) )
        rest += reply[ 2 ];

    if ( ! read_locked( reply, rest, timeout ) )
        return false;

    if ( reply.size( ) != Modbus_Frame::HEAD_LENGTH + rest )
    {
        m_log->log_error( "Incomplete reply from slave %d", slave_id );
        return false;
    }

    return true;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
