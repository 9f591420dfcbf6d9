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


#include <cstdio>
#include "Modbus_Frame.hpp"

using namespace dass;


unsigned char const Modbus_Frame::READ_COILS;
unsigned char const Modbus_Frame::READ_HOLDING_REGISTERS;
unsigned char const Modbus_Frame::EXCEPTION_FLAG;
size_t const Modbus_Frame::HEAD_LENGTH;
size_t const Modbus_Frame::CRC_LENGTH;
uint16_t const Modbus_Frame::MAX_REGISTERS;
uint16_t const Modbus_Frame::MAX_COILS;


/*----------------------------------------------------*
 * Standard Modbus RTU CRC (polynomial 0xA001, reflected,
 * start value 0xFFFF)
 *----------------------------------------------------*/

uint16_t
Modbus_Frame::crc16( unsigned char const * data,
                     size_t                length )
{
    uint16_t crc = 0xFFFF;

    for ( size_t i = 0; i < length; ++i )
    {
        crc ^= data[ i ];
        for ( int j = 0; j < 8; ++j )
            if ( crc & 0x0001 )
                crc = ( crc >> 1 ) ^ 0xA001;
            else
                crc >>= 1;
    }

    return crc;
}


/*----------------------------------------------------*
 * Both read functions use the same request layout: start
 * address and number of items, both most significant byte
 * first.
 *----------------------------------------------------*/

std::vector< unsigned char >
Modbus_Frame::read_request( int           slave_id,
                            unsigned char function,
                            uint16_t      address,
                            uint16_t      count )
{
    std::vector< unsigned char > frame =
                    { static_cast< unsigned char >( slave_id ),
                      function,
                      static_cast< unsigned char >( address >> 8 ),
                      static_cast< unsigned char >( address & 0xFF ),
                      static_cast< unsigned char >( count >> 8 ),
                      static_cast< unsigned char >( count & 0xFF ) };

    uint16_t crc = crc16( frame.data( ), frame.size( ) );
    frame.push_back( crc & 0xFF );
    frame.push_back( crc >> 8 );
    return frame;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

size_t
Modbus_Frame::data_length( unsigned char function,
                           uint16_t      count )
{
    if ( function == READ_COILS )
        return ( count + 7 ) / 8;
    return 2 * static_cast< size_t >( count );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

bool
Modbus_Frame::parse_registers( std::vector< unsigned char > const & reply,
                               int                                  slave_id,
                               uint16_t                             count,
                               std::vector< uint16_t >            & words,
                               std::string                        & error )
{
    if ( ! check_reply( reply, slave_id, READ_HOLDING_REGISTERS,
                        data_length( READ_HOLDING_REGISTERS, count ),
                        error ) )
        return false;

    words.clear( );
    for ( size_t i = 0; i < count; ++i )
        words.push_back(   ( reply[ HEAD_LENGTH + 2 * i ] << 8 )
                         | reply[ HEAD_LENGTH + 2 * i + 1 ] );
    return true;
}


/*----------------------------------------------------*
 * Coils are packed eight to a byte, the first one in the
 * least significant bit. The padding bits of the last
 * byte are dropped.
 *----------------------------------------------------*/

bool
Modbus_Frame::parse_coils( std::vector< unsigned char > const & reply,
                           int                                  slave_id,
                           uint16_t                             count,
                           std::vector< bool >                & bits,
                           std::string                        & error )
{
    if ( ! check_reply( reply, slave_id, READ_COILS,
                        data_length( READ_COILS, count ), error ) )
        return false;

    bits.clear( );
    for ( size_t i = 0; i < count; ++i )
        bits.push_back( reply[ HEAD_LENGTH + i / 8 ] & ( 1 << ( i % 8 ) ) );
    return true;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Modbus_Frame::exception_text( unsigned char code )
{
    switch ( code )
    {
        case 0x01 :
            return "illegal function";

        case 0x02 :
            return "illegal data address";

        case 0x03 :
            return "illegal data value";

        case 0x04 :
            return "slave device failure";

        case 0x05 :
            return "acknowledge";

        case 0x06 :
            return "slave device busy";

        case 0x08 :
            return "memory parity error";

        case 0x0A :
            return "gateway path unavailable";

        case 0x0B :
            return "gateway target device failed to respond";
    }

    char buf[ 32 ];
    snprintf( buf, sizeof buf, "unknown exception 0x%02X", code );
    return buf;
}


/*----------------------------------------------------*
 * Checks everything but the data: length, CRC, that the
 * reply is from the slave we asked, that it's not an
 * exception and that the byte count is what we expect.
 *----------------------------------------------------*/

bool
Modbus_Frame::check_reply( std::vector< unsigned char > const & reply,
                           int                                  slave_id,
                           unsigned char                        function,
                           size_t                               data_len,
                           std::string                        & error )
{
    if ( reply.size( ) < HEAD_LENGTH + CRC_LENGTH )
    {
        error = "reply too short";
        return false;
    }

    size_t len = reply.size( );
    uint16_t received_crc = reply[ len - 2 ] | ( reply[ len - 1 ] << 8 );
    if ( received_crc != crc16( reply.data( ), len - CRC_LENGTH ) )
    {
        error = "CRC mismatch";
        return false;
    }

    if ( reply[ 0 ] != slave_id )
    {
        error = "reply from wrong slave";
        return false;
    }

    if ( reply[ 1 ] == ( function | EXCEPTION_FLAG ) )
    {
        error = "slave reports " + exception_text( reply[ 2 ] );
        return false;
    }

    if ( reply[ 1 ] != function )
    {
        error = "function code mismatch";
        return false;
    }

    if (    reply[ 2 ] != data_len
         || len != HEAD_LENGTH + data_len + CRC_LENGTH )
    {
        error = "byte count mismatch";
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
