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
#if ! defined dass_Modbus_Frame_hpp_
#define dass_Modbus_Frame_hpp_


#include <cstdint>
#include <string>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * Creation and checking of Modbus RTU frames for the two
 * read functions we need. A frame consists of the slave
 * address, the function code, the data and a CRC-16 (low
 * byte first).
 *----------------------------------------------------*/

class Modbus_Frame
{
  public:

    static unsigned char const READ_COILS             = 0x01;
    static unsigned char const READ_HOLDING_REGISTERS = 0x03;

    static unsigned char const EXCEPTION_FLAG = 0x80;

    // Length of slave address, function code and byte count
    // (resp. exception code) at the start of each reply

    static size_t const HEAD_LENGTH = 3;
    static size_t const CRC_LENGTH  = 2;

    static uint16_t const MAX_REGISTERS = 125;
    static uint16_t const MAX_COILS     = 2000;

    static uint16_t
    crc16( unsigned char const * data,
           size_t                length );

    static std::vector< unsigned char >
    read_request( int           slave_id,
                  unsigned char function,
                  uint16_t      address,
                  uint16_t      count );

    // Number of data bytes in a normal reply to a read request

    static size_t
    data_length( unsigned char function,
                 uint16_t      count );

    static bool
    parse_registers( std::vector< unsigned char > const & reply,
                     int                                  slave_id,
                     uint16_t                             count,
                     std::vector< uint16_t >            & words,
                     std::string                        & error );

    static bool
    parse_coils( std::vector< unsigned char > const & reply,
                 int                                  slave_id,
                 uint16_t                             count,
                 std::vector< bool >                & bits,
                 std::string                        & error );

    static std::string
    exception_text( unsigned char code );


  private:

    Modbus_Frame( ) = delete;

    static bool
    check_reply( std::vector< unsigned char > const & reply,
                 int                                  slave_id,
                 unsigned char                        function,
                 size_t                               data_len,
                 std::string                        & error );
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
