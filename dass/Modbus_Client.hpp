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
#if ! defined dass_Modbus_Client_hpp_
#define dass_Modbus_Client_hpp_


#include "Serial_Client.hpp"
#include "Register_Source.hpp"


namespace dass
{

/*--------------------------------------------------*
 * Modbus RTU master on a serial port. Only the two read
 * functions (coils and holding registers) are supported.
 *--------------------------------------------------*/

class Modbus_Client : public Serial_Client, public Register_Source
{
  public:

    Modbus_Client( std::shared_ptr< Client_Logger > const & log );

    bool
    is_connected( ) const override
    {
        return Serial_Client::is_connected( );
    }

    bool
    read_registers( uint16_t                  address,
                    uint16_t                  count,
                    int                       slave_id,
                    std::vector< uint16_t > & words ) override;

    bool
    read_coils( uint16_t              address,
                uint16_t              count,
                int                   slave_id,
                std::vector< bool > & bits );

    static int const s_default_slave_id = 1;


  private:

    bool
    transact( int                            slave_id,
              unsigned char                  function,
              uint16_t                       address,
              uint16_t                       count,
              std::vector< unsigned char > & reply );
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
