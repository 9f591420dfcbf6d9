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
#if ! defined dass_Register_Source_hpp_
#define dass_Register_Source_hpp_


#include <cstdint>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * Anything registers can be read from. Reads never throw,
 * a failed read (timeout, protocol error, not connected)
 * is reported by returning false.
 *----------------------------------------------------*/

class Register_Source
{
  public:

    virtual
    ~Register_Source( ) = default;

    virtual
    bool
    is_connected( ) const = 0;

    virtual
    bool
    read_registers( uint16_t                  address,
                    uint16_t                  count,
                    int                       slave_id,
                    std::vector< uint16_t > & words ) = 0;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
