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
#if ! defined dass_Table_Source_hpp_
#define dass_Table_Source_hpp_


#include <atomic>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>
#include "Register_Source.hpp"


/*----------------------------------------------------*
 * Register source answering from a table, anything not
 * in the table is a failed read. The table must not be
 * changed while an acquisition uses the source.
 *----------------------------------------------------*/

class Table_Source : public dass::Register_Source
{
  public:

    bool
    is_connected( ) const override
    {
        return connected;
    }

    bool
    read_registers( uint16_t                  address,
                    uint16_t                  count,
                    int                       slave_id,
                    std::vector< uint16_t > & words ) override
    {
        ++reads;

        if ( broken )
            throw std::runtime_error( "source broke down" );

        auto it = table.find( std::make_pair( slave_id, address ) );
        if ( it == table.end( ) || it->second.size( ) != count )
            return false;

        words = it->second;
        return true;
    }

    std::map< std::pair< int, unsigned int >, std::vector< uint16_t > > table;

    std::atomic< int > reads{ 0 };

    bool connected = true;

    bool broken = false;
};


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
