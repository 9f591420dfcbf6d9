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
#if ! defined dass_Scan_Plan_hpp_
#define dass_Scan_Plan_hpp_


#include <map>
#include <string>
#include <vector>
#include "Register_Decoder.hpp"


namespace dass
{

class Register_Source;
class Client_Logger;


/*----------------------------------------------------*
 * One value to be read per tick: from which slave, starting
 * at which register and how to interpret the register(s)
 *----------------------------------------------------*/

struct Source_Binding
{
    int          slave_id = 1;
    unsigned int address  = 0;
    Decode_Type  type     = Decode_Type::UINT16;
    std::string  name;

    Source_Binding( ) = default;

    Source_Binding( int                 slave,
                    unsigned int        addr,
                    Decode_Type         t,
                    std::string const & n )
        : slave_id( slave )
        , address( addr )
        , type( t )
        , name( n )
    { }

    // Parses "slave:address:TYPE:name"

    static Source_Binding
    from_string( std::string const & text );

    static int const s_min_slave_id = 1;
    static int const s_max_slave_id = 4;
};


/*----------------------------------------------------*
 * Ordered list of bindings, executed once per tick
 *----------------------------------------------------*/

class Scan_Plan
{
  public:

    Scan_Plan( ) = default;

    Scan_Plan( std::vector< Source_Binding > const & bindings );

    // Throws std::invalid_argument for an unusable binding or a
    // name that is already in use

    void
    add( Source_Binding const & binding );

    void
    clear( )
    {
        m_bindings.clear( );
    }

    size_t
    size( ) const
    {
        return m_bindings.size( );
    }

    bool
    empty( ) const
    {
        return m_bindings.empty( );
    }

    std::vector< Source_Binding > const &
    bindings( ) const
    {
        return m_bindings;
    }

    // Reads all bindings, returning the values that could be read
    // and decoded under the binding names. Failed reads are logged
    // (if a logger is given) and left out.

    std::map< std::string, double >
    execute( Register_Source & source,
             Client_Logger   * log = nullptr ) const;

    // Per-channel vector: binding k feeds channel k, everything
    // without a value is 0.0

    std::vector< double >
    assemble( std::map< std::string, double > const & values,
              size_t                                  channel_count ) const;

    static void
    validate( Source_Binding const & binding );


  private:

    std::vector< Source_Binding > m_bindings;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
