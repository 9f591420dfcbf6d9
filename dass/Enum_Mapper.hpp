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
#if ! defined dass_Enum_Mapper_hpp_
#define dass_Enum_Mapper_hpp_


#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>


namespace dass
{

/*----------------------------------------------------*
 * Bidirectional mapping between an enumeration class and some
 * other representation of its values - the integer constants
 * of the C interface or the names used on the command line.
 * The 'name' is only used in error messages.
 *----------------------------------------------------*/

template< typename Enum_Type, typename Value_Type = int >
class Enum_Mapper
{
  public:

    Enum_Mapper( std::map< Value_Type, Enum_Type > const & mapper,
                 std::string                       const & name )
        : m_v2e_map( mapper )
        , m_name( name )
    {
        for ( auto const & p : m_v2e_map )
            m_e2v_map[ p.second ] = p.first;
    }

    // Enumeration to value - only fails if the map is incomplete

    Value_Type
    e2v( Enum_Type e ) const
    {
        auto it = m_e2v_map.find( e );
        if ( it == m_e2v_map.end( ) )
            throw std::runtime_error(   "Internal error, " + m_name
                                      + " map incomplete" );
        return it->second;
    }

    // Value to enumeration - called with whatever the user
    // passed in, so failure is expected

    Enum_Type
    v2e( Value_Type const & v ) const
    {
        auto it = m_v2e_map.find( v );
        if ( it == m_v2e_map.end( ) )
            throw std::invalid_argument( "Invalid " + m_name );
        return it->second;
    }

    bool
    has_value( Value_Type const & v ) const
    {
        return m_v2e_map.find( v ) != m_v2e_map.end( );
    }


  private:

    std::map< Value_Type, Enum_Type > m_v2e_map;
    std::map< Enum_Type, Value_Type > m_e2v_map;
    std::string m_name;
};


template< typename T >
constexpr typename std::underlying_type< T >::type
enum_to_value( T val )
{
    return static_cast< typename std::underlying_type< T >::type >( val );
}

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
