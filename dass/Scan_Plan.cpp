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


#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include "Scan_Plan.hpp"
#include "Register_Source.hpp"
#include "Client_Logger.hpp"

using namespace dass;


int const Source_Binding::s_min_slave_id;
int const Source_Binding::s_max_slave_id;


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
long
to_long( std::string const & text,
         char        const * what )
{
    errno = 0;
    char * ep;
    long res = std::strtol( text.c_str( ), &ep, 0 );
    if ( text.empty( ) || *ep || errno == ERANGE )
        throw std::invalid_argument( std::string( "Invalid " ) + what
                                     + " '" + text + "'" );
    return res;
}


/*----------------------------------------------------*
 * The name is everything after the third colon, so it may
 * contain colons itself
 *----------------------------------------------------*/

Source_Binding
Source_Binding::from_string( std::string const & text )
{
    std::vector< std::string > fields;
    size_t start = 0;

    while ( fields.size( ) < 3 )
    {
        size_t pos = text.find( ':', start );
        if ( pos == std::string::npos )
            throw std::invalid_argument( "Invalid binding '" + text
                                         + "', expected slave:address:"
                                           "type:name" );
        fields.push_back( text.substr( start, pos - start ) );
        start = pos + 1;
    }

    long slave = to_long( fields[ 0 ], "slave ID" );
    long addr  = to_long( fields[ 1 ], "register address" );
    if ( addr < 0 )
        throw std::invalid_argument( "Invalid register address '"
                                     + fields[ 1 ] + "'" );

    Source_Binding b( static_cast< int >( slave ),
                      static_cast< unsigned int >( addr ),
                      Register_Decoder::type_from_name( fields[ 2 ] ),
                      text.substr( start ) );
    Scan_Plan::validate( b );
    return b;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Scan_Plan::Scan_Plan( std::vector< Source_Binding > const & bindings )
{
    for ( auto const & b : bindings )
        add( b );
}


/*----------------------------------------------------*
 * Names must be unique within a plan, the per-tick values
 * are looked up by name when assembling the channels
 *----------------------------------------------------*/

void
Scan_Plan::add( Source_Binding const & binding )
{
    validate( binding );

    for ( auto const & b : m_bindings )
        if ( b.name == binding.name )
            throw std::invalid_argument(   "Duplicate binding name '"
                                         + binding.name + "'" );

    m_bindings.push_back( binding );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Scan_Plan::validate( Source_Binding const & binding )
{
    if (    binding.slave_id < Source_Binding::s_min_slave_id
         || binding.slave_id > Source_Binding::s_max_slave_id )
        throw std::invalid_argument(
                      "Invalid slave ID " + std::to_string( binding.slave_id )
                    + " for '" + binding.name + "', must be between "
                    + std::to_string( Source_Binding::s_min_slave_id )
                    + " and "
                    + std::to_string( Source_Binding::s_max_slave_id ) );

    unsigned long last =   binding.address
                         + Register_Decoder::register_count( binding.type ) - 1;
    if ( last > 65535 )
        throw std::invalid_argument(   "Invalid register address "
                                     + std::to_string( binding.address )
                                     + " for '" + binding.name + "'" );

    if ( binding.name.empty( ) )
        throw std::invalid_argument( "Binding without a name" );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::map< std::string, double >
Scan_Plan::execute( Register_Source & source,
                    Client_Logger   * log ) const
{
    std::map< std::string, double > values;

    for ( auto const & b : m_bindings )
    {
        std::vector< uint16_t > words;
        double value;

        if ( ! source.read_registers(
                 b.address,
                 Register_Decoder::register_count( b.type ),
                 b.slave_id, words ) )
        {
            if ( log )
                log->log_error( "No value for '%s' (slave %d, register %u)",
                                b.name.c_str( ), b.slave_id, b.address );
            continue;
        }

        if ( ! Register_Decoder::decode( b.type, words, value ) )
        {
            if ( log )
                log->log_error( "Can't decode %s value for '%s'",
                                Register_Decoder::type_name( b.type ).c_str( ),
                                b.name.c_str( ) );
            continue;
        }

        values[ b.name ] = value;
    }

    return values;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< double >
Scan_Plan::assemble( std::map< std::string, double > const & values,
                     size_t                                  channel_count )
                                                                          const
{
    std::vector< double > raw( channel_count, 0.0 );

    for ( size_t i = 0; i < channel_count && i < m_bindings.size( ); ++i )
    {
        auto it = values.find( m_bindings[ i ].name );
        if ( it != values.end( ) )
            raw[ i ] = it->second;
    }

    return raw;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
