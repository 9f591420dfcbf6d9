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


#include <algorithm>
#include <cctype>
#include <cstring>
#include "Register_Decoder.hpp"
#include "Enum_Mapper.hpp"

using namespace dass;


static
Enum_Mapper< Decode_Type, std::string > const type_mapper(
    std::map< std::string, Decode_Type >(
                             { { "INT16",   Decode_Type::INT16   },
                               { "UINT16",  Decode_Type::UINT16  },
                               { "INT32",   Decode_Type::INT32   },
                               { "UINT32",  Decode_Type::UINT32  },
                               { "FLOAT32", Decode_Type::FLOAT32 } } ),
    "decode type" );


/*----------------------------------------------------*
 *----------------------------------------------------*/

size_t
Register_Decoder::register_count( Decode_Type type )
{
    switch ( type )
    {
        case Decode_Type::INT16 :
        case Decode_Type::UINT16 :
            return 1;

        case Decode_Type::INT32 :
        case Decode_Type::UINT32 :
        case Decode_Type::FLOAT32 :
            return 2;
    }

    throw std::invalid_argument( "Invalid decode type" );
}


/*----------------------------------------------------*
 * 16-bit values are taken from the first word, for 32-bit
 * values the first word holds the upper 16 bits. Signed
 * types are two's complement, FLOAT32 is an IEEE 754 single
 * precision number with its most significant byte first.
 *----------------------------------------------------*/

bool
Register_Decoder::decode( Decode_Type                     type,
                          std::vector< uint16_t > const & words,
                          double                        & value )
{
    if ( words.size( ) != register_count( type ) )
        return false;

    switch ( type )
    {
        case Decode_Type::UINT16 :
            value = words[ 0 ];
            return true;

        case Decode_Type::INT16 :
            value = words[ 0 ] < 32768 ? static_cast< long >( words[ 0 ] )
                                       : words[ 0 ] - 65536L;
            return true;

        default :
            break;
    }

    uint32_t combined =   ( static_cast< uint32_t >( words[ 0 ] ) << 16 )
                        | words[ 1 ];

    if ( type == Decode_Type::UINT32 )
        value = combined;
    else if ( type == Decode_Type::INT32 )
        value = combined < 2147483648UL
                ? static_cast< long long >( combined )
                : static_cast< long long >( combined ) - 4294967296LL;
    else
    {
        // Copying the bit pattern is the only portable way of
        // reinterpreting it. NaN and infinities are passed on as
        // they are, some devices use them to flag a sensor fault.

        static_assert( sizeof( float ) == sizeof( uint32_t ),
                       "float isn't 32 bits wide" );

        float f;
        std::memcpy( &f, &combined, sizeof f );

        value = f;
    }

    return true;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Register_Decoder::type_name( Decode_Type type )
{
    return type_mapper.e2v( type );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Decode_Type
Register_Decoder::type_from_name( std::string const & name )
{
    std::string uname( name );
    std::transform( uname.begin( ), uname.end( ), uname.begin( ),
                    [ ]( char c ) { return std::toupper(
                                     static_cast< unsigned char >( c ) ); } );

    if ( ! type_mapper.has_value( uname ) )
        throw std::invalid_argument( "Invalid decode type '" + name + "'" );

    return type_mapper.v2e( uname );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
