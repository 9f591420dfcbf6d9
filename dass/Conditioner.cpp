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


#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include "Conditioner.hpp"

using namespace dass;


/*----------------------------------------------------*
 *----------------------------------------------------*/

double
Conditioner::condition( double              raw,
                        std::string const & zero,
                        std::string const & multiplier,
                        std::string const & gain )
{
    double z, m, g;

    if (    ! parse_number( zero, z )
         || ! parse_number( multiplier, m )
         || ! parse_number( gain, g ) )
        return raw;

    return condition( raw, z, m, g );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

bool
Conditioner::parse_number( std::string const & text,
                           double            & value )
{
    char const * start = text.c_str( );
    while ( std::isspace( static_cast< unsigned char >( *start ) ) )
        ++start;

    if ( ! *start )
        return false;

    errno = 0;
    char * ep;
    double res = std::strtod( start, &ep );

    if ( ep == start || errno == ERANGE || ! std::isfinite( res ) )
        return false;

    while ( std::isspace( static_cast< unsigned char >( *ep ) ) )
        ++ep;

    // Anything left (including an embedded NUL) means it's no number

    if ( *ep || ep != text.c_str( ) + text.size( ) )
        return false;

    value = res;
    return true;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
