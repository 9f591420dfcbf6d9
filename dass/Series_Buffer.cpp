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


#include <stdexcept>
#include "Series_Buffer.hpp"

using namespace dass;


size_t const Series_Buffer::s_default_capacity;


/*----------------------------------------------------*
 *----------------------------------------------------*/

Series_Buffer::Series_Buffer( size_t capacity )
    : m_capacity( capacity )
{
    if ( capacity == 0 )
        throw std::invalid_argument( "Buffer capacity must be at least 1" );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Series_Buffer::push( double value )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    m_values.push_back( value );
    if ( m_values.size( ) > m_capacity )
        m_values.pop_front( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< double >
Series_Buffer::snapshot( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return std::vector< double >( m_values.begin( ), m_values.end( ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

size_t
Series_Buffer::size( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_values.size( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Series_Buffer::clear( )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    m_values.clear( );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
