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


#include <cstdio>
#include <stdexcept>
#include "Channels.hpp"
#include "Conditioner.hpp"

using namespace dass;


size_t const Channels::s_max_channels;


/*----------------------------------------------------*
 *----------------------------------------------------*/

Channel::Channel( size_t index )
    : m_index( index )
    , m_name( "Channel_" + std::to_string( index + 1 ) )
{ }


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Channel::name( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_name;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Channel::set_name( std::string const & name )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    m_name = name;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Conditioning
Channel::conditioning( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_cond;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Channel::set_conditioning( Conditioning const & cond )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    m_cond = cond;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Channel::set_conditioning( std::string const & zero,
                           std::string const & multiplier,
                           std::string const & gain )
{
    Conditioning cond;
    cond.zero       = zero;
    cond.multiplier = multiplier;
    cond.gain       = gain;
    set_conditioning( cond );
}


/*----------------------------------------------------*
 * Numbers are stored as text with enough digits to get
 * back exactly the same double
 *----------------------------------------------------*/

void
Channel::set_conditioning( double zero,
                           double multiplier,
                           double gain )
{
    auto to_text = [ ]( double v ) -> std::string
    {
        char buf[ 32 ];
        snprintf( buf, sizeof buf, "%.17g", v );
        return std::string( buf );
    };

    set_conditioning( to_text( zero ), to_text( multiplier ),
                      to_text( gain ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

double
Channel::condition( double raw ) const
{
    Conditioning cond = conditioning( );
    return Conditioner::condition( raw, cond.zero, cond.multiplier,
                                   cond.gain );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Channels::Channels( size_t count )
{
    if ( count < 1 || count > s_max_channels )
        throw std::invalid_argument(   "Number of channels must be between 1 "
                                     "and " + std::to_string( s_max_channels ) );

    for ( size_t i = 0; i < count; ++i )
        m_channels.push_back( std::unique_ptr< Channel >( new Channel( i ) ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Channel &
Channels::operator [ ] ( size_t index )
{
    if ( index >= m_channels.size( ) )
        throw std::out_of_range( "Invalid channel index "
                                 + std::to_string( index ) );
    return *m_channels[ index ];
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Channel const &
Channels::operator [ ] ( size_t index ) const
{
    if ( index >= m_channels.size( ) )
        throw std::out_of_range( "Invalid channel index "
                                 + std::to_string( index ) );
    return *m_channels[ index ];
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< std::string >
Channels::names( ) const
{
    std::vector< std::string > n;
    for ( auto const & c : m_channels )
        n.push_back( c->name( ) );
    return n;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
