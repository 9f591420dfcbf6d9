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


#include <gtest/gtest.h>
#include <stdexcept>
#include "Channels.hpp"

using namespace dass;


TEST( Channels, default_names_and_coefficients )
{
    Channels chans( 3 );

    ASSERT_EQ( 3u, chans.size( ) );
    EXPECT_EQ( std::vector< std::string >( { "Channel_1", "Channel_2",
                                             "Channel_3" } ),
               chans.names( ) );

    Conditioning c = chans[ 1 ].conditioning( );
    EXPECT_EQ( "0", c.zero );
    EXPECT_EQ( "1", c.multiplier );
    EXPECT_EQ( "1", c.gain );
    EXPECT_EQ( 1u, chans[ 1 ].index( ) );
    EXPECT_EQ( 17.5, chans[ 1 ].condition( 17.5 ) );
}


TEST( Channels, channel_count_limits )
{
    EXPECT_THROW( Channels( 0 ), std::invalid_argument );
    EXPECT_THROW( Channels( Channels::s_max_channels + 1 ),
                  std::invalid_argument );
    EXPECT_NO_THROW( Channels( 1 ) );
    EXPECT_NO_THROW( Channels( Channels::s_max_channels ) );
}


TEST( Channels, invalid_index_throws )
{
    Channels chans( 2 );
    Channels const & cchans = chans;

    EXPECT_THROW( chans[ 2 ], std::out_of_range );
    EXPECT_THROW( cchans[ 5 ], std::out_of_range );
}


TEST( Channels, settings_can_be_changed )
{
    Channels chans( 2 );

    chans[ 0 ].set_name( "Temp" );
    chans[ 0 ].set_conditioning( -5.0, 2.0, 1.0 );
    chans[ 1 ].set_conditioning( "1", "x", "1" );

    EXPECT_EQ( "Temp", chans[ 0 ].name( ) );
    EXPECT_EQ( "Channel_2", chans[ 1 ].name( ) );
    EXPECT_EQ( 30.0, chans[ 0 ].condition( 20.0 ) );
    EXPECT_EQ( 20.0, chans[ 1 ].condition( 20.0 ) );

    Conditioning c;
    c.gain = "0.5";
    chans[ 1 ].set_conditioning( c );
    EXPECT_EQ( 10.0, chans[ 1 ].condition( 20.0 ) );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
