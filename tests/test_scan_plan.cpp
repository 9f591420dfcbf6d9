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
#include <cmath>
#include <map>
#include <stdexcept>
#include "Scan_Plan.hpp"
#include "Table_Source.hpp"

using namespace dass;


TEST( Scan_Plan, validates_bindings )
{
    Scan_Plan plan;

    EXPECT_THROW( plan.add( Source_Binding( 0, 0, Decode_Type::UINT16, "a" ) ),
                  std::invalid_argument );
    EXPECT_THROW( plan.add( Source_Binding( 5, 0, Decode_Type::UINT16, "a" ) ),
                  std::invalid_argument );
    EXPECT_THROW( plan.add( Source_Binding( 1, 65535, Decode_Type::INT32,
                                            "a" ) ),
                  std::invalid_argument );
    EXPECT_THROW( plan.add( Source_Binding( 1, 70000, Decode_Type::UINT16,
                                            "a" ) ),
                  std::invalid_argument );
    EXPECT_THROW( plan.add( Source_Binding( 1, 0, Decode_Type::UINT16, "" ) ),
                  std::invalid_argument );
    EXPECT_TRUE( plan.empty( ) );

    plan.add( Source_Binding( 4, 65534, Decode_Type::FLOAT32, "a" ) );
    plan.add( Source_Binding( 1, 65535, Decode_Type::INT16, "b" ) );
    EXPECT_EQ( 2u, plan.size( ) );

    plan.clear( );
    EXPECT_TRUE( plan.empty( ) );
}


TEST( Scan_Plan, bindings_from_text )
{
    Source_Binding b = Source_Binding::from_string( "2:100:float32:Temp" );
    EXPECT_EQ( 2, b.slave_id );
    EXPECT_EQ( 100u, b.address );
    EXPECT_EQ( Decode_Type::FLOAT32, b.type );
    EXPECT_EQ( "Temp", b.name );

    b = Source_Binding::from_string( "1:0x10:UINT16:a:b" );
    EXPECT_EQ( 16u, b.address );
    EXPECT_EQ( "a:b", b.name );

    EXPECT_THROW( Source_Binding::from_string( "1:2:INT16" ),
                  std::invalid_argument );
    EXPECT_THROW( Source_Binding::from_string( "x:2:INT16:n" ),
                  std::invalid_argument );
    EXPECT_THROW( Source_Binding::from_string( "1:-1:INT16:n" ),
                  std::invalid_argument );
    EXPECT_THROW( Source_Binding::from_string( "1:2:DOUBLE:n" ),
                  std::invalid_argument );
    EXPECT_THROW( Source_Binding::from_string( "9:2:INT16:n" ),
                  std::invalid_argument );
    EXPECT_THROW( Source_Binding::from_string( "1:2:INT16:" ),
                  std::invalid_argument );
}


TEST( Scan_Plan, failed_reads_are_left_out )
{
    Table_Source src;
    src.table[ std::make_pair( 1, 0u ) ]  = { 0x41A0, 0x0000 };
    src.table[ std::make_pair( 2, 10u ) ] = { 0xFFFF };

    Scan_Plan plan( { Source_Binding( 1, 0, Decode_Type::FLOAT32, "Temp" ),
                      Source_Binding( 3, 5, Decode_Type::UINT16, "Gone" ),
                      Source_Binding( 2, 10, Decode_Type::INT16, "Level" ) } );

    auto values = plan.execute( src );

    EXPECT_EQ( 3, src.reads.load( ) );
    ASSERT_EQ( 2u, values.size( ) );
    EXPECT_EQ( 20.0, values.at( "Temp" ) );
    EXPECT_EQ( -1.0, values.at( "Level" ) );
    EXPECT_EQ( 0u, values.count( "Gone" ) );
}


TEST( Scan_Plan, non_finite_floats_are_passed_on )
{
    Table_Source src;
    src.table[ std::make_pair( 1, 0u ) ] = { 0x7FC0, 0x0000 };
    src.table[ std::make_pair( 1, 2u ) ] = { 0xFF80, 0x0000 };

    Scan_Plan plan( { Source_Binding( 1, 0, Decode_Type::FLOAT32, "Fault" ),
                      Source_Binding( 1, 2, Decode_Type::FLOAT32, "Low" ) } );

    auto values = plan.execute( src );
    ASSERT_EQ( 2u, values.size( ) );
    EXPECT_TRUE( std::isnan( values.at( "Fault" ) ) );
    EXPECT_TRUE( std::isinf( values.at( "Low" ) ) );
    EXPECT_LT( values.at( "Low" ), 0.0 );

    auto raw = plan.assemble( values, 2 );
    EXPECT_TRUE( std::isnan( raw[ 0 ] ) );
    EXPECT_TRUE( std::isinf( raw[ 1 ] ) );
}


TEST( Scan_Plan, duplicate_names_are_rejected )
{
    Scan_Plan plan;
    plan.add( Source_Binding( 1, 10, Decode_Type::UINT16, "T" ) );

    EXPECT_THROW( plan.add( Source_Binding( 2, 20, Decode_Type::UINT16, "T" ) ),
                  std::invalid_argument );
    EXPECT_EQ( 1u, plan.size( ) );

    std::vector< Source_Binding > twice =
                    { Source_Binding( 1, 10, Decode_Type::UINT16, "T" ),
                      Source_Binding( 2, 20, Decode_Type::UINT16, "T" ) };
    EXPECT_THROW( plan = Scan_Plan( twice ), std::invalid_argument );
    EXPECT_EQ( 1u, plan.size( ) );
}


TEST( Scan_Plan, failed_read_zeroes_only_its_own_channel )
{
    Table_Source src;
    src.table[ std::make_pair( 2, 20u ) ] = { 1234 };

    Scan_Plan plan( { Source_Binding( 1, 10, Decode_Type::UINT16, "T1" ),
                      Source_Binding( 2, 20, Decode_Type::UINT16, "T2" ) } );

    EXPECT_EQ( std::vector< double >( { 0.0, 1234.0 } ),
               plan.assemble( plan.execute( src ), 2 ) );
}


TEST( Scan_Plan, assembles_zero_filled_channel_vector )
{
    Scan_Plan plan( { Source_Binding( 1, 0, Decode_Type::UINT16, "a" ),
                      Source_Binding( 1, 1, Decode_Type::UINT16, "b" ) } );

    std::map< std::string, double > values = { { "a", 7.0 } };

    EXPECT_EQ( std::vector< double >( { 7.0, 0.0, 0.0 } ),
               plan.assemble( values, 3 ) );
    EXPECT_EQ( std::vector< double >( { 7.0 } ),
               plan.assemble( values, 1 ) );

    values[ "b" ] = -3.5;
    EXPECT_EQ( std::vector< double >( { 7.0, -3.5 } ),
               plan.assemble( values, 2 ) );

    EXPECT_EQ( std::vector< double >( 4, 0.0 ),
               Scan_Plan( ).assemble( values, 4 ) );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
