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
#include <cctype>
#include <fstream>
#include "Csv_Logger.hpp"
#include "except.hpp"
#include "Temp_Dir.hpp"

using namespace dass;


/*----------------------------------------------------*
 * Checks for "YYYY-MM-DD HH:MM:SS.mmm" at the start of a row
 *----------------------------------------------------*/

static
bool
has_time_stamp( std::string const & row )
{
    static char const layout[ ] = "dddd-dd-dd dd:dd:dd.ddd";

    if ( row.size( ) < sizeof layout - 1 )
        return false;

    for ( size_t i = 0; i < sizeof layout - 1; ++i )
        if ( layout[ i ] == 'd' ? ! isdigit( row[ i ] )
                                : row[ i ] != layout[ i ] )
            return false;

    return true;
}


TEST( Csv_Logger, writes_header_and_rows )
{
    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );

    log.start( { "Timestamp_A", "B" }, "run1" );
    ASSERT_TRUE( log.is_open( ) );
    EXPECT_EQ( dir / "run1.csv", log.path( ) );

    log.append( { 1.5, -2.0 } );
    log.append( { 0.1, 1.0 / 3.0 } );
    log.append( { 1e20, 0.0 } );
    EXPECT_EQ( 3u, log.rows_written( ) );

    // Rows are flushed, so they're visible before stop()

    auto lines = read_lines( dir / "run1.csv" );
    ASSERT_EQ( 4u, lines.size( ) );
    EXPECT_EQ( "Timestamp,Timestamp_A,B", lines[ 0 ] );

    for ( size_t i = 1; i < lines.size( ); ++i )
        EXPECT_TRUE( has_time_stamp( lines[ i ] ) ) << lines[ i ];

    EXPECT_EQ( ",1.5,-2", lines[ 1 ].substr( 23 ) );
    EXPECT_EQ( ",0.1,0.3333333333", lines[ 2 ].substr( 23 ) );
    EXPECT_EQ( ",1e+20,0", lines[ 3 ].substr( 23 ) );

    log.stop( );
    EXPECT_FALSE( log.is_open( ) );
}


TEST( Csv_Logger, stop_is_idempotent_and_ends_appending )
{
    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );

    log.stop( );
    log.append( { 1.0 } );
    EXPECT_EQ( 0u, log.rows_written( ) );

    log.start( { "a" }, "x.csv" );
    log.append( { 1.0 } );
    log.stop( );
    log.stop( );
    log.append( { 2.0 } );

    EXPECT_EQ( 2u, read_lines( dir / "x.csv" ).size( ) );
    EXPECT_EQ( 1u, log.rows_written( ) );
}


TEST( Csv_Logger, row_times_never_decrease )
{
    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );

    log.start( { "a" }, "mono" );
    for ( int i = 0; i < 200; ++i )
        log.append( { static_cast< double >( i ) } );
    log.stop( );

    auto lines = read_lines( dir / "mono.csv" );
    ASSERT_EQ( 201u, lines.size( ) );

    for ( size_t i = 2; i < lines.size( ); ++i )
    {
        ASSERT_TRUE( has_time_stamp( lines[ i ] ) ) << lines[ i ];
        EXPECT_LE( lines[ i - 1 ].substr( 0, 23 ), lines[ i ].substr( 0, 23 ) )
            << "row " << i;
    }
}


TEST( Csv_Logger, formats_row_times )
{
    EXPECT_EQ( "1970-01-01 00:00:00.000", Csv_Logger::format_row_time( 0 ) );
    EXPECT_EQ( "1970-01-01 23:59:59.999",
               Csv_Logger::format_row_time( 86399999999LL ) );
    EXPECT_EQ( "2000-02-29 00:00:00.000",
               Csv_Logger::format_row_time( 951782400000000LL ) );
    EXPECT_EQ( "2023-11-14 22:13:20.123",
               Csv_Logger::format_row_time( 1700000000123456LL ) );
}


TEST( Csv_Logger, default_file_name_has_prefix_and_time )
{
    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );

    log.start( { "a" } );

    std::string name = log.path( ).substr( dir.path( ).size( ) + 1 );
    ASSERT_EQ( std::string( "dass_log_YYYYMMDD_HHMMSS.csv" ).size( ),
               name.size( ) );
    EXPECT_EQ( 0u, name.find( "dass_log_" ) );
    EXPECT_EQ( '_', name[ 17 ] );
    EXPECT_EQ( ".csv", name.substr( name.size( ) - 4 ) );
    EXPECT_TRUE( file_exists( log.path( ) ) );
}


TEST( Csv_Logger, creates_missing_directories )
{
    Temp_Dir dir;
    Csv_Logger log( dir / "a/b/c", "session" );

    log.start( { "a" }, "" );
    EXPECT_EQ( 0u, log.path( ).find( dir / "a/b/c/session_" ) );
    EXPECT_TRUE( file_exists( log.path( ) ) );
}


TEST( Csv_Logger, unusable_directory_throws )
{
    Temp_Dir dir;
    {
        std::ofstream f( dir / "file" );
        f << "x\n";
    }

    Csv_Logger log( dir / "file" );
    EXPECT_THROW( log.start( { "a" }, "run" ), operational_error );
    EXPECT_FALSE( log.is_open( ) );
}


TEST( Csv_Logger, starting_again_closes_previous_file )
{
    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );

    log.start( { "a" }, "first" );
    log.append( { 1.0 } );
    log.start( { "a" }, "second" );
    log.append( { 2.0 } );
    log.append( { 3.0 } );

    EXPECT_EQ( dir / "second.csv", log.path( ) );
    EXPECT_EQ( 2u, read_lines( dir / "first.csv" ).size( ) );
    EXPECT_EQ( 3u, read_lines( dir / "second.csv" ).size( ) );
    EXPECT_EQ( 2u, log.rows_written( ) );
}


TEST( Csv_Logger, stems_are_sanitized )
{
    EXPECT_EQ( "run1.csv", Csv_Logger::file_name_from_stem( "run1" ) );
    EXPECT_EQ( "run1.csv", Csv_Logger::file_name_from_stem( "run1.csv" ) );
    EXPECT_EQ( "a_b.csv", Csv_Logger::file_name_from_stem( "a b" ) );
    EXPECT_EQ( ".._etc_passwd.csv",
               Csv_Logger::file_name_from_stem( "../etc/passwd" ) );
    EXPECT_EQ( "", Csv_Logger::file_name_from_stem( "" ) );
    EXPECT_EQ( "", Csv_Logger::file_name_from_stem( ".csv" ) );
    EXPECT_EQ( "", Csv_Logger::file_name_from_stem( ".." ) );
}


TEST( Csv_Logger, fields_are_quoted_when_needed )
{
    EXPECT_EQ( "plain", Csv_Logger::quote( "plain" ) );
    EXPECT_EQ( "\"a,b\"", Csv_Logger::quote( "a,b" ) );
    EXPECT_EQ( "\"say \"\"hi\"\"\"", Csv_Logger::quote( "say \"hi\"" ) );

    Temp_Dir dir;
    Csv_Logger log( dir.path( ) );
    log.start( { "Temp, C", "Level" }, "q" );
    log.stop( );

    EXPECT_EQ( "Timestamp,\"Temp, C\",Level",
               read_lines( dir / "q.csv" ).at( 0 ) );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
