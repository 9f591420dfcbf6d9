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
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>
#include <functional>
#include <thread>
#include "Modbus_Client.hpp"
#include "Modbus_Frame.hpp"
#include "Client_Logger.hpp"
#include "except.hpp"

using namespace dass;


typedef std::vector< unsigned char > Bytes;


/*----------------------------------------------------*
 * Pseudo terminal standing in for a serial line, the test
 * plays the slave device on the master side
 *----------------------------------------------------*/

class Modbus_Client_Test : public ::testing::Test
{
  protected:

    void
    SetUp( ) override
    {
        m_master = posix_openpt( O_RDWR | O_NOCTTY );
        ASSERT_GE( m_master, 0 );
        ASSERT_EQ( 0, grantpt( m_master ) );
        ASSERT_EQ( 0, unlockpt( m_master ) );
        m_port = ptsname( m_master );

        m_log.reset( new Client_Logger( "modbus_test", Log_Level::None ) );
        m_client.reset( new Modbus_Client( m_log ) );
    }

    void
    TearDown( ) override
    {
        if ( m_responder.joinable( ) )
            m_responder.join( );
        m_client.reset( );
        if ( m_master >= 0 )
            close( m_master );
    }

    // Reads one request of 8 bytes and sends back whatever 'answer'
    // makes of it (nothing if that's empty)

    void
    respond( std::function< Bytes ( Bytes const & ) > answer )
    {
        m_responder = std::thread( [ this, answer ]
        {
            Bytes req;
            while ( req.size( ) < 8 )
            {
                struct pollfd pfd = { m_master, POLLIN, 0 };
                if ( poll( &pfd, 1, 2000 ) <= 0 )
                    return;
                unsigned char buf[ 8 ];
                ssize_t n = ::read( m_master, buf, 8 - req.size( ) );
                if ( n <= 0 )
                    return;
                req.insert( req.end( ), buf, buf + n );
            }

            m_request = req;
            Bytes reply = answer( req );
            if (    ! reply.empty( )
                 && ::write( m_master, reply.data( ), reply.size( ) ) < 0 )
                ADD_FAILURE( ) << "Writing reply failed";
        } );
    }

    static Bytes
    with_crc( Bytes frame )
    {
        uint16_t crc = Modbus_Frame::crc16( frame.data( ), frame.size( ) );
        frame.push_back( crc & 0xFF );
        frame.push_back( crc >> 8 );
        return frame;
    }

    int m_master = -1;
    std::string m_port;
    std::shared_ptr< Client_Logger > m_log;
    std::unique_ptr< Modbus_Client > m_client;
    std::thread m_responder;
    Bytes m_request;
};


TEST_F( Modbus_Client_Test, reads_holding_registers )
{
    m_client->connect( m_port, 19200, 1.0 );
    ASSERT_TRUE( m_client->is_connected( ) );
    EXPECT_EQ( m_port, m_client->endpoint( ) );

    respond( [ ]( Bytes const & )
             {
                 return with_crc( { 0x02, 0x03, 0x04, 0x41, 0xA0, 0x00, 0x00 } );
             } );

    std::vector< uint16_t > words;
    ASSERT_TRUE( m_client->read_registers( 0x0010, 2, 2, words ) );
    m_responder.join( );

    EXPECT_EQ( std::vector< uint16_t >( { 0x41A0, 0x0000 } ), words );
    EXPECT_EQ( Modbus_Frame::read_request( 2,
                                           Modbus_Frame::READ_HOLDING_REGISTERS,
                                           0x0010, 2 ),
               m_request );
}


TEST_F( Modbus_Client_Test, reads_coils )
{
    m_client->connect( m_port );

    respond( [ ]( Bytes const & )
             {
                 return with_crc( { 0x01, 0x01, 0x01, 0x05 } );
             } );

    std::vector< bool > bits;
    ASSERT_TRUE( m_client->read_coils( 0, 3, 1, bits ) );
    m_responder.join( );

    EXPECT_EQ( std::vector< bool >( { true, false, true } ), bits );
    EXPECT_EQ( Modbus_Frame::READ_COILS, m_request.at( 1 ) );
}


TEST_F( Modbus_Client_Test, exception_reply_is_a_failed_read )
{
    m_client->connect( m_port );

    respond( [ ]( Bytes const & )
             {
                 return with_crc( { 0x01, 0x83, 0x02 } );
             } );

    std::vector< uint16_t > words;
    EXPECT_FALSE( m_client->read_registers( 0, 1, 1, words ) );
    EXPECT_NE( std::string::npos,
               m_log->last_error( ).find( "illegal data address" ) );
}


TEST_F( Modbus_Client_Test, missing_reply_times_out )
{
    m_client->connect( m_port, 9600, 0.2 );

    respond( [ ]( Bytes const & ) { return Bytes( ); } );

    std::vector< uint16_t > words;
    EXPECT_FALSE( m_client->read_registers( 0, 1, 1, words ) );
    EXPECT_NE( std::string::npos, m_log->last_error( ).find( "No reply" ) );
}


TEST_F( Modbus_Client_Test, invalid_requests_fail_without_io )
{
    m_client->connect( m_port );

    std::vector< uint16_t > words;
    EXPECT_FALSE( m_client->read_registers( 0, 1, 0, words ) );
    EXPECT_FALSE( m_client->read_registers( 0, 1, 248, words ) );
    EXPECT_FALSE( m_client->read_registers( 0, 0, 1, words ) );
    EXPECT_FALSE( m_client->read_registers( 0, Modbus_Frame::MAX_REGISTERS + 1,
                                            1, words ) );

    std::vector< bool > bits;
    EXPECT_FALSE( m_client->read_coils( 0, Modbus_Frame::MAX_COILS + 1, 1,
                                        bits ) );

    struct pollfd pfd = { m_master, POLLIN, 0 };
    EXPECT_EQ( 0, poll( &pfd, 1, 50 ) );
}


TEST_F( Modbus_Client_Test, raw_transfers )
{
    m_client->connect( m_port, 115200 );

    ASSERT_TRUE( m_client->write( Bytes( { 'a', 'b', 'c' } ) ) );

    unsigned char buf[ 3 ];
    size_t got = 0;
    while ( got < 3 )
    {
        struct pollfd pfd = { m_master, POLLIN, 0 };
        ASSERT_GT( poll( &pfd, 1, 2000 ), 0 );
        ssize_t n = ::read( m_master, buf + got, 3 - got );
        ASSERT_GT( n, 0 );
        got += n;
    }
    EXPECT_EQ( Bytes( { 'a', 'b', 'c' } ), Bytes( buf, buf + 3 ) );

    ASSERT_EQ( 3, ::write( m_master, "xyz", 3 ) );

    Bytes data;
    ASSERT_TRUE( m_client->read( data, 3, 2.0 ) );
    EXPECT_EQ( Bytes( { 'x', 'y', 'z' } ), data );

    // Nothing there: success, but no data

    data.clear( );
    ASSERT_TRUE( m_client->read( data, 1, 0.05 ) );
    EXPECT_TRUE( data.empty( ) );
}


TEST_F( Modbus_Client_Test, disconnect_is_idempotent )
{
    m_client->connect( m_port );
    m_client->disconnect( );
    m_client->disconnect( );

    EXPECT_FALSE( m_client->is_connected( ) );

    std::vector< uint16_t > words;
    EXPECT_FALSE( m_client->read_registers( 0, 1, 1, words ) );
    EXPECT_FALSE( m_client->write( Bytes( 1, 0 ) ) );
}


TEST_F( Modbus_Client_Test, connection_errors )
{
    try
    {
        m_client->connect( "/dev/does_not_exist_dass" );
        FAIL( ) << "connect( ) didn't throw";
    }
    catch ( connection_error const & e )
    {
        EXPECT_EQ( "/dev/does_not_exist_dass", e.endpoint( ) );
        EXPECT_FALSE( e.cause( ).empty( ) );
    }

    try
    {
        m_client->connect( "/dev/null" );
        FAIL( ) << "connect( ) didn't throw";
    }
    catch ( connection_error const & e )
    {
        EXPECT_EQ( "not a serial port", e.cause( ) );
    }

    try
    {
        m_client->connect( m_port, 12345 );
        FAIL( ) << "connect( ) didn't throw";
    }
    catch ( connection_error const & e )
    {
        EXPECT_EQ( "unsupported baud rate 12345", e.cause( ) );
    }

    EXPECT_THROW( m_client->connect( "" ), connection_error );
    EXPECT_FALSE( m_client->is_connected( ) );
}


TEST( Serial_Client, lists_ports_sorted )
{
    auto ports = Serial_Client::list_available( );

    for ( size_t i = 1; i < ports.size( ); ++i )
        EXPECT_LT( ports[ i - 1 ], ports[ i ] );
    for ( auto const & p : ports )
        EXPECT_EQ( 0u, p.find( "/dev/" ) );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
