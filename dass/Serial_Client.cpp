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
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <glob.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>
#include "Serial_Client.hpp"
#include "except.hpp"

using namespace dass;


unsigned long const Serial_Client::s_default_baud_rate;
constexpr double Serial_Client::s_default_timeout;


/*--------------------------------------------------*
 *--------------------------------------------------*/

Serial_Client::Serial_Client( std::shared_ptr< Client_Logger > const & log )
    : m_log( log )
    , m_connected( false )
{
    if ( ! m_log )
        throw std::invalid_argument( "Serial client requires a logger" );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

Serial_Client::~Serial_Client( )
{
    std::lock_guard< std::mutex > lock( m_io_mutex );
    close_port( );
}


/*--------------------------------------------------*
 * Returns the device files of all serial ports. The legacy
 * ttyS devices always exist, so they're only reported if the
 * kernel has found a real UART behind them.
 *--------------------------------------------------*/

std::vector< std::string >
Serial_Client::list_available( )
{
    static char const * const patterns[ ] = { "/dev/ttyS*",
                                              "/dev/ttyUSB*",
                                              "/dev/ttyACM*",
                                              "/dev/ttyAMA*",
                                              "/dev/rfcomm*" };

    std::vector< std::string > ports;

    for ( auto pattern : patterns )
    {
        glob_t g;
        if ( glob( pattern, 0, nullptr, &g ) != 0 )
            continue;

        for ( size_t i = 0; i < g.gl_pathc; ++i )
        {
            std::string dev( g.gl_pathv[ i ] );

            if ( dev.compare( 0, 9, "/dev/ttyS" ) == 0 )
            {
                std::string sys = "/sys/class/tty/" + dev.substr( 5 )
                                  + "/device";
                struct stat st;
                if ( stat( sys.c_str( ), &st ) != 0 )
                    continue;
            }

            ports.push_back( dev );
        }

        globfree( &g );
    }

    std::sort( ports.begin( ), ports.end( ) );
    return ports;
}


/*--------------------------------------------------*
 * Opens the port and sets it up for raw 8N1 transfers at the
 * requested speed. An already open port gets closed first.
 *--------------------------------------------------*/

void
Serial_Client::connect( std::string const & endpoint,
                        unsigned long       baud_rate,
                        double              timeout )
{
    m_log->log_function_start( "connect" );

    speed_t speed = B9600;
    std::string cause;

    if ( endpoint.empty( ) )
        cause = "no port name given";
    else if ( ! to_speed( baud_rate, speed ) )
        cause = "unsupported baud rate " + std::to_string( baud_rate );
    else if ( timeout < 0 )
        cause = "invalid negative timeout";

    if ( ! cause.empty( ) )
    {
        m_log->log_error( "Failed to connect to '%s': %s", endpoint.c_str( ),
                          cause.c_str( ) );
        m_log->log_function_end( "connect" );
        throw connection_error( endpoint, cause );
    }

    std::lock_guard< std::mutex > lock( m_io_mutex );

    close_port( );

    int fd = ::open( endpoint.c_str( ), O_RDWR | O_NOCTTY | O_NONBLOCK );

    struct termios tio;
    if (    fd < 0
         || ! isatty( fd )
         || tcgetattr( fd, &tio ) != 0 )
    {
        cause = fd >= 0 && ! isatty( fd ) ? "not a serial port"
                                          : strerror( errno );
        if ( fd >= 0 )
            ::close( fd );
        m_log->log_error( "Failed to open '%s': %s", endpoint.c_str( ),
                          cause.c_str( ) );
        m_log->log_function_end( "connect" );
        throw connection_error( endpoint, cause );
    }

    cfmakeraw( &tio );
    tio.c_cflag &= ~ ( CSIZE | CSTOPB | PARENB | CRTSCTS );
    tio.c_cflag |= CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~ ( IXON | IXOFF | IXANY );
    tio.c_cc[ VMIN ]  = 0;
    tio.c_cc[ VTIME ] = 0;

    if (    cfsetispeed( &tio, speed ) != 0
         || cfsetospeed( &tio, speed ) != 0
         || tcsetattr( fd, TCSANOW, &tio ) != 0 )
    {
        cause = strerror( errno );
        ::close( fd );
        m_log->log_error( "Failed to configure '%s': %s", endpoint.c_str( ),
                          cause.c_str( ) );
        m_log->log_function_end( "connect" );
        throw connection_error( endpoint, cause );
    }

    tcflush( fd, TCIOFLUSH );

    m_fd = fd;
    m_timeout = timeout;
    {
        std::lock_guard< std::mutex > name_lock( m_name_mutex );
        m_endpoint = endpoint;
    }
    m_connected = true;

    m_log->log_message( "Connected to %s at %lu baud", endpoint.c_str( ),
                        baud_rate );
    m_log->log_function_end( "connect" );
}


/*--------------------------------------------------*
 * Closes the port, may be called when not connected. If
 * another thread is in the middle of a transaction this
 * waits for it to end (at most the read timeout).
 *--------------------------------------------------*/

void
Serial_Client::disconnect( )
{
    std::lock_guard< std::mutex > lock( m_io_mutex );

    if ( m_fd < 0 )
        return;

    m_log->log_function_start( "disconnect" );
    close_port( );
    m_log->log_message( "Disconnected from %s", endpoint( ).c_str( ) );
    m_log->log_function_end( "disconnect" );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

std::string
Serial_Client::endpoint( ) const
{
    std::lock_guard< std::mutex > lock( m_name_mutex );
    return m_endpoint;
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

bool
Serial_Client::write( std::vector< unsigned char > const & data )
{
    std::lock_guard< std::mutex > lock( m_io_mutex );
    return write_locked( data );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

bool
Serial_Client::read( std::vector< unsigned char > & data,
                     size_t                         count,
                     double                         timeout )
{
    std::lock_guard< std::mutex > lock( m_io_mutex );
    return read_locked( data, count, timeout < 0 ? m_timeout : timeout );
}


/*--------------------------------------------------*
 * Writes all of the data, waiting for the port to become
 * writable for at most the default timeout each time.
 *--------------------------------------------------*/

bool
Serial_Client::write_locked( std::vector< unsigned char > const & data )
{
    if ( m_fd < 0 )
    {
        m_log->log_error( "Attempt to write to unconnected port" );
        return false;
    }

    m_log->log_data( "Sending", data.data( ), data.size( ) );

    size_t done = 0;
    int timeout_ms = static_cast< int >( 1000 * m_timeout );

    while ( done < data.size( ) )
    {
        ssize_t n = ::write( m_fd, data.data( ) + done, data.size( ) - done );

        if ( n > 0 )
        {
            done += n;
            continue;
        }

        if ( n < 0 && errno != EAGAIN && errno != EINTR )
        {
            m_log->log_error( "Writing to %s failed: %s",
                              endpoint( ).c_str( ), strerror( errno ) );
            return false;
        }

        struct pollfd pfd = { m_fd, POLLOUT, 0 };
        int r = poll( &pfd, 1, timeout_ms );

        if ( r == 0 )
        {
            m_log->log_error( "Writing to %s timed out", endpoint( ).c_str( ) );
            return false;
        }
        else if ( r < 0 && errno != EINTR )
        {
            m_log->log_error( "Writing to %s failed: %s",
                              endpoint( ).c_str( ), strerror( errno ) );
            return false;
        }
    }

    return true;
}


/*--------------------------------------------------*
 * Appends up to 'count' bytes to 'data'. Returns as soon as
 * all have arrived or the timeout (in s) is over.
 *--------------------------------------------------*/

bool
Serial_Client::read_locked( std::vector< unsigned char > & data,
                            size_t                         count,
                            double                         timeout )
{
    if ( m_fd < 0 )
    {
        m_log->log_error( "Attempt to read from unconnected port" );
        return false;
    }

    typedef std::chrono::steady_clock Clock;
    Clock::time_point deadline =   Clock::now( )
                                 + std::chrono::milliseconds(
                                      static_cast< long >( 1000 * timeout ) );

    size_t old_size = data.size( );
    unsigned char buf[ 256 ];

    while ( data.size( ) - old_size < count )
    {
        long left = std::chrono::duration_cast< std::chrono::milliseconds >(
                                            deadline - Clock::now( ) ).count( );
        if ( left < 0 )
            left = 0;

        struct pollfd pfd = { m_fd, POLLIN, 0 };
        int r = poll( &pfd, 1, static_cast< int >( left ) );

        if ( r < 0 )
        {
            if ( errno == EINTR )
                continue;
            m_log->log_error( "Reading from %s failed: %s",
                              endpoint( ).c_str( ), strerror( errno ) );
            return false;
        }

        if ( r == 0 )
            break;

        if ( ! ( pfd.revents & POLLIN ) )
        {
            m_log->log_error( "Reading from %s failed: port hung up",
                              endpoint( ).c_str( ) );
            return false;
        }

        size_t want = std::min( sizeof buf, count - ( data.size( ) - old_size ) );
        ssize_t n = ::read( m_fd, buf, want );

        if ( n < 0 )
        {
            if ( errno == EAGAIN || errno == EINTR )
                continue;
            m_log->log_error( "Reading from %s failed: %s",
                              endpoint( ).c_str( ), strerror( errno ) );
            return false;
        }
        else if ( n == 0 )
        {
            m_log->log_error( "Reading from %s failed: port hung up",
                              endpoint( ).c_str( ) );
            return false;
        }

        data.insert( data.end( ), buf, buf + n );
    }

    m_log->log_data( "Received", data.data( ) + old_size,
                     data.size( ) - old_size );
    return true;
}


/*--------------------------------------------------*
 * Throws away whatever is still waiting to be read, e.g. the
 * rest of a late reply to an earlier request.
 *--------------------------------------------------*/

void
Serial_Client::flush_input_locked( )
{
    if ( m_fd >= 0 )
        tcflush( m_fd, TCIFLUSH );
}


/*--------------------------------------------------*
 *--------------------------------------------------*/

bool
Serial_Client::to_speed( unsigned long   baud_rate,
                         speed_t       & speed )
{
    static std::vector< std::pair< unsigned long, speed_t > > const rates =
        { {    1200, B1200    }, {    2400, B2400    }, {    4800, B4800    },
          {    9600, B9600    }, {   19200, B19200   }, {   38400, B38400   },
          {   57600, B57600   }, {  115200, B115200  }, {  230400, B230400  },
          {  460800, B460800  }, {  500000, B500000  }, {  576000, B576000  },
          {  921600, B921600  }, { 1000000, B1000000 }, { 1152000, B1152000 },
          { 1500000, B1500000 }, { 2000000, B2000000 }, { 2500000, B2500000 },
          { 3000000, B3000000 }, { 3500000, B3500000 }, { 4000000, B4000000 } };

    for ( auto const & r : rates )
        if ( r.first == baud_rate )
        {
            speed = r.second;
            return true;
        }

    return false;
}


/*--------------------------------------------------*
 * Must be called with m_io_mutex held
 *--------------------------------------------------*/

void
Serial_Client::close_port( )
{
    m_connected = false;

    if ( m_fd >= 0 )
    {
        ::close( m_fd );
        m_fd = -1;
    }
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
