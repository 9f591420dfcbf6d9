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


/* Command line front end: runs an acquisition session and prints
   every tick to stdout until interrupted or the requested number
   of ticks has been taken */


#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <unistd.h>
#include "DASS.hpp"

using namespace dass;


static volatile sig_atomic_t s_interrupted = 0;


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
void
on_signal( int /* sig */ )
{
    s_interrupted = 1;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
void
usage( char const * name )
{
    fprintf( stderr,
             "usage: %s [-hlm] [-p port] [-b baud] [-t timeout] "
             "[-c channels]\n"
             "       [-s slave:address:type:name]... [-N name]... "
             "[-C zero,mult,gain]...\n"
             "       [-o stem] [-d log_dir] [-i interval_ms] [-n ticks] "
             "[-v level]\n"
             "  -l  list serial ports and exit\n"
             "  -m  use Modbus RTU (default is a raw serial connection)\n"
             "  -s  register to read per tick, type is one of INT16, UINT16,\n"
             "      INT32, UINT32 or FLOAT32 (requires -m)\n"
             "  -N  name of the next channel\n"
             "  -C  conditioning of the next channel\n"
             "  -v  diagnostics level, 0 (none) to 3 (everything)\n"
             "Without a port random stand-in values are acquired.\n",
             name );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
unsigned long
to_ulong( char const * text,
          char const * what )
{
    errno = 0;
    char * ep;
    unsigned long res = strtoul( text, &ep, 10 );
    if ( ! *text || *ep || *text == '-' || errno == ERANGE )
        throw std::invalid_argument( std::string( "Invalid " ) + what
                                     + " '" + text + "'" );
    return res;
}


/*----------------------------------------------------*
 * Splits "zero,multiplier,gain"
 *----------------------------------------------------*/

static
Conditioning
to_conditioning( std::string const & text )
{
    size_t p1 = text.find( ',' );
    size_t p2 = p1 == std::string::npos ? p1 : text.find( ',', p1 + 1 );

    if (    p2 == std::string::npos
         || text.find( ',', p2 + 1 ) != std::string::npos )
        throw std::invalid_argument(   "Invalid conditioning '" + text
                                     + "', expected zero,mult,gain" );

    Conditioning c;
    c.zero       = text.substr( 0, p1 );
    c.multiplier = text.substr( p1 + 1, p2 - p1 - 1 );
    c.gain       = text.substr( p2 + 1 );
    return c;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
void
print_tick( unsigned long                 count,
            std::vector< double > const & values )
{
    printf( "%6lu", count );
    for ( double v : values )
        printf( " %14.6g", v );
    printf( "\n" );
    fflush( stdout );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
main( int     argc,
      char ** argv )
{
    Session_Config config;
    std::string port;
    unsigned long baud = Serial_Client::s_default_baud_rate;
    double timeout = Serial_Client::s_default_timeout;
    bool use_modbus = false;
    std::vector< Source_Binding > bindings;
    std::vector< std::string > names;
    std::vector< Conditioning > conds;
    std::string stem;
    int opt;

    static Log_Level const levels[ ] = { Log_Level::None, Log_Level::Low,
                                         Log_Level::Normal, Log_Level::High };

    try
    {
        while ( ( opt = getopt( argc, argv, "b:c:C:d:hi:lmn:N:o:p:s:t:v:" ) )
                != -1 )
        {
            switch ( opt )
            {
                case 'b' :
                    baud = to_ulong( optarg, "baud rate" );
                    break;

                case 'c' :
                    config.channel_count = to_ulong( optarg,
                                                     "number of channels" );
                    break;

                case 'C' :
                    conds.push_back( to_conditioning( optarg ) );
                    break;

                case 'd' :
                    config.log_directory = optarg;
                    break;

                case 'h' :
                    usage( argv[ 0 ] );
                    return 0;

                case 'i' :
                    config.tick_interval_ms = to_ulong( optarg,
                                                        "tick interval" );
                    break;

                case 'l' :
                    for ( auto const & p : DASS::list_available_ports( ) )
                        printf( "%s\n", p.c_str( ) );
                    return 0;

                case 'm' :
                    use_modbus = true;
                    break;

                case 'n' :
                    config.max_ticks = to_ulong( optarg, "number of ticks" );
                    break;

                case 'N' :
                    names.push_back( optarg );
                    break;

                case 'o' :
                    stem = optarg;
                    break;

                case 'p' :
                    port = optarg;
                    break;

                case 's' :
                    bindings.push_back( Source_Binding::from_string( optarg ) );
                    break;

                case 't' :
                {
                    char * ep;
                    timeout = strtod( optarg, &ep );
                    if ( *ep || ep == optarg || timeout < 0 )
                        throw std::invalid_argument(   std::string( "Invalid "
                                                                    "timeout '" )
                                                     + optarg + "'" );
                    break;
                }

                case 'v' :
                {
                    unsigned long l = to_ulong( optarg, "log level" );
                    if ( l > 3 )
                        throw std::invalid_argument( "Invalid log level" );
                    config.log_level = levels[ l ];
                    break;
                }

                default :
                    usage( argv[ 0 ] );
                    return 1;
            }
        }

        if ( optind < argc )
        {
            usage( argv[ 0 ] );
            return 1;
        }

        if ( ! bindings.empty( ) && ! use_modbus )
            throw std::invalid_argument( "Register bindings require -m" );

        DASS session( config );
        session.log( ).set_log_file( stderr );

        if ( names.size( ) > session.chans.size( ) )
            throw std::invalid_argument( "More names than channels" );
        for ( size_t i = 0; i < names.size( ); ++i )
            session.set_channel_name( i, names[ i ] );

        if ( conds.size( ) > session.chans.size( ) )
            throw std::invalid_argument( "More conditionings than channels" );
        for ( size_t i = 0; i < conds.size( ); ++i )
            session.chans[ i ].set_conditioning( conds[ i ] );

        session.set_scan_plan( bindings );

        if ( ! port.empty( ) )
            session.connect( port, baud, timeout,
                             use_modbus ? Connection_Type::Modbus
                                        : Connection_Type::Serial );

        struct sigaction sa;
        sa.sa_handler = on_signal;
        sigemptyset( &sa.sa_mask );
        sa.sa_flags = 0;
        sigaction( SIGINT, &sa, nullptr );
        sigaction( SIGTERM, &sa, nullptr );

        session.start( stem );
        fprintf( stderr, "Logging to %s\n", session.acq.log_path( ).c_str( ) );

        unsigned long shown = 0;

        while ( ! s_interrupted )
        {
            unsigned long count = session.acq.tick_count( );
            if ( count != shown )
            {
                shown = count;
                print_tick( count, session.latest_tick( ) );
            }

            if ( ! session.is_running( ) )
                break;

            std::this_thread::sleep_for(
                       std::chrono::milliseconds( config.tick_interval_ms / 2
                                                  + 1 ) );
        }

        session.stop( );
        session.disconnect( );

        fprintf( stderr, "%lu ticks acquired, %lu failed\n",
                 session.acq.tick_count( ), session.acq.failed_ticks( ) );
    }
    catch ( std::exception const & e )
    {
        fprintf( stderr, "%s: %s\n", argv[ 0 ], e.what( ) );
        return 1;
    }

    return 0;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
