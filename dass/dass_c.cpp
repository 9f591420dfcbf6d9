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


/* C wrapper */


#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <new>
#include "DASS.hpp"
#include "Enum_Mapper.hpp"
#include "dass_c.h"

using namespace dass;


static
Enum_Mapper< Log_Level > const log_level_mapper(
    std::map< int, Log_Level >(
                       { { DASS_Log_Level_None,   Log_Level::None   },
                         { DASS_Log_Level_Low,    Log_Level::Low    },
                         { DASS_Log_Level_Normal, Log_Level::Normal },
                         { DASS_Log_Level_High,   Log_Level::High   } } ),
    "log level" );

static
Enum_Mapper< Connection_Type > const connection_mapper(
    std::map< int, Connection_Type >(
                 { { DASS_Connection_Serial, Connection_Type::Serial },
                   { DASS_Connection_Modbus, Connection_Type::Modbus } } ),
    "connection type" );

static
Enum_Mapper< Decode_Type > const type_mapper(
    std::map< int, Decode_Type >( { { DASS_Type_INT16,   Decode_Type::INT16   },
                                    { DASS_Type_UINT16,  Decode_Type::UINT16  },
                                    { DASS_Type_INT32,   Decode_Type::INT32   },
                                    { DASS_Type_UINT32,  Decode_Type::UINT32  },
                                    { DASS_Type_FLOAT32, Decode_Type::FLOAT32 } } ),
    "register type" );


/*----------------------------------------------------*
 * Helper class that gets the DASS class out of its namespace
 * (so C code can have a typedef for it) and stores the message
 * of the last error
 *----------------------------------------------------*/

struct DASS_no_namespace : public DASS
{
    DASS_no_namespace( Session_Config const & config )
        : DASS( config )
    { }

    void
    set_c_error( std::string const & mess ) const
    {
        m_c_error = mess;
    }

    std::string const &
    c_error( ) const
    {
        return m_c_error;
    }

  private:

    mutable std::string m_c_error;
};


static
void
set_error( dass_t       const * d,
           std::string  const & mess )
{
    if ( d )
        d->set_c_error( mess );
}


#define CATCH( )                                     \
    catch ( std::invalid_argument const & e )        \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_INVALID_ARG;                      \
    }                                                \
    catch ( std::out_of_range const & e )            \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_INVALID_ARG;                      \
    }                                                \
    catch ( comm_failure const & e )                 \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_COMM_FAILURE;                     \
    }                                                \
    catch ( connection_error const & e )             \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_CONNECTION_ERROR;                 \
    }                                                \
    catch ( already_running const & e )              \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_ALREADY_RUNNING;                  \
    }                                                \
    catch ( operational_error const & e )            \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_OP_ERROR;                         \
    }                                                \
    catch ( std::bad_alloc const & )                 \
    {                                                \
       set_error( ds, "Out of memory" );             \
       return DASS_OUT_OF_MEMORY;                    \
    }                                                \
    catch ( std::exception const & e )               \
    {                                                \
       set_error( ds, e.what( ) );                   \
       return DASS_OTHER_ERROR;                      \
    }                                                \
    set_error( ds, "" );                             \
    return DASS_SUCCESS


/*----------------------------------------------------*
 *----------------------------------------------------*/

static
void
check_p( void const * p )
{
    if ( ! p )
        throw std::invalid_argument( "NULL pointer passed as argument" );
}


/*----------------------------------------------------*
 * Returns a malloc()ed copy of the values
 *----------------------------------------------------*/

static
void
to_c_array( std::vector< double > const & v,
            double                     ** values,
            size_t                      * length )
{
    *length = v.size( );
    *values = nullptr;

    if ( v.empty( ) )
        return;

    if ( ! ( *values = static_cast< double * >(
                                      malloc( v.size( ) * sizeof **values ) ) ) )
        throw std::bad_alloc( );

    std::copy( v.begin( ), v.end( ), *values );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
dass_default_config( dass_config_t * config )
{
    if ( ! config )
        return;

    Session_Config sc;

    config->channel_count    = sc.channel_count;
    config->buffer_capacity  = sc.buffer_capacity;
    config->tick_interval_ms = sc.tick_interval_ms;
    config->error_backoff_ms = sc.error_backoff_ms;
    config->stop_wait_ms     = sc.stop_wait_ms;
    config->log_directory    = Csv_Logger::s_default_directory;
    config->log_prefix       = Csv_Logger::s_default_prefix;
    config->max_ticks        = sc.max_ticks;
    config->log_level        = log_level_mapper.e2v( sc.log_level );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

dass_t *
dass_open( dass_config_t const  * config,
           char                ** error_str )
{
    try
    {
        Session_Config sc;

        if ( config )
        {
            sc.channel_count    = config->channel_count;
            sc.buffer_capacity  = config->buffer_capacity;
            sc.tick_interval_ms = config->tick_interval_ms;
            sc.error_backoff_ms = config->error_backoff_ms;
            sc.stop_wait_ms     = config->stop_wait_ms;
            if ( config->log_directory )
                sc.log_directory = config->log_directory;
            if ( config->log_prefix )
                sc.log_prefix = config->log_prefix;
            sc.max_ticks        = config->max_ticks;
            sc.log_level        = log_level_mapper.v2e( config->log_level );
        }

        return new DASS_no_namespace( sc );
    }
    catch ( std::exception const & e )
    {
        if ( error_str )
            *error_str = strdup( e.what( ) );
        return nullptr;
    }
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_close( dass_t * ds )
{
    try
    {
        check_p( ds );
        delete ds;
        ds = nullptr;
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_list_ports( char   *** ports,
                 size_t   * count )
{
    dass_t const * ds = nullptr;

    try
    {
        check_p( ports );
        check_p( count );

        auto list = DASS::list_available_ports( );

        *ports = nullptr;
        *count = 0;

        if ( list.empty( ) )
            return DASS_SUCCESS;

        if ( ! ( *ports = static_cast< char ** >(
                                  calloc( list.size( ), sizeof **ports ) ) ) )
            throw std::bad_alloc( );

        for ( auto const & p : list )
        {
            if ( ! ( ( *ports )[ *count ] = strdup( p.c_str( ) ) ) )
            {
                dass_free_ports( *ports, *count );
                *ports = nullptr;
                *count = 0;
                throw std::bad_alloc( );
            }
            ++*count;
        }
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
dass_free_ports( char   ** ports,
                 size_t    count )
{
    if ( ! ports )
        return;

    for ( size_t i = 0; i < count; ++i )
        free( ports[ i ] );
    free( ports );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_connect( dass_t       * ds,
              char const   * endpoint,
              unsigned long  baud_rate,
              double         timeout,
              int            connection_type )
{
    try
    {
        check_p( ds );
        check_p( endpoint );
        ds->connect( endpoint, baud_rate, timeout,
                     connection_mapper.v2e( connection_type ) );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_disconnect( dass_t * ds )
{
    try
    {
        check_p( ds );
        ds->disconnect( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_is_connected( dass_t const * ds,
                   bool         * is_connected )
{
    try
    {
        check_p( ds );
        check_p( is_connected );
        *is_connected = ds->is_connected( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_set_scan_plan( dass_t               * ds,
                    dass_binding_t const * bindings,
                    size_t                 count )
{
    try
    {
        check_p( ds );
        if ( count )
            check_p( bindings );

        std::vector< Source_Binding > bv;
        for ( size_t i = 0; i < count; ++i )
        {
            check_p( bindings[ i ].name );
            bv.push_back( Source_Binding( bindings[ i ].slave_id,
                                          bindings[ i ].address,
                                          type_mapper.v2e( bindings[ i ].type ),
                                          bindings[ i ].name ) );
        }

        ds->set_scan_plan( bv );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_set_channel_name( dass_t     * ds,
                       size_t       channel,
                       char const * name )
{
    try
    {
        check_p( ds );
        check_p( name );
        ds->set_channel_name( channel, name );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_set_channel_conditioning( dass_t     * ds,
                               size_t       channel,
                               char const * zero,
                               char const * multiplier,
                               char const * gain )
{
    try
    {
        check_p( ds );
        check_p( zero );
        check_p( multiplier );
        check_p( gain );
        ds->set_channel_conditioning( channel, zero, multiplier, gain );
    }
    CATCH( );
}


/*----------------------------------------------------*
 * A NULL stem means an automatically generated file name
 *----------------------------------------------------*/

int
dass_start( dass_t     * ds,
            char const * stem )
{
    try
    {
        check_p( ds );
        ds->start( stem ? stem : "" );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_stop( dass_t * ds )
{
    try
    {
        check_p( ds );
        ds->stop( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_is_running( dass_t const * ds,
                 bool         * is_running )
{
    try
    {
        check_p( ds );
        check_p( is_running );
        *is_running = ds->is_running( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_latest_tick( dass_t const  * ds,
                  double       ** values,
                  size_t        * length )
{
    try
    {
        check_p( ds );
        check_p( values );
        check_p( length );
        to_c_array( ds->latest_tick( ), values, length );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_buffer_snapshot( dass_t const  * ds,
                      size_t          channel,
                      double       ** values,
                      size_t        * length )
{
    try
    {
        check_p( ds );
        check_p( values );
        check_p( length );
        to_c_array( ds->buffer_snapshot( channel ), values, length );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_tick_count( dass_t const  * ds,
                 unsigned long * count )
{
    try
    {
        check_p( ds );
        check_p( count );
        *count = ds->acq.tick_count( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

int
dass_log_path( dass_t const  * ds,
               char         ** path )
{
    try
    {
        check_p( ds );
        check_p( path );
        if ( ! ( *path = strdup( ds->acq.log_path( ).c_str( ) ) ) )
            throw std::bad_alloc( );
    }
    CATCH( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

char const *
dass_last_error( dass_t const * ds )
{
    if ( ! ds )
        return nullptr;
    return ds->c_error( ).c_str( );
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
