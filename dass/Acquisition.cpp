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


#include <chrono>
#include <stdexcept>
#include "Acquisition.hpp"
#include "Register_Source.hpp"
#include "Client_Logger.hpp"
#include "except.hpp"

using namespace dass;


/*----------------------------------------------------*
 *----------------------------------------------------*/

Acquisition::State::State( Session_Config                     const & cfg,
                           std::shared_ptr< Channels >        const & chans,
                           std::shared_ptr< Client_Logger >   const & lg,
                           std::shared_ptr< Register_Source > const & src,
                           Scan_Plan                          const & pl )
    : config( cfg )
    , channels( chans )
    , log( lg )
    , source( src )
    , plan( pl )
    , csv( cfg.log_directory, cfg.log_prefix )
    , ticks( 0 )
    , failed( 0 )
    , rng( std::random_device( )( ) )
{
    for ( size_t i = 0; i < channels->size( ); ++i )
        buffers.push_back( std::unique_ptr< Series_Buffer >(
                                 new Series_Buffer( config.buffer_capacity ) ) );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Acquisition::Acquisition( Session_Config                   const & config,
                          std::shared_ptr< Channels >      const & channels,
                          std::shared_ptr< Client_Logger > const & log )
    : m_config( config )
    , m_channels( channels )
    , m_log( log )
{
    if ( ! m_channels || ! m_log )
        throw std::invalid_argument( "Acquisition needs channels and a log" );
    if ( m_config.buffer_capacity == 0 )
        throw std::invalid_argument( "Buffer capacity must be positive" );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Acquisition::~Acquisition( )
{
    stop( );
}


/*----------------------------------------------------*
 * A null pointer means no source, i.e. the stand-in one
 *----------------------------------------------------*/

void
Acquisition::set_source( std::shared_ptr< Register_Source > const & source )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( is_running( ) )
        throw already_running( "change the data source" );

    m_source = source;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Acquisition::set_scan_plan( Scan_Plan const & plan )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( is_running( ) )
        throw already_running( "change the scan plan" );

    m_plan = plan;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

Scan_Plan
Acquisition::scan_plan( ) const
{
    std::lock_guard< std::mutex > lock( m_mutex );
    return m_plan;
}


/*----------------------------------------------------*
 * Starts a new session. The CSV file is opened before the
 * thread gets launched, so a failure to open it leaves
 * everything as it was.
 *----------------------------------------------------*/

void
Acquisition::start( std::string const & stem )
{
    std::lock_guard< std::mutex > lock( m_mutex );

    if ( is_running( ) )
        throw already_running( );

    m_log->log_function_start( "start" );

    // A session that ended by itself (max_ticks reached) still
    // needs its thread joined and its file closed

    stop_locked( );

    std::shared_ptr< State > st( new State( m_config, m_channels, m_log,
                                            m_source, m_plan ) );

    st->csv.start( m_channels->names( ), stem );
    st->run = true;

    m_thread = std::thread( run, st );
    std::atomic_store( &m_state, st );

    m_log->log_message( "Acquisition started, logging to '%s'",
                        st->csv.path( ).c_str( ) );
    m_log->log_function_end( "start" );
}


/*----------------------------------------------------*
 * Asks the thread to end and waits (for a limited time) for
 * it to do so. Does nothing if no session was started.
 *----------------------------------------------------*/

void
Acquisition::stop( )
{
    std::lock_guard< std::mutex > lock( m_mutex );
    stop_locked( );
}


/*----------------------------------------------------*
 * Must be called with m_mutex held
 *----------------------------------------------------*/

void
Acquisition::stop_locked( )
{
    if ( ! m_thread.joinable( ) )
        return;

    m_log->log_function_start( "stop" );

    std::shared_ptr< State > st = state( );
    bool finished;

    {
        std::unique_lock< std::mutex > lock( st->mutex );
        st->run = false;
        st->cv.notify_all( );
        finished = st->cv.wait_for(
                        lock,
                        std::chrono::milliseconds( st->config.stop_wait_ms ),
                        [ &st ] { return st->finished; } );
    }

    if ( finished )
        m_thread.join( );
    else
    {
        m_log->log_error( "Acquisition thread didn't end within %u ms, "
                          "detaching it", st->config.stop_wait_ms );
        m_thread.detach( );
    }

    st->csv.stop( );

    m_log->log_message( "Acquisition stopped after %lu ticks (%lu failed)",
                        st->ticks.load( ), st->failed.load( ) );
    m_log->log_function_end( "stop" );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

bool
Acquisition::is_running( ) const
{
    std::shared_ptr< State > st = state( );
    if ( ! st )
        return false;

    std::lock_guard< std::mutex > lock( st->mutex );
    return st->run;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::vector< double >
Acquisition::latest_tick( ) const
{
    std::shared_ptr< State > st = state( );
    if ( ! st )
        return std::vector< double >( );

    std::lock_guard< std::mutex > lock( st->tick_mutex );
    return st->latest;
}


/*----------------------------------------------------*
 * Data of the current (or last) session
 *----------------------------------------------------*/

std::vector< double >
Acquisition::buffer_snapshot( size_t channel ) const
{
    if ( channel >= m_channels->size( ) )
        throw std::out_of_range(   "Invalid channel index "
                                 + std::to_string( channel ) );

    std::shared_ptr< State > st = state( );
    if ( ! st )
        return std::vector< double >( );

    return st->buffers[ channel ]->snapshot( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

unsigned long
Acquisition::tick_count( ) const
{
    std::shared_ptr< State > st = state( );
    return st ? st->ticks.load( ) : 0;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

unsigned long
Acquisition::failed_ticks( ) const
{
    std::shared_ptr< State > st = state( );
    return st ? st->failed.load( ) : 0;
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::string
Acquisition::log_path( ) const
{
    std::shared_ptr< State > st = state( );
    return st ? st->csv.path( ) : std::string( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

std::shared_ptr< Acquisition::State >
Acquisition::state( ) const
{
    return std::atomic_load( &m_state );
}


/*----------------------------------------------------*
 * Thread function. A failing tick doesn't end the session,
 * it only gets counted and is followed by a longer pause.
 *----------------------------------------------------*/

void
Acquisition::run( std::shared_ptr< State > state )
{
    bool go_on = true;

    while ( go_on )
    {
        unsigned int wait = state->config.tick_interval_ms;

        try
        {
            tick( *state );
        }
        catch ( std::exception const & e )
        {
            state->failed++;
            state->log->log_error( "Acquisition tick failed: %s", e.what( ) );
            wait = state->config.error_backoff_ms;
        }

        if (    state->config.max_ticks
             && state->ticks.load( ) >= state->config.max_ticks )
        {
            std::lock_guard< std::mutex > lock( state->mutex );
            state->run = false;
            break;
        }

        go_on = pause( *state, wait );
    }

    std::lock_guard< std::mutex > lock( state->mutex );
    state->finished = true;
    state->cv.notify_all( );
}


/*----------------------------------------------------*
 *----------------------------------------------------*/

void
Acquisition::tick( State & state )
{
    size_t n = state.channels->size( );
    std::vector< double > raw;

    if (    ! state.plan.empty( )
         && state.source
         && state.source->is_connected( ) )
    {
        auto values = state.plan.execute( *state.source, state.log.get( ) );
        if ( values.size( ) < state.plan.size( ) )
            state.log->log_message( "%lu of %lu reads failed",
                                    static_cast< unsigned long >(
                                        state.plan.size( ) - values.size( ) ),
                                    static_cast< unsigned long >(
                                        state.plan.size( ) ) );
        raw = state.plan.assemble( values, n );
    }
    else
    {
        std::uniform_real_distribution< double > dist( 0.0, 100.0 );
        for ( size_t i = 0; i < n; ++i )
            raw.push_back( dist( state.rng ) );
    }

    std::vector< double > values( n );
    for ( size_t i = 0; i < n; ++i )
        values[ i ] = ( *state.channels )[ i ].condition( raw[ i ] );

    state.csv.append( values );

    for ( size_t i = 0; i < n; ++i )
        state.buffers[ i ]->push( values[ i ] );

    {
        std::lock_guard< std::mutex > lock( state.tick_mutex );
        state.latest = values;
    }

    state.ticks++;
}


/*----------------------------------------------------*
 * Sleeps for the given time unless asked to stop, returns
 * false when the session is to end
 *----------------------------------------------------*/

bool
Acquisition::pause( State        & state,
                    unsigned int   ms )
{
    std::unique_lock< std::mutex > lock( state.mutex );
    state.cv.wait_for( lock, std::chrono::milliseconds( ms ),
                       [ &state ] { return ! state.run; } );
    return state.run;
}


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
