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


#pragma once
#if ! defined dass_Acquisition_hpp_
#define dass_Acquisition_hpp_


#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "Session_Config.hpp"
#include "Scan_Plan.hpp"
#include "Channels.hpp"
#include "Csv_Logger.hpp"
#include "Series_Buffer.hpp"


namespace dass
{

class Client_Logger;
class Register_Source;


/*----------------------------------------------------*
 * Runs the periodic acquisition in a thread of its own. Each
 * tick reads the raw values (from the register source via the
 * scan plan or, without one, from a random stand-in source),
 * conditions them, writes them to the CSV file, appends them to
 * the per-channel buffers and publishes them as the latest tick.
 *
 * Everything the thread uses is held in a per-session State
 * object it shares ownership of, so a thread that doesn't end
 * within the stop timeout can be detached safely.
 *----------------------------------------------------*/

class Acquisition
{
  public:

    Acquisition( Session_Config                   const & config,
                 std::shared_ptr< Channels >      const & channels,
                 std::shared_ptr< Client_Logger > const & log );

    ~Acquisition( );

    // Both throw already_running while a session is running

    void
    set_source( std::shared_ptr< Register_Source > const & source );

    void
    set_scan_plan( Scan_Plan const & plan );

    Scan_Plan
    scan_plan( ) const;

    void
    start( std::string const & stem = "" );

    void
    stop( );

    bool
    is_running( ) const;

    // Conditioned values of the most recent tick, empty before
    // the first one

    std::vector< double >
    latest_tick( ) const;

    std::vector< double >
    buffer_snapshot( size_t channel ) const;

    unsigned long
    tick_count( ) const;

    unsigned long
    failed_ticks( ) const;

    std::string
    log_path( ) const;


  private:

    Acquisition( Acquisition const & ) = delete;

    Acquisition &
    operator = ( Acquisition const & ) = delete;

    struct State
    {
        State( Session_Config                     const & config,
               std::shared_ptr< Channels >        const & channels,
               std::shared_ptr< Client_Logger >   const & log,
               std::shared_ptr< Register_Source > const & source,
               Scan_Plan                          const & plan );

        Session_Config config;
        std::shared_ptr< Channels > channels;
        std::shared_ptr< Client_Logger > log;
        std::shared_ptr< Register_Source > source;
        Scan_Plan plan;

        Csv_Logger csv;
        std::vector< std::unique_ptr< Series_Buffer > > buffers;

        std::mutex mutex;
        std::condition_variable cv;
        bool run = false;
        bool finished = false;

        mutable std::mutex tick_mutex;
        std::vector< double > latest;

        std::atomic< unsigned long > ticks;
        std::atomic< unsigned long > failed;

        std::mt19937 rng;
    };

    void
    stop_locked( );

    static void
    run( std::shared_ptr< State > state );

    static void
    tick( State & state );

    static bool
    pause( State        & state,
           unsigned int   ms );

    std::shared_ptr< State >
    state( ) const;

    Session_Config m_config;

    std::shared_ptr< Channels > m_channels;

    std::shared_ptr< Client_Logger > m_log;

    std::shared_ptr< Register_Source > m_source;

    Scan_Plan m_plan;

    std::shared_ptr< State > m_state;

    std::thread m_thread;

    // Serializes start(), stop() and the setters

    mutable std::mutex m_mutex;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
