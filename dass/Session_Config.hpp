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
#if ! defined dass_Session_Config_hpp_
#define dass_Session_Config_hpp_


#include <string>
#include "Client_Logger.hpp"
#include "Csv_Logger.hpp"
#include "Series_Buffer.hpp"


namespace dass
{

/*----------------------------------------------------*
 * Settings fixed for the lifetime of a DASS object
 *----------------------------------------------------*/

struct Session_Config
{
    size_t channel_count = 3;

    size_t buffer_capacity = Series_Buffer::s_default_capacity;

    // Pause between ticks and after a failed tick (in ms)

    unsigned int tick_interval_ms = 100;
    unsigned int error_backoff_ms = 1000;

    // How long stop() waits for the acquisition thread to end

    unsigned int stop_wait_ms = 2000;

    std::string log_directory = Csv_Logger::s_default_directory;
    std::string log_prefix    = Csv_Logger::s_default_prefix;

    // Number of ticks after which a session ends by itself, 0 for none

    unsigned long max_ticks = 0;

    // Diagnostics, see Client_Logger. An empty file name means
    // "$TMP/<device_name>.log".

    Log_Level   log_level = Log_Level::Normal;
    std::string device_name = "dass";
    std::string diagnostics_file;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
