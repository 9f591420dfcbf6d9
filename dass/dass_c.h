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


/* File to be included by programs using the C version of the library */


#if ! defined dass_c_h_
#define dass_c_h_

#include <stdbool.h>
#include <stddef.h>


#if defined __cplusplus
extern "C" {
#endif


typedef struct DASS_no_namespace dass_t;


enum
{
    DASS_SUCCESS,
    DASS_INVALID_ARG,
    DASS_COMM_FAILURE,
    DASS_CONNECTION_ERROR,
    DASS_ALREADY_RUNNING,
    DASS_OP_ERROR,
    DASS_OUT_OF_MEMORY,
    DASS_OTHER_ERROR
};

enum
{
    DASS_Log_Level_None,         // no logging at all (and no file opened)
    DASS_Log_Level_Low,          // logs errors only
    DASS_Log_Level_Normal,       // logs function calls, events and errors
    DASS_Log_Level_High          // logs function calls, all data and errors
};

enum
{
    DASS_Connection_Serial,
    DASS_Connection_Modbus
};

enum
{
    DASS_Type_INT16,
    DASS_Type_UINT16,
    DASS_Type_INT32,
    DASS_Type_UINT32,
    DASS_Type_FLOAT32
};


/* Session settings, use dass_default_config() to initialize */

typedef struct {
    size_t          channel_count;
    size_t          buffer_capacity;
    unsigned int    tick_interval_ms;
    unsigned int    error_backoff_ms;
    unsigned int    stop_wait_ms;
    char const    * log_directory;
    char const    * log_prefix;
    unsigned long   max_ticks;
    int             log_level;
} dass_config_t;


typedef struct {
    int             slave_id;
    unsigned int    address;
    int             type;
    char const    * name;
} dass_binding_t;


void
dass_default_config( dass_config_t * config );

/* 'config' may be NULL for the defaults. On failure NULL is returned
   and, if 'error_str' isn't NULL, it's set to a malloc()ed message */

dass_t *
dass_open( dass_config_t const  * config,
           char                ** error_str );

int
dass_close( dass_t * ds );


/* The list and its strings must be released with dass_free_ports() */

int
dass_list_ports( char   *** ports,
                 size_t   * count );

void
dass_free_ports( char   ** ports,
                 size_t    count );


int
dass_connect( dass_t       * ds,
              char const   * endpoint,
              unsigned long  baud_rate,
              double         timeout,
              int            connection_type );

int
dass_disconnect( dass_t * ds );

int
dass_is_connected( dass_t const * ds,
                   bool         * is_connected );


int
dass_set_scan_plan( dass_t               * ds,
                    dass_binding_t const * bindings,
                    size_t                 count );

int
dass_set_channel_name( dass_t     * ds,
                       size_t       channel,
                       char const * name );

int
dass_set_channel_conditioning( dass_t     * ds,
                               size_t       channel,
                               char const * zero,
                               char const * multiplier,
                               char const * gain );


int
dass_start( dass_t     * ds,
            char const * stem );

int
dass_stop( dass_t * ds );

int
dass_is_running( dass_t const * ds,
                 bool         * is_running );


/* Arrays returned by the following two functions are malloc()ed and
   must be free()ed by the caller (they're NULL for a length of 0) */

int
dass_latest_tick( dass_t const  * ds,
                  double       ** values,
                  size_t        * length );

int
dass_buffer_snapshot( dass_t const  * ds,
                      size_t          channel,
                      double       ** values,
                      size_t        * length );

int
dass_tick_count( dass_t const  * ds,
                 unsigned long * count );

int
dass_log_path( dass_t const  * ds,
               char         ** path );

char const *
dass_last_error( dass_t const * ds );


#if defined __cplusplus
}
#endif


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
