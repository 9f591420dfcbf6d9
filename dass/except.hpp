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
#if ! defined dass_except_hpp_
#define dass_except_hpp_


#include <exception>
#include <stdexcept>
#include <string>


namespace dass
{

/*----------------------------------------------------*
 * Thrown when talking to an already opened port fails
 *----------------------------------------------------*/

class comm_failure : public std::exception
{
  public:

    comm_failure( std::string const & mess = "" )
        : m_mess( "Communication failure: " + mess )
    { }

    char const *
    what( ) const noexcept
    {
        return m_mess.c_str( );
    }

  private:

    std::string m_mess;
};


/*----------------------------------------------------*
 * Thrown when a port can't be opened or configured. Keeps
 * the name of the port and the reason separately so that
 * a front end can show them as it likes.
 *----------------------------------------------------*/

class connection_error : public std::exception
{
  public:

    connection_error( std::string const & endpoint,
                      std::string const & cause )
        : m_endpoint( endpoint )
        , m_cause( cause )
        , m_mess( "Failed to connect to " + endpoint + ": " + cause )
    { }

    char const *
    what( ) const noexcept
    {
        return m_mess.c_str( );
    }

    std::string const &
    endpoint( ) const
    {
        return m_endpoint;
    }

    std::string const &
    cause( ) const
    {
        return m_cause;
    }

  private:

    std::string m_endpoint;
    std::string m_cause;
    std::string m_mess;
};


/*----------------------------------------------------*
 *----------------------------------------------------*/

class bad_data : public std::exception
{
  public:

    bad_data( std::string const & mess = "" )
        : m_mess( "Bad data from device: " + mess )
    { }

    char const *
    what( ) const noexcept
    {
        return m_mess.c_str( );
    }

  private:

    std::string m_mess;
};


/*----------------------------------------------------*
 *----------------------------------------------------*/

class operational_error : public std::exception
{
  public:

    operational_error( std::string const & mess = "" )
        : m_mess( "Operational error: " + mess )
    { }

    char const *
    what( ) const noexcept
    {
        return m_mess.c_str( );
    }

  private:

    std::string m_mess;
};


/*----------------------------------------------------*
 * Request that's only allowed while no acquisition is
 * running (starting a second one, changing the scan plan)
 *----------------------------------------------------*/

class already_running : public operational_error
{
  public:

    already_running( std::string const & what = "start acquisition" )
        : operational_error( "Can't " + what
                             + " while an acquisition is running" )
    { }
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
