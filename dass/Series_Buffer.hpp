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
#if ! defined dass_Series_Buffer_hpp_
#define dass_Series_Buffer_hpp_


#include <deque>
#include <mutex>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * Most recent values of a channel for display. Once the
 * capacity is reached each new value pushes out the oldest
 * one. The acquisition thread pushes while the front end
 * takes snapshots, both only lock for their own duration.
 *----------------------------------------------------*/

class Series_Buffer
{
  public:

    Series_Buffer( size_t capacity = s_default_capacity );

    void
    push( double value );

    // Copy of the contents, oldest value first

    std::vector< double >
    snapshot( ) const;

    size_t
    size( ) const;

    size_t
    capacity( ) const
    {
        return m_capacity;
    }

    void
    clear( );

    static size_t const s_default_capacity = 100;


  private:

    Series_Buffer( Series_Buffer const & ) = delete;

    Series_Buffer &
    operator = ( Series_Buffer const & ) = delete;

    size_t const m_capacity;

    std::deque< double > m_values;

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
