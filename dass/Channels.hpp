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
#if ! defined dass_Channels_hpp_
#define dass_Channels_hpp_


#include <memory>
#include <mutex>
#include <string>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * Coefficients as entered by the user, see Conditioner
 *----------------------------------------------------*/

struct Conditioning
{
    std::string zero       = "0";
    std::string multiplier = "1";
    std::string gain       = "1";
};


/*----------------------------------------------------*
 * Settings of a single channel. They may be changed from the
 * front end at any time while the acquisition thread reads
 * them once per tick, so every access is locked.
 *----------------------------------------------------*/

class Channel
{
    friend class Channels;


  public:

    size_t
    index( ) const
    {
        return m_index;
    }

    std::string
    name( ) const;

    void
    set_name( std::string const & name );

    Conditioning
    conditioning( ) const;

    void
    set_conditioning( Conditioning const & cond );

    void
    set_conditioning( std::string const & zero,
                      std::string const & multiplier,
                      std::string const & gain );

    void
    set_conditioning( double zero,
                      double multiplier,
                      double gain );

    // Applies the channel's current coefficients to a raw value

    double
    condition( double raw ) const;


  private:

    Channel( size_t index );

    Channel( Channel const & ) = delete;

    Channel &
    operator = ( Channel const & ) = delete;

    size_t const m_index;

    std::string m_name;

    Conditioning m_cond;

    mutable std::mutex m_mutex;
};


/*----------------------------------------------------*
 * The fixed set of channels of a session
 *----------------------------------------------------*/

class Channels
{
  public:

    Channels( size_t count );

    size_t
    size( ) const
    {
        return m_channels.size( );
    }

    // Throw std::out_of_range for an invalid index

    Channel &
    operator [ ] ( size_t index );

    Channel const &
    operator [ ] ( size_t index ) const;

    std::vector< std::string >
    names( ) const;

    static size_t const s_max_channels = 8;


  private:

    Channels( Channels const & ) = delete;

    Channels &
    operator = ( Channels const & ) = delete;

    std::vector< std::unique_ptr< Channel > > m_channels;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
