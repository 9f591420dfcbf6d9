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
#if ! defined dass_Conditioner_hpp_
#define dass_Conditioner_hpp_


#include <string>


namespace dass
{

/*----------------------------------------------------*
 * Turns raw readings into engineering units:
 *
 *     value = ( raw + zero ) * multiplier * gain
 *
 * The coefficients usually come straight from entry fields
 * of the front end, so there are versions accepting text. If
 * any of them isn't a number the raw value is used unchanged.
 *----------------------------------------------------*/

class Conditioner
{
  public:

    static double
    condition( double raw,
               double zero,
               double multiplier,
               double gain )
    {
        return ( raw + zero ) * multiplier * gain;
    }

    static double
    condition( double              raw,
               std::string const & zero,
               std::string const & multiplier,
               std::string const & gain );

    // Accepts a finite number, optionally surrounded by white-space

    static bool
    parse_number( std::string const & text,
                  double            & value );


  private:

    Conditioner( ) = delete;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
