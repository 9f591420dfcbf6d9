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
#if ! defined dass_Register_Decoder_hpp_
#define dass_Register_Decoder_hpp_


#include <cstdint>
#include <string>
#include <vector>


namespace dass
{

/*----------------------------------------------------*
 * How one or two 16-bit registers are to be interpreted
 *----------------------------------------------------*/

enum class Decode_Type : int
{
    INT16,
    UINT16,
    INT32,
    UINT32,
    FLOAT32
};


/*----------------------------------------------------*
 * Conversion of raw register words into numbers. Words are
 * in Modbus (big-endian) order, i.e. the first word holds
 * the high bits of 32-bit values.
 *----------------------------------------------------*/

class Register_Decoder
{
  public:

    // Number of registers a value of the given type occupies

    static size_t
    register_count( Decode_Type type );

    // Returns false if there's no value to be had, i.e. the number
    // of words doesn't match the type or the bytes make no sense

    static bool
    decode( Decode_Type                     type,
            std::vector< uint16_t > const & words,
            double                        & value );

    static std::string
    type_name( Decode_Type type );

    // Accepts the names returned by type_name(), ignoring case,
    // throws std::invalid_argument for anything else

    static Decode_Type
    type_from_name( std::string const & name );


  private:

    Register_Decoder( ) = delete;
};

}


#endif


/*
 * Local variables:
 * tab-width: 4
 * indent-tabs-mode: nil
 * End:
 */
