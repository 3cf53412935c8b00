// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include "mmio.hpp"
#include <cstdint>

namespace pinstate {

    // read-modify-write on a register address
    struct bitset {
        inline static void set( uint32_t address, uint32_t mask ) {  mmio::write( address, mmio::read( address ) | mask );  }
        inline static void reset( uint32_t address, uint32_t mask ) {  mmio::write( address, mmio::read( address ) & ~mask );  }
        inline static bool test( uint32_t address, uint32_t mask ) {  return ( mmio::read( address ) & mask ) == mask; }

        // replace the field selected by mask with value (already shifted)
        inline static void assign( uint32_t address, uint32_t mask, uint32_t value ) {
            mmio::write( address, ( mmio::read( address ) & ~mask ) | ( value & mask ) );
        }
    };

}
