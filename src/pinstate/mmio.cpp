// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "mmio.hpp"
#include <cstdint>

namespace pinstate {

    uint32_t
    mmio::read( uint32_t address )
    {
        return *reinterpret_cast< volatile uint32_t * >( uintptr_t( address ) );
    }

    void
    mmio::write( uint32_t address, uint32_t value )
    {
        *reinterpret_cast< volatile uint32_t * >( uintptr_t( address ) ) = value;
    }

}
