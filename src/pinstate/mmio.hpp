// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>

namespace pinstate {

    // Every register access of the library goes through these two functions.
    // mmio.cpp binds them to the memory mapped peripherals; host builds link
    // a register file in its place.
    namespace mmio {
        uint32_t read( uint32_t address );
        void write( uint32_t address, uint32_t value );
    }

}
