// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <cstddef>
#include "stm32f103.hpp"

namespace pinstate {

    // CNF[1:0]|MODE[1:0] configuration field of a line, 4 bits per line in CRL (0..7) and CRH (8..15)
    class gpio_mode {
    public:
        static void set( uint8_t port, uint8_t pin, GPIO_CNF cnf, GPIO_MODE mode );
        static uint8_t get( uint8_t port, uint8_t pin );  // cnf << 2 | mode

        // rewrite MODE[1:0] only, CNF is kept
        static void speed( uint8_t port, uint8_t pin, GPIO_MODE mode );

        static constexpr uint8_t field( GPIO_CNF cnf, GPIO_MODE mode ) { return uint8_t( ( cnf << 2 ) | mode ); }
        static constexpr uint32_t address( uint8_t port, uint8_t pin ) { return gpio_base( port ) + ( pin < 8 ? GPIO_CRL : GPIO_CRH ); }
        static constexpr uint32_t shift( uint8_t pin ) { return ( pin % 8 ) * 4; }

        static const char * toString( uint8_t );
    };

}
