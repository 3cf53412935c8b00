// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include "mmio.hpp"
#include "stm32f103.hpp"

namespace pinstate {

    enum class pin_state : uint8_t { low, high };

    // data register access for one line; port is the index (0 := 'A')
    struct gpio {
        static inline void set( uint8_t port, uint8_t n ) {
            mmio::write( gpio_base( port ) + GPIO_BSRR, 1u << n );
        }

        static inline void reset( uint8_t port, uint8_t n ) {
            mmio::write( gpio_base( port ) + GPIO_BRR, 1u << n );
        }

        static inline void assign( uint8_t port, uint8_t n, pin_state state ) {
            if ( state == pin_state::high )
                set( port, n );
            else
                reset( port, n );
        }

        // one BSRR write, BS or BR half selected by the current ODR bit
        static inline void toggle( uint8_t port, uint8_t n ) {
            const uint32_t mask = 1u << n;
            const uint32_t odr = mmio::read( gpio_base( port ) + GPIO_ODR );
            mmio::write( gpio_base( port ) + GPIO_BSRR, ( odr & mask ) ? ( mask << 16 ) : mask );
        }

        // driven level
        static inline bool output( uint8_t port, uint8_t n ) {
            return mmio::read( gpio_base( port ) + GPIO_ODR ) & ( 1u << n );
        }

        // pad level
        static inline bool input( uint8_t port, uint8_t n ) {
            return mmio::read( gpio_base( port ) + GPIO_IDR ) & ( 1u << n );
        }
    };
}
