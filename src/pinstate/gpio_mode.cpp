// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "gpio_mode.hpp"
#include "bitset.hpp"

namespace pinstate {

    void
    gpio_mode::set( uint8_t port, uint8_t pin, GPIO_CNF cnf, GPIO_MODE mode )
    {
        const uint32_t shift = gpio_mode::shift( pin );
        const uint32_t mask  = 0x0fu << shift;

        bitset::assign( address( port, pin ), mask, uint32_t( field( cnf, mode ) ) << shift );
    }

    uint8_t
    gpio_mode::get( uint8_t port, uint8_t pin )
    {
        const uint32_t shift = gpio_mode::shift( pin );
        const uint32_t mask  = 0x0fu << shift;

        return uint8_t( ( mmio::read( address( port, pin ) ) & mask ) >> shift );
    }

    void
    gpio_mode::speed( uint8_t port, uint8_t pin, GPIO_MODE mode )
    {
        const uint32_t shift = gpio_mode::shift( pin );

        bitset::assign( address( port, pin ), 0x03u << shift, uint32_t( mode ) << shift );
    }

    constexpr const char * __input_mode_string__ [] = {
        "GPIO_INPUT_ANALOG" // 0
        , "GPIO_INPUT_FLOATING" // = 1
        , "GPIO_INPUT_PUSH_PULL" // = 2
        , "n/a"
    };

    constexpr const char * __output_mode_string__ [] = {
        // 0x00 input input
        "n/a"                                         // 0,0
        , "GPIO_CNF_OUTPUT_PUSH_PULL,OUTPUT_10M"      // 0,1
        , "GPIO_CNF_OUTPUT_PUSH_PULL,OUTPUT_2M"       // 0,2
        , "GPIO_CNF_OUTPUT_PUSH_PULL,OUTPUT_50M"      // 0,3
        , "n/a"                                       // 1,0
        , "GPIO_CNF_OUTPUT_ODRAIN,OUTPUT_10M"         // 1,1
        , "GPIO_CNF_OUTPUT_ODRAIN,OUTPUT_2M"          // 1,2
        , "GPIO_CNF_OUTPUT_ODRAIN,OUTPUT_50M"         // 1,3
        , "n/a"                                       // 2,0
        , "GPIO_CNF_ALT_OUTPUT_PUSH_PULL,OUTPUT_10M"  // 2,1
        , "GPIO_CNF_ALT_OUTPUT_PUSH_PULL,OUTPUT_2M"   // 2,2
        , "GPIO_CNF_ALT_OUTPUT_PUSH_PULL,OUTPUT_50M"  // 2,3
        , "n/a"
        , "GPIO_CNF_ALT_OUTPUT_ODRAIN,OUTPUT_10M"     // 3,1
        , "GPIO_CNF_ALT_OUTPUT_ODRAIN,OUTPUT_2M"      // 3,2
        , "GPIO_CNF_ALT_OUTPUT_ODRAIN,OUTPUT_50M"     // 3,3
    };

    const char * gpio_mode::toString( uint8_t mode ) {
        if ( ( mode & 03 ) == 0 )
            return __input_mode_string__[ ( mode >> 2 ) & 0x03 ];
        else
            return __output_mode_string__[ mode & 0x0f ];
    }
}
