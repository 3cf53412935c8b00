// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "command_processor.hpp"
#include "pinstate/gpio_mode.hpp"
#include "pinstate/mmio.hpp"
#include "pinstate/stm32f103.hpp"
#include "pinstate/stream.hpp"

using namespace pinstate;

namespace {

    void list_port( char port, int first = 0, int last = 15 ) {
        const uint8_t index = uint8_t( port - 'A' );
        for ( int i = first; i <= last; ++i )
            stream() << "P" << port << int8_t( i ) << ":\t" << gpio_mode::toString( gpio_mode::get( index, uint8_t( i ) ) ) << endl;
    }

    void show_line( char port, int no ) {
        const uint8_t index = uint8_t( port - 'A' );
        const uint32_t base = gpio_base( index );
        const bool idr = mmio::read( base + GPIO_IDR ) & ( 1u << no );
        const bool odr = mmio::read( base + GPIO_ODR ) & ( 1u << no );
        stream() << "P" << port << int8_t( no ) << ":\t" << gpio_mode::toString( gpio_mode::get( index, uint8_t( no ) ) )
                 << " idr " << idr << " odr " << odr << endl;
    }
}

void
gpio_command( size_t argc, const char ** argv )
{
    if ( argc >= 2 ) {
        const char * pin = argv[1];
        if ( pin[0] == 'P' && ( 'A' <= pin[1] && pin[1] <= 'E' ) ) {
            if ( pin[2] == '\0' ) {
                list_port( pin[1] );
                return;
            }
            if ( pin[2] >= '0' && pin[2] <= '9' ) {
                const char * p = &pin[2];
                int no = *p++ - '0';
                if ( *p >= '0' && *p <= '9' )
                    no = no * 10 + *p++ - '0';
                if ( no < 16 && *p == '\0' ) {
                    show_line( pin[1], no );
                    return;
                }
            }
        }
        stream() << "gpio 2nd argment format mismatch" << endl;
    } else {
        list_port( 'A' );
        list_port( 'B' );
        list_port( 'C', 13, 15 );
        stream() << "gpio [P<port>[#]]" << endl;
    }
}
