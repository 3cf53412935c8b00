// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "pin_mode.hpp"
#include "gpio.hpp"
#include "gpio_mode.hpp"

namespace pinstate {

    void
    apply_input( uint8_t port, uint8_t line, pull resistor )
    {
        switch ( resistor ) {
        case pull::none:
            gpio_mode::set( port, line, GPIO_CNF_INPUT_FLOATING, GPIO_MODE_INPUT );
            break;
        case pull::up:
            gpio::set( port, line );      // ODR selects the pull direction, set it before the switch
            gpio_mode::set( port, line, GPIO_CNF_INPUT_PUSH_PULL, GPIO_MODE_INPUT );
            break;
        case pull::down:
            gpio::reset( port, line );
            gpio_mode::set( port, line, GPIO_CNF_INPUT_PUSH_PULL, GPIO_MODE_INPUT );
            break;
        }
    }

    dynamic_mode
    current_mode( uint8_t port, uint8_t line )
    {
        const uint8_t field = gpio_mode::get( port, line );
        const uint8_t cnf = ( field >> 2 ) & 03;

        if ( ( field & 03 ) == GPIO_MODE_INPUT ) {
            switch ( cnf ) {
            case GPIO_CNF_INPUT_ANALOG:
                return dynamic_mode::analog;
            case GPIO_CNF_INPUT_PUSH_PULL:
                return gpio::output( port, line ) ? dynamic_mode::input_pull_up : dynamic_mode::input_pull_down;
            default:
                return dynamic_mode::input_floating;  // 0b11 is reserved
            }
        }
        // alternate function outputs have no runtime counterpart; report the driver
        return ( cnf & 01 ) ? dynamic_mode::output_open_drain : dynamic_mode::output_push_pull;
    }

    void
    apply_mode( uint8_t port, uint8_t line, dynamic_mode mode )
    {
        switch ( mode ) {
        case dynamic_mode::input_floating:
            apply_input( port, line, pull::none );
            break;
        case dynamic_mode::input_pull_up:
            apply_input( port, line, pull::up );
            break;
        case dynamic_mode::input_pull_down:
            apply_input( port, line, pull::down );
            break;
        case dynamic_mode::output_push_pull:
            apply_mode< output< push_pull > >( port, line );
            break;
        case dynamic_mode::output_open_drain:
            apply_mode< output< open_drain > >( port, line );
            break;
        case dynamic_mode::analog:
            apply_mode< analog >( port, line );
            break;
        }
    }

}
