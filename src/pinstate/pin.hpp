// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include "dynamic_pin.hpp"
#include "erased_pin.hpp"
#include "gpio.hpp"
#include "gpio_mode.hpp"
#include "pin_io.hpp"
#include "pin_mode.hpp"
#include "rcc.hpp"
#include "stm32f103.hpp"
#include "stream.hpp"

namespace pinstate {

    template< char P > class gpio_port;

    // P{A..E} line N in mode MODE.  Carries no data; the mode is part of the
    // type and every mode change consumes the pin (call on an rvalue) and
    // returns the pin typed with the new mode.
    template< char P, uint8_t N, typename MODE = input >
    class pin : public pin_io< pin< P, N, MODE >, MODE > {
        static_assert( 'A' <= P && P <= 'E', "port must be one of 'A'..'E'" );
        static_assert( N < gpio_line_count, "line must be 0..15" );

        pin() {}   // handles come from gpio_port<P> or a transition only

        template< char > friend class gpio_port;
        template< char, uint8_t, typename > friend class pin;

        // restores the configuration field when a with_mode() scope ends
        struct mode_guard {
            uint8_t field_;
            mode_guard() : field_( gpio_mode::get( port_id(), N ) ) {}
            ~mode_guard() { gpio_mode::set( port_id(), N, GPIO_CNF( field_ >> 2 ), GPIO_MODE( field_ & 03 ) ); }
        };

    public:
        pin( const pin& ) = delete;
        pin& operator = ( const pin& ) = delete;
        pin( pin&& ) = default;
        pin& operator = ( pin&& ) = default;

        static constexpr char port() { return P; }
        static constexpr uint8_t port_id() { return ::pinstate::port_id( P ); }
        static constexpr uint8_t line() { return N; }
        static constexpr uint32_t address() { return gpio_base( port_id() ); }

        template< typename NEW_MODE >
        pin< P, N, NEW_MODE > into_mode() && {
            apply_mode< NEW_MODE >( port_id(), N );
            return pin< P, N, NEW_MODE >();
        }

        pin< P, N, input > into_input( pull resistor ) && {
            apply_input( port_id(), N, resistor );
            return pin< P, N, input >();
        }

        pin< P, N, input > into_floating_input() && { return std::move( *this ).into_input( pull::none ); }
        pin< P, N, input > into_pull_up_input() && { return std::move( *this ).into_input( pull::up ); }
        pin< P, N, input > into_pull_down_input() && { return std::move( *this ).into_input( pull::down ); }

        pin< P, N, analog > into_analog() && { return std::move( *this ).template into_mode< analog >(); }

        pin< P, N, output< push_pull > > into_push_pull_output() && {
            return std::move( *this ).template into_mode< output< push_pull > >();
        }

        pin< P, N, output< open_drain > > into_open_drain_output() && {
            return std::move( *this ).template into_mode< output< open_drain > >();
        }

        // ODR is written before CNF/MODE, so the line comes up driving 'state'
        template< typename OTYPE >
        pin< P, N, output< OTYPE > > into_output_in_state( pin_state state ) && {
            gpio::assign( port_id(), N, state );
            return std::move( *this ).template into_mode< output< OTYPE > >();
        }

        pin< P, N, output< push_pull > > into_push_pull_output_in_state( pin_state state ) && {
            return std::move( *this ).template into_output_in_state< push_pull >( state );
        }

        pin< P, N, output< open_drain > > into_open_drain_output_in_state( pin_state state ) && {
            return std::move( *this ).template into_output_in_state< open_drain >( state );
        }

        template< uint8_t A >
        pin< P, N, alternate< A, push_pull > > into_alternate() && {
            return std::move( *this ).template into_mode< alternate< A, push_pull > >();
        }

        template< uint8_t A >
        pin< P, N, alternate< A, open_drain > > into_alternate_open_drain() && {
            return std::move( *this ).template into_mode< alternate< A, open_drain > >();
        }

        // peripheral inputs (RX, MISO) are floating inputs on this chip (RM0008 9.1.4)
        template< uint8_t A >
        pin< P, N, alternate< A, push_pull > > into_alternate_input() && {
            apply_input( port_id(), N, pull::none );
            return pin< P, N, alternate< A, push_pull > >();
        }

        // Reconfigure as TEMP for the duration of f( pin< P, N, TEMP >& ),
        // then restore the configuration field.  ODR is not restored.
        template< typename TEMP, typename F >
        decltype( auto ) with_mode( F&& f ) {
            mode_guard guard;
            apply_mode< TEMP >( port_id(), N );
            pin< P, N, TEMP > temporary;
            return std::forward< F >( f )( temporary );
        }

        partially_erased_pin< P, MODE > erase_number() && { return partially_erased_pin< P, MODE >( N ); }

        erased_pin< MODE > erase() && { return erased_pin< MODE >( port_id(), N ); }

        dynamic_pin< P, N > into_dynamic() && {
            static_assert( marker::dynamic< MODE >::value, "alternate function pins can not be made dynamic" );
            return dynamic_pin< P, N >( current_mode( port_id(), N ) );
        }
    };

    // Hands out the lines of a port, in their reset state (floating input).
    template< char P >
    class gpio_port {
        static std::atomic_flag once_flag_;
    public:
        struct parts {
            pin< P, 0 >  p0;  pin< P, 1 >  p1;  pin< P, 2 >  p2;  pin< P, 3 >  p3;
            pin< P, 4 >  p4;  pin< P, 5 >  p5;  pin< P, 6 >  p6;  pin< P, 7 >  p7;
            pin< P, 8 >  p8;  pin< P, 9 >  p9;  pin< P, 10 > p10; pin< P, 11 > p11;
            pin< P, 12 > p12; pin< P, 13 > p13; pin< P, 14 > p14; pin< P, 15 > p15;
        };

        // first caller gets the lines, later callers get nothing
        static std::optional< parts > split() {
            if ( once_flag_.test_and_set() ) {
                stream() << "gpio_port<" << P << ">::split: lines already taken" << endl;
                return std::nullopt;
            }
            return steal();
        }

        // bypasses the once flag; for bring-up code and tests that re-take a port
        static parts steal() {
            rcc::enable( RCC_APB2ENR, uint32_t( RCC_APB2ENR_IOPAEN ) << port_id( P ) );
            return parts{ pin< P, 0 >(),  pin< P, 1 >(),  pin< P, 2 >(),  pin< P, 3 >()
                        , pin< P, 4 >(),  pin< P, 5 >(),  pin< P, 6 >(),  pin< P, 7 >()
                        , pin< P, 8 >(),  pin< P, 9 >(),  pin< P, 10 >(), pin< P, 11 >()
                        , pin< P, 12 >(), pin< P, 13 >(), pin< P, 14 >(), pin< P, 15 >() };
        }
    };

    template< char P > std::atomic_flag gpio_port< P >::once_flag_ = ATOMIC_FLAG_INIT;

}
