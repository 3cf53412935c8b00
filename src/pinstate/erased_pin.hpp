// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <utility>
#include "gpio.hpp"
#include "pin_io.hpp"
#include "pin_mode.hpp"
#include "stm32f103.hpp"

namespace pinstate {

    template< char P, uint8_t N, typename MODE > class pin;
    template< typename MODE > class erased_pin;

    // Port is fixed at compile time, the line number is a runtime byte.
    // Lets code be generic over "any line of port P" in a given mode.
    template< char P, typename MODE >
    class partially_erased_pin : public pin_io< partially_erased_pin< P, MODE >, MODE > {
        static_assert( 'A' <= P && P <= 'E', "port must be one of 'A'..'E'" );

        uint8_t i_;

        explicit partially_erased_pin( uint8_t i ) : i_( i ) {}

        template< char, uint8_t, typename > friend class pin;
        template< char, typename > friend class partially_erased_pin;
    public:
        partially_erased_pin( const partially_erased_pin& ) = delete;
        partially_erased_pin& operator = ( const partially_erased_pin& ) = delete;
        partially_erased_pin( partially_erased_pin&& ) = default;
        partially_erased_pin& operator = ( partially_erased_pin&& ) = default;

        static constexpr char port() { return P; }
        static constexpr uint8_t port_id() { return ::pinstate::port_id( P ); }
        uint8_t line() const { return i_; }
        static constexpr uint32_t address() { return gpio_base( port_id() ); }

        template< typename NEW_MODE >
        partially_erased_pin< P, NEW_MODE > into_mode() && {
            apply_mode< NEW_MODE >( port_id(), i_ );
            return partially_erased_pin< P, NEW_MODE >( i_ );
        }

        partially_erased_pin< P, input > into_floating_input() && { return std::move( *this ).into_input( pull::none ); }
        partially_erased_pin< P, input > into_pull_up_input() && { return std::move( *this ).into_input( pull::up ); }
        partially_erased_pin< P, input > into_pull_down_input() && { return std::move( *this ).into_input( pull::down ); }

        partially_erased_pin< P, input > into_input( pull resistor ) && {
            apply_input( port_id(), i_, resistor );
            return partially_erased_pin< P, input >( i_ );
        }

        partially_erased_pin< P, analog > into_analog() && { return std::move( *this ).template into_mode< analog >(); }

        partially_erased_pin< P, output< push_pull > > into_push_pull_output() && {
            return std::move( *this ).template into_mode< output< push_pull > >();
        }

        partially_erased_pin< P, output< open_drain > > into_open_drain_output() && {
            return std::move( *this ).template into_mode< output< open_drain > >();
        }

        // level is latched into ODR before the driver is enabled
        template< typename OTYPE >
        partially_erased_pin< P, output< OTYPE > > into_output_in_state( pin_state state ) && {
            gpio::assign( port_id(), i_, state );
            return std::move( *this ).template into_mode< output< OTYPE > >();
        }

        erased_pin< MODE > erase() && { return erased_pin< MODE >( port_id(), i_ ); }
    };

    // Port and line are both runtime bytes; pins of different ports in the
    // same mode share this type and can live in one container.
    template< typename MODE >
    class erased_pin : public pin_io< erased_pin< MODE >, MODE > {
        uint8_t port_;
        uint8_t i_;

        erased_pin( uint8_t port, uint8_t i ) : port_( port ), i_( i ) {}

        template< char, uint8_t, typename > friend class pin;
        template< char, typename > friend class partially_erased_pin;
        template< typename > friend class erased_pin;
    public:
        erased_pin( const erased_pin& ) = delete;
        erased_pin& operator = ( const erased_pin& ) = delete;
        erased_pin( erased_pin&& ) = default;
        erased_pin& operator = ( erased_pin&& ) = default;

        char port() const { return port_name( port_ ); }
        uint8_t port_id() const { return port_; }
        uint8_t line() const { return i_; }
        uint32_t address() const { return gpio_base( port_ ); }

        template< typename NEW_MODE >
        erased_pin< NEW_MODE > into_mode() && {
            apply_mode< NEW_MODE >( port_, i_ );
            return erased_pin< NEW_MODE >( port_, i_ );
        }

        erased_pin< input > into_floating_input() && { return std::move( *this ).into_input( pull::none ); }
        erased_pin< input > into_pull_up_input() && { return std::move( *this ).into_input( pull::up ); }
        erased_pin< input > into_pull_down_input() && { return std::move( *this ).into_input( pull::down ); }

        erased_pin< input > into_input( pull resistor ) && {
            apply_input( port_, i_, resistor );
            return erased_pin< input >( port_, i_ );
        }

        erased_pin< analog > into_analog() && { return std::move( *this ).template into_mode< analog >(); }

        erased_pin< output< push_pull > > into_push_pull_output() && {
            return std::move( *this ).template into_mode< output< push_pull > >();
        }

        erased_pin< output< open_drain > > into_open_drain_output() && {
            return std::move( *this ).template into_mode< output< open_drain > >();
        }

        template< typename OTYPE >
        erased_pin< output< OTYPE > > into_output_in_state( pin_state state ) && {
            gpio::assign( port_, i_, state );
            return std::move( *this ).template into_mode< output< OTYPE > >();
        }
    };

}
