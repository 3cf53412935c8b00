// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <type_traits>
#include "gpio.hpp"
#include "gpio_mode.hpp"
#include "pin_mode.hpp"

namespace pinstate {

    // Data operations shared by pin, partially_erased_pin and erased_pin.
    // The derived class supplies port_id() and line(); each operation is
    // gated on MODE exactly as on the typed pin.
    template< typename Derived, typename MODE >
    class pin_io {

        template< typename M, template< typename > class capability >
        using requires_t = std::enable_if_t< std::is_same< M, MODE >::value && capability< M >::value >;

        const Derived& self() const { return static_cast< const Derived& >( *this ); }

    public:
        using mode_type = MODE;

        // output
        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        void set_high() { gpio::set( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        void set_low() { gpio::reset( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        void set_state( pin_state state ) { gpio::assign( self().port_id(), self().line(), state ); }

        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        void toggle() { gpio::toggle( self().port_id(), self().line() ); }

        // driven level (ODR)
        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        bool is_set_high() const { return gpio::output( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        bool is_set_low() const { return !gpio::output( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::writable > >
        pin_state get_state() const { return is_set_high() ? pin_state::high : pin_state::low; }

        // pad level (IDR)
        template< typename M = MODE, typename = requires_t< M, marker::readable > >
        bool is_high() const { return gpio::input( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::readable > >
        bool is_low() const { return !gpio::input( self().port_id(), self().line() ); }

        template< typename M = MODE, typename = requires_t< M, marker::speed > >
        void set_speed( GPIO_MODE speed ) { gpio_mode::speed( self().port_id(), self().line(), speed ); }

        template< typename M = MODE, typename = requires_t< M, marker::input > >
        void set_internal_resistor( pull resistor ) { apply_input( self().port_id(), self().line(), resistor ); }
    };

}
