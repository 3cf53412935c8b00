// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <system_error>
#include "gpio.hpp"
#include "pin_error.hpp"
#include "pin_mode.hpp"
#include "stm32f103.hpp"

namespace pinstate {

    template< char P, uint8_t N, typename MODE > class pin;

    // A line whose mode is only known at runtime. Every guarded operation
    // checks the stored mode first and returns pin_errc::mode_mismatch
    // without touching a register when the mode does not allow it.
    template< char P, uint8_t N >
    class dynamic_pin {
        static_assert( 'A' <= P && P <= 'E', "port must be one of 'A'..'E'" );
        static_assert( N < gpio_line_count, "line must be 0..15" );

        dynamic_mode mode_;

        explicit dynamic_pin( dynamic_mode mode ) : mode_( mode ) {}

        template< char, uint8_t, typename > friend class pin;
    public:
        dynamic_pin( const dynamic_pin& ) = delete;
        dynamic_pin& operator = ( const dynamic_pin& ) = delete;
        dynamic_pin( dynamic_pin&& ) = default;
        dynamic_pin& operator = ( dynamic_pin&& ) = default;

        static constexpr char port() { return P; }
        static constexpr uint8_t port_id() { return ::pinstate::port_id( P ); }
        static constexpr uint8_t line() { return N; }
        static constexpr uint32_t address() { return gpio_base( port_id() ); }

        dynamic_mode mode() const { return mode_; }

        // reconfiguration always succeeds
        void set_mode( dynamic_mode mode ) {
            apply_mode( port_id(), N, mode );
            mode_ = mode;
        }

        void make_floating_input()   { set_mode( dynamic_mode::input_floating ); }
        void make_pull_up_input()    { set_mode( dynamic_mode::input_pull_up ); }
        void make_pull_down_input()  { set_mode( dynamic_mode::input_pull_down ); }
        void make_push_pull_output() { set_mode( dynamic_mode::output_push_pull ); }
        void make_open_drain_output() { set_mode( dynamic_mode::output_open_drain ); }
        void make_analog()           { set_mode( dynamic_mode::analog ); }

        void make_push_pull_output_in_state( pin_state state ) {
            gpio::assign( port_id(), N, state );
            set_mode( dynamic_mode::output_push_pull );
        }

        void make_open_drain_output_in_state( pin_state state ) {
            gpio::assign( port_id(), N, state );
            set_mode( dynamic_mode::output_open_drain );
        }

        std::error_code set_high() { return set_state( pin_state::high ); }
        std::error_code set_low()  { return set_state( pin_state::low ); }

        std::error_code set_state( pin_state state ) {
            if ( !is_output( mode_ ) )
                return pin_errc::mode_mismatch;
            gpio::assign( port_id(), N, state );
            return {};
        }

        std::error_code toggle() {
            if ( !is_output( mode_ ) )
                return pin_errc::mode_mismatch;
            gpio::toggle( port_id(), N );
            return {};
        }

        std::error_code is_high( bool& level ) const {
            if ( !is_readable( mode_ ) )
                return pin_errc::mode_mismatch;
            level = gpio::input( port_id(), N );
            return {};
        }

        std::error_code is_low( bool& level ) const {
            auto ec = is_high( level );
            if ( !ec )
                level = !level;
            return ec;
        }

        std::error_code is_set_high( bool& level ) const {
            if ( !is_output( mode_ ) )
                return pin_errc::mode_mismatch;
            level = gpio::output( port_id(), N );
            return {};
        }

        std::error_code is_set_low( bool& level ) const {
            auto ec = is_set_high( level );
            if ( !ec )
                level = !level;
            return ec;
        }
    };

}
