// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <type_traits>
#include "config.hpp"
#include "gpio_mode.hpp"
#include "stm32f103.hpp"

namespace pinstate {

    // output driver
    struct push_pull {};
    struct open_drain {};

    // electrical configuration of a line; used as template arguments only
    struct input {};
    struct analog {};
    template< typename OTYPE = push_pull > struct output {};
    template< uint8_t A, typename OTYPE = push_pull > struct alternate {};   // A := AFIO remap of the claiming peripheral

    enum class pull : uint8_t { none, up, down };

    // runtime counterpart of the tags, used by dynamic_pin
    enum class dynamic_mode : uint8_t {
        input_floating
        , input_pull_up
        , input_pull_down
        , output_push_pull
        , output_open_drain
        , analog
    };

    constexpr bool is_output( dynamic_mode mode ) {
        return mode == dynamic_mode::output_push_pull || mode == dynamic_mode::output_open_drain;
    }

    constexpr bool is_input( dynamic_mode mode ) {
        return mode == dynamic_mode::input_floating
            || mode == dynamic_mode::input_pull_up
            || mode == dynamic_mode::input_pull_down;
    }

    // digital read is defined for inputs and for both output drivers (pad readback)
    constexpr bool is_readable( dynamic_mode mode ) {
        return is_input( mode ) || is_output( mode );
    }

    namespace marker {

        template< typename MODE > struct readable : std::false_type {};
        template<> struct readable< input > : std::true_type {};
        template<> struct readable< output< open_drain > > : std::true_type {};

        template< typename MODE > struct writable : std::false_type {};
        template< typename OTYPE > struct writable< output< OTYPE > > : std::true_type {};

        template< typename MODE > struct alternate : std::false_type {};
        template< uint8_t A, typename OTYPE > struct alternate< pinstate::alternate< A, OTYPE > > : std::true_type {};

        template< typename MODE > struct input : std::is_same< MODE, pinstate::input > {};

        // MODE[1:0] carries an output speed
        template< typename MODE > struct speed : std::integral_constant< bool, writable< MODE >::value || alternate< MODE >::value > {};

        // the exact mode tag is known; everything but alternate functions can be tracked at runtime
        template< typename MODE > struct dynamic : std::integral_constant< bool, !alternate< MODE >::value > {};
    }

    // configuration field of each mode tag
    template< typename MODE > struct pin_mode;

    template<> struct pin_mode< input > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_INPUT_FLOATING;
        static constexpr GPIO_MODE mode = GPIO_MODE_INPUT;
    };

    template<> struct pin_mode< analog > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_INPUT_ANALOG;
        static constexpr GPIO_MODE mode = GPIO_MODE_INPUT;
    };

    template<> struct pin_mode< output< push_pull > > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_OUTPUT_PUSH_PULL;
        static constexpr GPIO_MODE mode = config::output_speed;
    };

    template<> struct pin_mode< output< open_drain > > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_OUTPUT_ODRAIN;
        static constexpr GPIO_MODE mode = config::output_speed;
    };

    template< uint8_t A > struct pin_mode< alternate< A, push_pull > > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_ALT_OUTPUT_PUSH_PULL;
        static constexpr GPIO_MODE mode = config::output_speed;
    };

    template< uint8_t A > struct pin_mode< alternate< A, open_drain > > {
        static constexpr GPIO_CNF cnf   = GPIO_CNF_ALT_OUTPUT_ODRAIN;
        static constexpr GPIO_MODE mode = config::output_speed;
    };

    template< typename MODE >
    inline void apply_mode( uint8_t port, uint8_t line ) {
        gpio_mode::set( port, line, pin_mode< MODE >::cnf, pin_mode< MODE >::mode );
    }

    // floating/pull-up/pull-down input; the pull direction is the ODR bit
    void apply_input( uint8_t port, uint8_t line, pull );

    // what the hardware is configured as right now
    dynamic_mode current_mode( uint8_t port, uint8_t line );

    void apply_mode( uint8_t port, uint8_t line, dynamic_mode );

}
