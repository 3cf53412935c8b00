// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <system_error>
#include <type_traits>
#include <utility>
#include "dynamic_pin.hpp"
#include "erased_pin.hpp"
#include "gpio.hpp"
#include "pin.hpp"
#include "pin_mode.hpp"

namespace pinstate {

    // Uniform digital I/O over every handle kind.  'fallible' tells whether the
    // error_code returned by the digital:: functions can ever be set.
    template< typename T > struct digital_io {};

    template< char P, uint8_t N, typename MODE >
    struct digital_io< pin< P, N, MODE > > { static constexpr bool fallible = false; };

    template< char P, typename MODE >
    struct digital_io< partially_erased_pin< P, MODE > > { static constexpr bool fallible = false; };

    template< typename MODE >
    struct digital_io< erased_pin< MODE > > { static constexpr bool fallible = false; };

    template< char P, uint8_t N >
    struct digital_io< dynamic_pin< P, N > > { static constexpr bool fallible = true; };

    namespace digital {

        template< typename T >
        auto set_high( T& p ) -> decltype( digital_io< T >::fallible, p.set_high(), std::error_code() ) {
            if constexpr ( digital_io< T >::fallible ) {
                return p.set_high();
            } else {
                p.set_high();
                return {};
            }
        }

        template< typename T >
        auto set_low( T& p ) -> decltype( digital_io< T >::fallible, p.set_low(), std::error_code() ) {
            if constexpr ( digital_io< T >::fallible ) {
                return p.set_low();
            } else {
                p.set_low();
                return {};
            }
        }

        template< typename T >
        auto set_state( T& p, pin_state state ) -> decltype( digital_io< T >::fallible, p.set_state( state ), std::error_code() ) {
            if constexpr ( digital_io< T >::fallible ) {
                return p.set_state( state );
            } else {
                p.set_state( state );
                return {};
            }
        }

        template< typename T >
        auto toggle( T& p ) -> decltype( digital_io< T >::fallible, p.toggle(), std::error_code() ) {
            if constexpr ( digital_io< T >::fallible ) {
                return p.toggle();
            } else {
                p.toggle();
                return {};
            }
        }

        // pad level
        template< typename T >
        auto is_high( const T& p, bool& level )
            -> std::enable_if_t< !digital_io< T >::fallible, decltype( bool( p.is_high() ), std::error_code() ) > {
            level = p.is_high();
            return {};
        }

        template< typename T >
        auto is_high( const T& p, bool& level ) -> std::enable_if_t< digital_io< T >::fallible, decltype( p.is_high( level ) ) > {
            return p.is_high( level );
        }

        template< typename T >
        auto is_low( const T& p, bool& level )
            -> std::enable_if_t< !digital_io< T >::fallible, decltype( bool( p.is_low() ), std::error_code() ) > {
            level = p.is_low();
            return {};
        }

        template< typename T >
        auto is_low( const T& p, bool& level ) -> std::enable_if_t< digital_io< T >::fallible, decltype( p.is_low( level ) ) > {
            return p.is_low( level );
        }

        // driven level
        template< typename T >
        auto is_set_high( const T& p, bool& level )
            -> std::enable_if_t< !digital_io< T >::fallible, decltype( bool( p.is_set_high() ), std::error_code() ) > {
            level = p.is_set_high();
            return {};
        }

        template< typename T >
        auto is_set_high( const T& p, bool& level ) -> std::enable_if_t< digital_io< T >::fallible, decltype( p.is_set_high( level ) ) > {
            return p.is_set_high( level );
        }

        template< typename T >
        auto is_set_low( const T& p, bool& level )
            -> std::enable_if_t< !digital_io< T >::fallible, decltype( bool( p.is_set_low() ), std::error_code() ) > {
            level = p.is_set_low();
            return {};
        }

        template< typename T >
        auto is_set_low( const T& p, bool& level ) -> std::enable_if_t< digital_io< T >::fallible, decltype( p.is_set_low( level ) ) > {
            return p.is_set_low( level );
        }

        //////// input/output interchange ////////
        // An open-drain output is readable as it is and is handed back unchanged.
        // Into output, the level goes to ODR before the driver is switched on.

        template< char P, uint8_t N >
        pin< P, N, input > into_input_pin( pin< P, N, output< push_pull > >&& p ) {
            return std::move( p ).into_floating_input();
        }

        template< char P, uint8_t N >
        pin< P, N, output< open_drain > > into_input_pin( pin< P, N, output< open_drain > >&& p ) {
            return std::move( p );
        }

        template< typename OTYPE = push_pull, char P, uint8_t N >
        pin< P, N, output< OTYPE > > into_output_pin( pin< P, N, input >&& p, pin_state state ) {
            return std::move( p ).template into_output_in_state< OTYPE >( state );
        }

        template< typename OTYPE = push_pull, char P, uint8_t N, typename FROM >
        pin< P, N, output< OTYPE > > into_output_pin( pin< P, N, output< FROM > >&& p, pin_state state ) {
            if constexpr ( std::is_same< OTYPE, FROM >::value ) {
                p.set_state( state );
                return std::move( p );
            } else {
                return std::move( p ).template into_output_in_state< OTYPE >( state );
            }
        }

        template< char P >
        partially_erased_pin< P, input > into_input_pin( partially_erased_pin< P, output< push_pull > >&& p ) {
            return std::move( p ).into_floating_input();
        }

        template< char P >
        partially_erased_pin< P, output< open_drain > > into_input_pin( partially_erased_pin< P, output< open_drain > >&& p ) {
            return std::move( p );
        }

        template< typename OTYPE = push_pull, char P >
        partially_erased_pin< P, output< OTYPE > > into_output_pin( partially_erased_pin< P, input >&& p, pin_state state ) {
            return std::move( p ).template into_output_in_state< OTYPE >( state );
        }

        template< typename OTYPE = push_pull, char P, typename FROM >
        partially_erased_pin< P, output< OTYPE > > into_output_pin( partially_erased_pin< P, output< FROM > >&& p, pin_state state ) {
            if constexpr ( std::is_same< OTYPE, FROM >::value ) {
                p.set_state( state );
                return std::move( p );
            } else {
                return std::move( p ).template into_output_in_state< OTYPE >( state );
            }
        }

        inline erased_pin< input > into_input_pin( erased_pin< output< push_pull > >&& p ) {
            return std::move( p ).into_floating_input();
        }

        inline erased_pin< output< open_drain > > into_input_pin( erased_pin< output< open_drain > >&& p ) {
            return std::move( p );
        }

        template< typename OTYPE = push_pull >
        erased_pin< output< OTYPE > > into_output_pin( erased_pin< input >&& p, pin_state state ) {
            return std::move( p ).template into_output_in_state< OTYPE >( state );
        }

        template< typename OTYPE = push_pull, typename FROM >
        erased_pin< output< OTYPE > > into_output_pin( erased_pin< output< FROM > >&& p, pin_state state ) {
            if constexpr ( std::is_same< OTYPE, FROM >::value ) {
                p.set_state( state );
                return std::move( p );
            } else {
                return std::move( p ).template into_output_in_state< OTYPE >( state );
            }
        }
    }

}
