// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>
#include "pin_a.hpp"
#include "rcc.hpp"
#include "stream.hpp"

namespace pinstate {

    // I2S is only implemented on SPI2 and SPI3 of the high-density parts
    template< typename SPIX > struct has_i2s : std::false_type {};
    template<> struct has_i2s< SPI2 > : std::true_type {};
    template<> struct has_i2s< SPI3 > : std::true_type {};

    namespace detail {
        // base of i2s, so the clock is up before any member (pin) is committed
        template< typename SPIX >
        struct spi_clock {
            spi_clock() {
                rcc::enable< SPIX >();
                rcc::reset< SPIX >();
            }
        };
    }

    // SPIX in I2S mode holding its WS, CK, MCK and SD lines.  MCK may be no_pin.
    // The peripheral is enabled and reset but not configured.
    template< typename SPIX, typename WS, typename CK, typename MCK, typename SD >
    class i2s : detail::spi_clock< SPIX > {
        static_assert( has_i2s< SPIX >::value, "peripheral has no I2S mode" );
    public:
        using ws_type  = alt_pin_t< i2s_ws,  SPIX, WS >;
        using ck_type  = alt_pin_t< i2s_ck,  SPIX, CK >;
        using mck_type = alt_pin_t< i2s_mck, SPIX, MCK >;
        using sd_type  = alt_pin_t< i2s_sd,  SPIX, SD >;

        static constexpr uint8_t remap = remap_of< SPIX, ws_type >::value;
        static_assert( remap == remap_of< SPIX, ck_type >::value && remap == remap_of< SPIX, sd_type >::value
                       , "WS, CK and SD belong to different remaps" );

    private:
        ws_type ws_;
        ck_type ck_;
        mck_type mck_;
        sd_type sd_;
        uint32_t input_clock_;

    public:
        i2s( WS&& ws, CK&& ck, MCK&& mck, SD&& sd, uint32_t input_clock )
            : ws_( set_alt_mode< i2s_ws, SPIX >( std::move( ws ) ) )
            , ck_( set_alt_mode< i2s_ck, SPIX >( std::move( ck ) ) )
            , mck_( set_alt_mode< i2s_mck, SPIX >( std::move( mck ) ) )
            , sd_( set_alt_mode< i2s_sd, SPIX >( std::move( sd ) ) )
            , input_clock_( input_clock ) {
            set_remap< SPIX >( remap );
            stream() << "i2s: SPI 0x" << SPIX::base << " input clock " << int32_t( input_clock_ ) << "Hz" << endl;
        }

        i2s( const i2s& ) = delete;
        i2s& operator = ( const i2s& ) = delete;
        i2s( i2s&& ) = default;

        // frequency of the clock feeding the I2S prescaler
        uint32_t input_clock() const { return input_clock_; }

        static constexpr uint32_t address() { return SPIX::base; }

        std::tuple< ws_type, ck_type, mck_type, sd_type > release() && {
            return std::tuple< ws_type, ck_type, mck_type, sd_type >( std::move( ws_ ), std::move( ck_ ), std::move( mck_ ), std::move( sd_ ) );
        }
    };

    template< typename SPIX, typename WS, typename CK, typename MCK, typename SD >
    i2s< SPIX, WS, CK, MCK, SD > make_i2s( WS&& ws, CK&& ck, MCK&& mck, SD&& sd, uint32_t input_clock ) {
        static_assert( !std::is_lvalue_reference< WS >::value && !std::is_lvalue_reference< CK >::value
                       && !std::is_lvalue_reference< MCK >::value && !std::is_lvalue_reference< SD >::value
                       , "pins are handed over with std::move" );
        return i2s< SPIX, WS, CK, MCK, SD >( std::move( ws ), std::move( ck ), std::move( mck ), std::move( sd ), input_clock );
    }

}
