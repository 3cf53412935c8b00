// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <type_traits>
#include <utility>
#include "bitset.hpp"
#include "pin.hpp"
#include "rcc.hpp"
#include "stm32f103.hpp"

namespace pinstate {

    // peripheral instances: register block, clock gate, AFIO remap field
    struct SPI1 {
        static constexpr uint32_t base = SPI1_BASE;
        static constexpr RCC_REG enr = RCC_APB2ENR, rstr = RCC_APB2RSTR;
        static constexpr uint32_t bit = RCC_APB2ENR_SPI1EN;
        static constexpr uint32_t remap_mask = AFIO_MAPR_SPI1_REMAP;
    };

    struct SPI2 {
        static constexpr uint32_t base = SPI2_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_SPI2EN;
        static constexpr uint32_t remap_mask = 0;   // not remappable
    };

    struct SPI3 {
        static constexpr uint32_t base = SPI3_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_SPI3EN;
        static constexpr uint32_t remap_mask = 0;   // remap exists on connectivity line only
    };

    struct USART1 {
        static constexpr uint32_t base = USART1_BASE;
        static constexpr RCC_REG enr = RCC_APB2ENR, rstr = RCC_APB2RSTR;
        static constexpr uint32_t bit = RCC_APB2ENR_USART1EN;
        static constexpr uint32_t remap_mask = AFIO_MAPR_USART1_REMAP;
    };

    struct USART2 {
        static constexpr uint32_t base = USART2_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_USART2EN;
        static constexpr uint32_t remap_mask = AFIO_MAPR_USART2_REMAP;
    };

    struct USART3 {
        static constexpr uint32_t base = USART3_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_USART3EN;
        static constexpr uint32_t remap_mask = AFIO_MAPR_USART3_REMAP;
    };

    struct I2C1 {
        static constexpr uint32_t base = I2C1_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_I2C1EN;
        static constexpr uint32_t remap_mask = AFIO_MAPR_I2C1_REMAP;
    };

    struct I2C2 {
        static constexpr uint32_t base = I2C2_BASE;
        static constexpr RCC_REG enr = RCC_APB1ENR, rstr = RCC_APB1RSTR;
        static constexpr uint32_t bit = RCC_APB1ENR_I2C2EN;
        static constexpr uint32_t remap_mask = 0;
    };

    // peripheral signals; 'input' signals are sampled by the peripheral
    struct spi_sck  { static constexpr bool input = false; };
    struct spi_miso { static constexpr bool input = true; };
    struct spi_mosi { static constexpr bool input = false; };
    struct spi_nss  { static constexpr bool input = false; };

    // I2S shares the SPI lines: SD on MOSI, WS on NSS, CK on SCK; MCK is separate
    using i2s_sd = spi_mosi;
    using i2s_ws = spi_nss;
    using i2s_ck = spi_sck;
    struct i2s_mck  { static constexpr bool input = false; };

    struct usart_tx { static constexpr bool input = false; };
    struct usart_rx { static constexpr bool input = true; };

    struct i2c_scl  { static constexpr bool input = false; };
    struct i2c_sda  { static constexpr bool input = false; };

    // placeholder for an optional signal that is not wired
    struct no_pin {};

    template< uint8_t A > struct remap_t { static constexpr uint8_t remap = A; };

    // Line P{N} may carry SIGNAL of PERIPHERAL when AFIO is set to 'remap'.
    // Only the specializations below exist (RM0008 9.3, STM32F103xC/D/E datasheet Table 5).
    template< typename SIGNAL, typename PERIPHERAL, char P, uint8_t N > struct pin_a;

    template<> struct pin_a< spi_nss,  SPI1, 'A', 4 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_sck,  SPI1, 'A', 5 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_miso, SPI1, 'A', 6 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_mosi, SPI1, 'A', 7 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_nss,  SPI1, 'A', 15 > : remap_t< 1 > {};
    template<> struct pin_a< spi_sck,  SPI1, 'B', 3 >  : remap_t< 1 > {};
    template<> struct pin_a< spi_miso, SPI1, 'B', 4 >  : remap_t< 1 > {};
    template<> struct pin_a< spi_mosi, SPI1, 'B', 5 >  : remap_t< 1 > {};

    template<> struct pin_a< spi_nss,  SPI2, 'B', 12 > : remap_t< 0 > {};
    template<> struct pin_a< spi_sck,  SPI2, 'B', 13 > : remap_t< 0 > {};
    template<> struct pin_a< spi_miso, SPI2, 'B', 14 > : remap_t< 0 > {};
    template<> struct pin_a< spi_mosi, SPI2, 'B', 15 > : remap_t< 0 > {};
    template<> struct pin_a< i2s_mck,  SPI2, 'C', 6 >  : remap_t< 0 > {};

    template<> struct pin_a< spi_nss,  SPI3, 'A', 15 > : remap_t< 0 > {};
    template<> struct pin_a< spi_sck,  SPI3, 'B', 3 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_miso, SPI3, 'B', 4 >  : remap_t< 0 > {};
    template<> struct pin_a< spi_mosi, SPI3, 'B', 5 >  : remap_t< 0 > {};
    template<> struct pin_a< i2s_mck,  SPI3, 'C', 7 >  : remap_t< 0 > {};

    template<> struct pin_a< usart_tx, USART1, 'A', 9 >  : remap_t< 0 > {};
    template<> struct pin_a< usart_rx, USART1, 'A', 10 > : remap_t< 0 > {};
    template<> struct pin_a< usart_tx, USART1, 'B', 6 >  : remap_t< 1 > {};
    template<> struct pin_a< usart_rx, USART1, 'B', 7 >  : remap_t< 1 > {};

    template<> struct pin_a< usart_tx, USART2, 'A', 2 >  : remap_t< 0 > {};
    template<> struct pin_a< usart_rx, USART2, 'A', 3 >  : remap_t< 0 > {};
    template<> struct pin_a< usart_tx, USART2, 'D', 5 >  : remap_t< 1 > {};
    template<> struct pin_a< usart_rx, USART2, 'D', 6 >  : remap_t< 1 > {};

    template<> struct pin_a< usart_tx, USART3, 'B', 10 > : remap_t< 0 > {};
    template<> struct pin_a< usart_rx, USART3, 'B', 11 > : remap_t< 0 > {};
    template<> struct pin_a< usart_tx, USART3, 'C', 10 > : remap_t< 1 > {};  // partial remap
    template<> struct pin_a< usart_rx, USART3, 'C', 11 > : remap_t< 1 > {};
    template<> struct pin_a< usart_tx, USART3, 'D', 8 >  : remap_t< 3 > {};  // full remap
    template<> struct pin_a< usart_rx, USART3, 'D', 9 >  : remap_t< 3 > {};

    template<> struct pin_a< i2c_scl, I2C1, 'B', 6 >  : remap_t< 0 > {};
    template<> struct pin_a< i2c_sda, I2C1, 'B', 7 >  : remap_t< 0 > {};
    template<> struct pin_a< i2c_scl, I2C1, 'B', 8 >  : remap_t< 1 > {};
    template<> struct pin_a< i2c_sda, I2C1, 'B', 9 >  : remap_t< 1 > {};
    template<> struct pin_a< i2c_scl, I2C2, 'B', 10 > : remap_t< 0 > {};
    template<> struct pin_a< i2c_sda, I2C2, 'B', 11 > : remap_t< 0 > {};

    template< typename SIGNAL, typename PERIPHERAL, typename PIN, typename = void >
    struct is_pin_a : std::false_type {};

    template< typename SIGNAL, typename PERIPHERAL, char P, uint8_t N, typename MODE >
    struct is_pin_a< SIGNAL, PERIPHERAL, pin< P, N, MODE >
                     , std::void_t< decltype( pin_a< SIGNAL, PERIPHERAL, P, N >::remap ) > > : std::true_type {};

    // an unwired optional signal satisfies any relation
    template< typename SIGNAL, typename PERIPHERAL >
    struct is_pin_a< SIGNAL, PERIPHERAL, no_pin, void > : std::true_type {};

    // Commit a line to SIGNAL of PERIPHERAL.  The returned pin is tagged
    // alternate< remap >; output signals are alternate push-pull, input signals
    // floating inputs.  AFIO itself is written by the peripheral (set_remap).
    template< typename SIGNAL, typename PERIPHERAL, char P, uint8_t N, typename MODE >
    auto set_alt_mode( pin< P, N, MODE >&& p ) {
        static_assert( is_pin_a< SIGNAL, PERIPHERAL, pin< P, N, MODE > >::value, "line can not carry this signal" );
        constexpr uint8_t A = pin_a< SIGNAL, PERIPHERAL, P, N >::remap;
        if constexpr ( SIGNAL::input )
            return std::move( p ).template into_alternate_input< A >();
        else
            return std::move( p ).template into_alternate< A >();
    }

    template< typename SIGNAL, typename PERIPHERAL >
    no_pin set_alt_mode( no_pin&& ) { return no_pin{}; }

    // committed type of PIN for SIGNAL of PERIPHERAL
    template< typename SIGNAL, typename PERIPHERAL, typename PIN >
    using alt_pin_t = decltype( set_alt_mode< SIGNAL, PERIPHERAL >( std::declval< PIN&& >() ) );

    template< typename PERIPHERAL, typename PIN > struct remap_of { static constexpr uint8_t value = 0; };

    template< typename PERIPHERAL, char P, uint8_t N, uint8_t A, typename OTYPE >
    struct remap_of< PERIPHERAL, pin< P, N, alternate< A, OTYPE > > > { static constexpr uint8_t value = A; };

    // AFIO MAPR remap field of PERIPHERAL; AFIO clock is enabled on the way
    template< typename PERIPHERAL >
    void set_remap( uint8_t remap ) {
        if constexpr ( PERIPHERAL::remap_mask != 0 ) {
            rcc::enable( RCC_APB2ENR, RCC_APB2ENR_AFIOEN );
            uint32_t shift = 0;
            while ( ( ( PERIPHERAL::remap_mask >> shift ) & 01 ) == 0 )
                ++shift;
            bitset::assign( AFIO_BASE + AFIO_MAPR, PERIPHERAL::remap_mask, uint32_t( remap ) << shift );
        }
    }

}
