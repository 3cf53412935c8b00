// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//


#pragma once

#include <cstdint>
#include "stm32f103.hpp"

namespace pinstate {

    // peripheral clock gating; frequencies are owned by the firmware clock setup
    class rcc {
    public:
        static void enable( RCC_REG enr, uint32_t bit );
        static void disable( RCC_REG enr, uint32_t bit );
        static void reset( RCC_REG rstr, uint32_t bit );   // pulse the reset bit
        static bool enabled( RCC_REG enr, uint32_t bit );

        template< typename PERIPHERAL > static void enable() { enable( PERIPHERAL::enr, PERIPHERAL::bit ); }
        template< typename PERIPHERAL > static void reset() { reset( PERIPHERAL::rstr, PERIPHERAL::bit ); }
    };

    enum RCC_APB1ENR_BITS : uint32_t {
        RCC_APB1ENR_TIM2EN    = 0x00000001
        , RCC_APB1ENR_TIM3EN    = 0x00000002
        , RCC_APB1ENR_TIM4EN    = 0x00000004
        , RCC_APB1ENR_SPI2EN    = 0x00004000
        , RCC_APB1ENR_SPI3EN    = 0x00008000
        , RCC_APB1ENR_USART2EN  = 0x00020000
        , RCC_APB1ENR_USART3EN  = 0x00040000
        , RCC_APB1ENR_I2C1EN    = 0x00200000
        , RCC_APB1ENR_I2C2EN    = 0x00400000
    };

    enum RCC_APB2ENR_BITS : uint32_t {
        RCC_APB2ENR_AFIOEN    = 0x00000001
        , RCC_APB2ENR_IOPAEN    = 0x00000004
        , RCC_APB2ENR_IOPBEN    = 0x00000008
        , RCC_APB2ENR_IOPCEN    = 0x00000010
        , RCC_APB2ENR_IOPDEN    = 0x00000020
        , RCC_APB2ENR_IOPEEN    = 0x00000040
        , RCC_APB2ENR_SPI1EN    = 0x00001000
        , RCC_APB2ENR_USART1EN  = 0x00004000
    };

}
