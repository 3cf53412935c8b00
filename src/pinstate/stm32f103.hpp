// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>

namespace pinstate {  // as known as Blue Pill

    enum PERIPHERAL_BASE : uint32_t {
        PERIPH_BASE       = 0x40000000
        , RCC_BASE        = 0x40021000 // ( AHBPERIPH_BASE + 0x1000 )  //   RCC base address is 0x40021000
        , APB2PERIPH_BASE = 0x40010000 // ( PERIPH_BASE + 0x10000 )
        , AFIO_BASE       = 0x40010000 // ( APB2PERIPH_BASE + 0x0000 ) //  AFIO base address is 0x40010000
        , FLASH_BASE      = 0x40022000 // flash memory interface
    };

    enum FLASH_REG : uint32_t {
        FLASH_ACR = 0x00
    };

    enum GPIO_BASE : uint32_t {
        GPIOA_BASE	      = ( APB2PERIPH_BASE + 0x0800 ) // GPIOA base address is 0x40010800
        , GPIOB_BASE      = ( APB2PERIPH_BASE + 0x0c00 ) // GPIOB base address is 0x40010C00
        , GPIOC_BASE      = ( APB2PERIPH_BASE + 0x1000 ) // GPIOC base address is 0x40011000
        , GPIOD_BASE      = ( APB2PERIPH_BASE + 0x1400 ) // GPIOD base address is 0x40011400
        , GPIOE_BASE      = ( APB2PERIPH_BASE + 0x1800 ) // GPIOE base address is 0x40011800
    };

    // each port occupies 0x400 bytes, A..E are contiguous (RM0008 Table 3)
    constexpr uint32_t gpio_port_stride = 0x400;
    constexpr uint8_t gpio_port_count   = 5;
    constexpr uint8_t gpio_line_count   = 16;

    constexpr uint8_t port_id( char port ) { return uint8_t( port - 'A' ); }
    constexpr char port_name( uint8_t index ) { return char( 'A' + index ); }
    constexpr uint32_t gpio_base( uint8_t index ) { return GPIOA_BASE + index * gpio_port_stride; }

    enum USART_BASE : uint32_t {
        USART1_BASE	      = 0x40013800
        , USART2_BASE      = 0x40004400
        , USART3_BASE      = 0x40004800
    };

    enum SPI_BASE : uint32_t { // p51, Table 3
        SPI1_BASE	    = 0x40013000
        , SPI2_BASE     = 0x40003800
        , SPI3_BASE	    = 0x40003c00
    };

    enum I2C_BASE : uint32_t {  // p51, Table 3
        I2C1_BASE	    = 0x40005400  // 0x4000 5400 - 0x4000 57FF,
        , I2C2_BASE	    = 0x40005800  // 0x4000 5800 - 0x4000 5BFF
    };

    enum GPIO_CNF {
        GPIO_CNF_OUTPUT_PUSH_PULL = 0
        , GPIO_CNF_OUTPUT_ODRAIN  = 1
        , GPIO_CNF_ALT_OUTPUT_PUSH_PULL = 2
        , GPIO_CNF_ALT_OUTPUT_ODRAIN = 3
        , GPIO_CNF_INPUT_ANALOG = 0
        , GPIO_CNF_INPUT_FLOATING = 1
        , GPIO_CNF_INPUT_PUSH_PULL = 2    // pull-up/pull-down, selected by ODR
    };

    enum GPIO_MODE {
        GPIO_MODE_INPUT        = 0
        , GPIO_MODE_OUTPUT_10M = 1
        , GPIO_MODE_OUTPUT_2M  = 2
        , GPIO_MODE_OUTPUT_50M  = 3
    };

    // register offsets; each I/O port registers have to be accessed as 32bit words. (reference manual pp158/1133)
    enum GPIO_REG : uint32_t {
        GPIO_CRL    = 0x00   // port configuration register low
        , GPIO_CRH  = 0x04   // port configuration register high
        , GPIO_IDR  = 0x08   // input data register
        , GPIO_ODR  = 0x0c   // output data register
        , GPIO_BSRR = 0x10   // bit set/reset register
        , GPIO_BRR  = 0x14   // bit reset register
        , GPIO_LCKR = 0x18   // configuration lock register
    };

    enum AFIO_REG : uint32_t {
        AFIO_EVCR   = 0x00
        , AFIO_MAPR = 0x04
    };

    enum AFIO_MAPR_BITS : uint32_t { // 9.4.2 p184 RM0008
        AFIO_MAPR_SPI1_REMAP       = 0x00000001
        , AFIO_MAPR_I2C1_REMAP     = 0x00000002
        , AFIO_MAPR_USART1_REMAP   = 0x00000004
        , AFIO_MAPR_USART2_REMAP   = 0x00000008
        , AFIO_MAPR_USART3_REMAP   = 0x00000030 // 2 bits, 01 := partial remap
        , AFIO_MAPR_SWJ_CFG        = 0x07000000 // write only, reads back as zero
    };

    enum RCC_REG : uint32_t {
        RCC_CR         = 0x00
        , RCC_CFGR     = 0x04
        , RCC_APB2RSTR = 0x0c
        , RCC_APB1RSTR = 0x10
        , RCC_AHBENR   = 0x14
        , RCC_APB2ENR  = 0x18
        , RCC_APB1ENR  = 0x1c
    };

    enum SPI_REG : uint32_t {
        SPI_CR1       = 0x00
        , SPI_CR2     = 0x04
        , SPI_SR      = 0x08
        , SPI_DR      = 0x0c
        , SPI_I2SCFGR = 0x1c   // {b11 (0=SPI, 1=I2S)}
        , SPI_I2SPR   = 0x20
    };

    enum USART_REG : uint32_t {
        USART_SR     = 0x00
        , USART_DR   = 0x04
        , USART_BRR  = 0x08
        , USART_CR1  = 0x0c
        , USART_CR2  = 0x10
        , USART_CR3  = 0x14
        , USART_GTPR = 0x18
    };
}
