// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "command_processor.hpp"
#include "pinstate/mmio.hpp"
#include "pinstate/stm32f103.hpp"
#include "pinstate/stream.hpp"

using namespace pinstate;

static const char * __ahbenr__ [] = {
    "DMA1",     "DMA2",  "SRAM",  nullptr,  "FLITF", nullptr,  "CRCEN",  nullptr
    ,  nullptr, nullptr, nullptr, nullptr,  "OTGFS",  nullptr, "ETHMAC", "ETHMAC_TX"
    , "ETHMAC_RX"
};

static const char * __apb2enr__ [] = {
    "AFIO",    nullptr, "IOPA",  "IOPB",  "IOPC",  "IOPD",  "IOPE",  "IOPF"
    , "IOPG",  "ADC1",  "ADC2",  "TIM1",  "SPI1",  "TIM8",  "USART1","ADC3"
    , nullptr, nullptr, nullptr, "TIM9",  "TIM10", "TIM11"
};

static const char * __apb1enr__ [] = {
    "TIM2",     "TIM3",  "TIM4", "TIM5",  "TIM6",  "TIM7",  "TIM12", "TIM13"
    , "TIM14", nullptr, nullptr, "WWDG",  nullptr, nullptr, "SPI2",  "SPI3"
    , nullptr,"USART2","USART3", "USART4","USART5","I2C1",  "I2C2",  "USB"
    , nullptr,   "CAN", nullptr, "BPK",   "PWR",    "DAC"
};

namespace {
    template< size_t N >
    void print_enables( const char * (&names)[ N ], uint32_t reg ) {
        stream() << "\tEnables : ";
        for ( size_t i = 0; i < N; ++i ) {
            if ( names[ i ] && ( reg & ( 1u << i ) ) )
                stream() << names[ i ] << ", ";
        }
        stream() << endl;
    }
}

void
rcc_status( size_t, const char ** )
{
    const uint32_t ahbenr = mmio::read( RCC_BASE + RCC_AHBENR );
    const uint32_t apb2enr = mmio::read( RCC_BASE + RCC_APB2ENR );
    const uint32_t apb1enr = mmio::read( RCC_BASE + RCC_APB1ENR );

    stream() << "APB2, APB1 peripheral clock enable register (p112-116, RM0008, Rev 17) " << endl;
    stream() << "\tRCC->AHBENR  : " << ahbenr << endl;
    stream() << "\tRCC->APB2ENR : " << apb2enr << endl;
    stream() << "\tRCC->APB1ENR : " << apb1enr << endl;

    print_enables( __ahbenr__, ahbenr );
    print_enables( __apb2enr__, apb2enr );
    print_enables( __apb1enr__, apb1enr );
}
