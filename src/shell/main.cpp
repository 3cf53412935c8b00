// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "command_processor.hpp"
#include "tokenizer.hpp"
#include "pinstate/gpio_mode.hpp"
#include "pinstate/mmio.hpp"
#include "pinstate/pin.hpp"
#include "pinstate/stm32f103.hpp"
#include "pinstate/stream.hpp"
#include "pinstate/uart.hpp"
#include <array>
#include <cstddef>
#include <utility>

using namespace pinstate;

namespace {
    bool console_enabled = false;

    void
    clock_setup()
    {
        // RM0008 p98-
        mmio::write( FLASH_BASE + FLASH_ACR, 0x0010 | 0x0002 ); // FLASH_PREFETCH | FLASH_WAIT2 (48 < sysclk <= 72MHz)

        mmio::write( RCC_BASE + RCC_CFGR, ( 7 << 18 ) | ( 1 << 16 ) | ( 4 << 8 ) );          // PLLMUL(input x9), PLLSRC(HSE), PPRE1(HCLK/2)
        mmio::write( RCC_BASE + RCC_CR, ( 1 << 24 ) | ( 1 << 16 ) | ( 0b10000 << 3 ) | 1 );  // PLLON, HSEON, HSITRIM(0b10000), HSION
        while ( ! ( mmio::read( RCC_BASE + RCC_CR ) & ( 1 << 17 ) ) )                        // HSE RDY
            ;
        while ( ! ( mmio::read( RCC_BASE + RCC_CR ) & ( 1 << 25 ) ) )                        // PLL RDY
            ;
        mmio::write( RCC_BASE + RCC_CFGR, mmio::read( RCC_BASE + RCC_CFGR ) | 0x02 );        // SW(0b10, pll selected as system clock)
    }

    void
    mdelay( uint32_t ms )
    {
        for ( volatile uint32_t i = 0; i < ms * 8000; ++i )
            ;
    }

    // modes the board wants on PB0 during bring-up; the write fails where the line is not an output
    constexpr dynamic_mode bringup_table[] = {
        dynamic_mode::output_push_pull
        , dynamic_mode::input_pull_up
        , dynamic_mode::output_open_drain
    };
}

void
serial_putc( int c )
{
    if ( console_enabled )
        uart_t< USART1 >::instance()->putc( c );
}

int
main()
{
    clock_setup();

    auto pa = gpio_port< 'A' >::split();
    auto pb = gpio_port< 'B' >::split();
    auto pc = gpio_port< 'C' >::split();
    if ( !pa || !pb || !pc )
        return 1;

    // enable serial console
    auto console_lines = uart_t< USART1 >::enable( std::move( pa->p9 ), std::move( pa->p10 ) );
    console_enabled = console_lines.enabled;

    // LED, active low
    auto led = std::move( pc->p13 ).into_open_drain_output_in_state( pin_state::high );

    std::array< erased_pin< input >, 2 > keys = {{
            std::move( pa->p0 ).into_pull_up_input().erase()
            , std::move( pb->p12 ).into_pull_up_input().erase()
        }};

    auto probe = std::move( pb->p0 ).into_dynamic();
    for ( auto mode: bringup_table ) {
        probe.set_mode( mode );
        if ( auto ec = probe.set_high() )
            stream() << "PB0: " << gpio_mode::toString( gpio_mode::get( 1, 0 ) ) << ": " << ec.message().c_str() << endl;
    }

    for ( int i = 0; i < 6; ++i ) {
        led.toggle();
        mdelay( 100 );
    }

    for ( auto& key: keys )
        stream() << "key P" << key.port() << int8_t( key.line() ) << ( key.is_low() ? " pressed" : " released" ) << endl;

    command_processor processor;
    tokenizer< 10 > tok;
    tokenizer< 10 >::argv_type argv;

    auto& console = *uart_t< USART1 >::instance();
    while ( true ) {
        static char line[ 80 ];
        console << "\nPinstate> ";
        if ( console.gets( line, sizeof( line ) ) ) {
            size_t argc = tok( line, argv );
            processor( argc, argv.data() );
        }
        led.toggle();
    }
}
