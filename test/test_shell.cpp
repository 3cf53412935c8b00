// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "test.h"
#include "shell/command_processor.hpp"
#include "shell/tokenizer.hpp"
#include "pinstate/pin.hpp"
#include "pinstate/pin_a.hpp"
#include "pinstate/uart.hpp"
#include <cstring>
#include <string>
#include <utility>

using namespace pinstate;

namespace {
    size_t count_of( const std::string& s, const std::string& what ) {
        size_t n = 0;
        for ( auto pos = s.find( what ); pos != std::string::npos; pos = s.find( what, pos + 1 ) )
            ++n;
        return n;
    }
}

TEST_CASE("tokenizer splits a console line in place") {
    char line[] = "gpio  PC13\r\n";
    tokenizer< 4 > tok;
    tokenizer< 4 >::argv_type argv;

    REQUIRE( tok( line, argv ) == 2 );
    CHECK( std::string( argv[ 0 ] ) == "gpio" );
    CHECK( std::string( argv[ 1 ] ) == "PC13" );
    CHECK( argv[ 2 ] == nullptr );

    char blank[] = " \t\n";
    CHECK( tok( blank, argv ) == 0 );
    CHECK( tok( nullptr, argv ) == 0 );

    char many[] = "a b c d e f";
    CHECK( tok( many, argv ) == 4 );
    CHECK( std::string( argv[ 3 ] ) == "d" );
}

TEST_CASE("gpio command shows one line with its levels") {
    registers().reset();
    auto led = std::move( gpio_port< 'C' >::steal().p13 ).into_open_drain_output_in_state( pin_state::high );
    CHECK( led.is_set_high() );
    registers().console().clear();

    const char * argv[] = { "gpio", "PC13" };
    CHECK( command_processor()( 2, argv ) );
    CHECK( registers().console() == "PC13:\tGPIO_CNF_OUTPUT_ODRAIN,OUTPUT_50M idr 0 odr 1\n" );

    registers().console().clear();
    registers().drive( 2, 13, true );
    command_processor()( 2, argv );
    CHECK( registers().console().find( "idr 1 odr 1" ) != std::string::npos );
}

TEST_CASE("gpio command lists ports") {
    registers().reset();
    std::move( gpio_port< 'B' >::steal().p7 ).into_push_pull_output();

    const char * port[] = { "gpio", "PB" };
    CHECK( command_processor()( 2, port ) );
    const auto& text = registers().console();
    CHECK( count_of( text, "PB" ) == 16 );
    CHECK( text.find( "PB0:\tGPIO_INPUT_FLOATING\n" ) != std::string::npos );
    CHECK( text.find( "PB7:\tGPIO_CNF_OUTPUT_PUSH_PULL,OUTPUT_50M\n" ) != std::string::npos );

    registers().console().clear();
    const char * all[] = { "gpio" };
    command_processor()( 1, all );
    CHECK( count_of( registers().console(), "PA" ) == 16 );
    CHECK( registers().console().find( "PC13:" ) != std::string::npos );
    CHECK( registers().console().find( "PC12:" ) == std::string::npos );

    registers().console().clear();
    const char * bad[] = { "gpio", "PZ1" };
    command_processor()( 2, bad );
    CHECK( registers().console() == "gpio 2nd argment format mismatch\n" );

    registers().console().clear();
    const char * suffix[] = { "gpio", "PA1x" };
    command_processor()( 2, suffix );
    CHECK( registers().console() == "gpio 2nd argment format mismatch\n" );

    registers().console().clear();
    const char * long_number[] = { "gpio", "PA123" };
    command_processor()( 2, long_number );
    CHECK( registers().console() == "gpio 2nd argment format mismatch\n" );

    registers().console().clear();
    const char * two_digits[] = { "gpio", "PA15" };
    command_processor()( 2, two_digits );
    CHECK( registers().console().find( "PA15:\t" ) == 0 );

    registers().console().clear();
    const char * range[] = { "gpio", "PA16" };
    command_processor()( 2, range );
    CHECK( registers().console() == "gpio 2nd argment format mismatch\n" );
}

TEST_CASE("rcc and afio status") {
    registers().reset();
    gpio_port< 'A' >::steal();
    set_remap< USART1 >( 1 );
    registers().console().clear();

    const char * rcc[] = { "rcc" };
    CHECK( command_processor()( 1, rcc ) );
    CHECK( registers().console().find( "RCC->APB2ENR : 00000005" ) != std::string::npos );
    CHECK( registers().console().find( "AFIO, IOPA, " ) != std::string::npos );

    registers().console().clear();
    const char * afio[] = { "afio" };
    CHECK( command_processor()( 1, afio ) );
    CHECK( registers().console() == "\tAFIO MAPR: 0x00000004\n" );
}

TEST_CASE("unknown command prints the help table") {
    registers().reset();
    const char * argv[] = { "spi" };
    CHECK_FALSE( command_processor()( 1, argv ) );
    CHECK( registers().console().find( "command processor -- help" ) != std::string::npos );
    CHECK( registers().console().find( "\tgpio " ) != std::string::npos );

    registers().console().clear();
    CHECK_FALSE( command_processor()( 0, argv ) );
    CHECK( registers().console().empty() );
}

TEST_CASE("polled console input") {
    registers().reset();
    auto& console = *uart_t< USART3 >::instance();

    registers().poke( USART3_BASE + USART_SR, 0xe0 );
    registers().poke( USART3_BASE + USART_DR, 'x' );
    CHECK( console.getc() == 'x' );

    registers().poke( USART3_BASE + USART_DR, '\r' );
    registers().clear_history();
    char line[ 16 ];
    CHECK( console.gets( line, sizeof( line ) ) == 1 );
    CHECK( std::strcmp( line, "\n" ) == 0 );
    auto echo = registers().writes_to( USART3_BASE + USART_DR );
    REQUIRE( echo.size() == 2 );
    CHECK( echo[ 0 ].value == '\r' );
    CHECK( echo[ 1 ].value == '\n' );

    CHECK( console.gets( line, 0 ) == 0 );
}
