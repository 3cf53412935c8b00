// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "test.h"
#include "pinstate/gpio_mode.hpp"
#include "pinstate/pin.hpp"
#include "pinstate/stream.hpp"
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

using namespace pinstate;

namespace {

    template< typename T, typename = void > struct can_set_high : std::false_type {};
    template< typename T > struct can_set_high< T, std::void_t< decltype( std::declval< T& >().set_high() ) > > : std::true_type {};

    template< typename T, typename = void > struct can_read : std::false_type {};
    template< typename T > struct can_read< T, std::void_t< decltype( std::declval< const T& >().is_high() ) > > : std::true_type {};

    template< typename T, typename = void > struct can_read_back : std::false_type {};
    template< typename T > struct can_read_back< T, std::void_t< decltype( std::declval< const T& >().is_set_high() ) > > : std::true_type {};

    template< typename T, typename = void > struct can_set_speed : std::false_type {};
    template< typename T >
    struct can_set_speed< T, std::void_t< decltype( std::declval< T& >().set_speed( GPIO_MODE_OUTPUT_2M ) ) > > : std::true_type {};

    template< typename T, typename = void > struct can_pull : std::false_type {};
    template< typename T >
    struct can_pull< T, std::void_t< decltype( std::declval< T& >().set_internal_resistor( pull::up ) ) > > : std::true_type {};

    template< typename T, typename = void > struct can_copy : std::false_type {};
    template< typename T > struct can_copy< T, std::void_t< decltype( T( std::declval< const T& >() ) ) > > : std::true_type {};
}

// capability markers
static_assert( marker::readable< input >::value, "" );
static_assert( marker::readable< output< open_drain > >::value, "" );
static_assert( !marker::readable< output< push_pull > >::value, "" );
static_assert( !marker::readable< analog >::value, "" );
static_assert( !marker::readable< alternate< 1 > >::value, "" );
static_assert( marker::writable< output< push_pull > >::value && marker::writable< output< open_drain > >::value, "" );
static_assert( !marker::writable< input >::value && !marker::writable< alternate< 0, open_drain > >::value, "" );
static_assert( marker::alternate< alternate< 3, open_drain > >::value, "" );
static_assert( marker::speed< alternate< 0 > >::value && !marker::speed< analog >::value, "" );
static_assert( !marker::dynamic< alternate< 0 > >::value && marker::dynamic< analog >::value, "" );

// typed handles
static_assert( can_set_high< pin< 'A', 0, output< push_pull > > >::value, "" );
static_assert( !can_set_high< pin< 'A', 0, input > >::value, "" );
static_assert( !can_set_high< pin< 'A', 0, analog > >::value, "" );
static_assert( !can_set_high< pin< 'A', 9, alternate< 0 > > >::value, "" );
static_assert( !can_read< pin< 'A', 0, output< push_pull > > >::value, "" );
static_assert( can_read< pin< 'A', 0, output< open_drain > > >::value, "" );
static_assert( can_read< pin< 'A', 0, input > >::value, "" );
static_assert( !can_read< pin< 'A', 0, analog > >::value, "" );
static_assert( can_read_back< pin< 'A', 0, output< open_drain > > >::value, "" );
static_assert( !can_read_back< pin< 'A', 0, input > >::value, "" );
static_assert( can_set_speed< pin< 'A', 0, alternate< 1 > > >::value, "" );
static_assert( !can_set_speed< pin< 'A', 0, input > >::value, "" );
static_assert( can_pull< pin< 'A', 0, input > >::value, "" );
static_assert( !can_pull< pin< 'A', 0, output< push_pull > > >::value, "" );
static_assert( !can_copy< pin< 'A', 0, input > >::value, "" );
static_assert( !std::is_default_constructible< pin< 'A', 0, output< push_pull > > >::value, "" );
static_assert( !std::is_aggregate< pin< 'A', 0, output< push_pull > > >::value, "" );
static_assert( !std::is_aggregate< pin< 'C', 13, input > >::value, "" );

// erasure never widens the operation set
static_assert( !can_set_high< erased_pin< input > >::value, "" );
static_assert( can_set_high< erased_pin< output< open_drain > > >::value, "" );
static_assert( !can_read< erased_pin< output< push_pull > > >::value, "" );
static_assert( !can_set_high< partially_erased_pin< 'B', analog > >::value, "" );
static_assert( can_read< partially_erased_pin< 'B', input > >::value, "" );
static_assert( !can_copy< erased_pin< input > >::value, "" );

// the dynamic handle has the full set, checked at runtime
static_assert( can_set_high< dynamic_pin< 'A', 0 > >::value, "" );
static_assert( !can_copy< dynamic_pin< 'A', 0 > >::value, "" );

// handles carry no state beyond their runtime identity
static_assert( std::is_empty< pin< 'A', 0, input > >::value, "" );
static_assert( sizeof( erased_pin< input > ) == 2, "" );
static_assert( sizeof( partially_erased_pin< 'A', input > ) == 1, "" );

static_assert( pin_mode< output< push_pull > >::cnf == GPIO_CNF_OUTPUT_PUSH_PULL, "" );
static_assert( pin_mode< alternate< 1, open_drain > >::cnf == GPIO_CNF_ALT_OUTPUT_ODRAIN, "" );
static_assert( pin_mode< output< open_drain > >::mode == config::output_speed, "" );
static_assert( gpio_mode::field( GPIO_CNF_INPUT_FLOATING, GPIO_MODE_INPUT ) == 0x4, "" );
static_assert( gpio_mode::address( 1, 8 ) == GPIOB_BASE + GPIO_CRH, "" );
static_assert( gpio_mode::shift( 13 ) == 20, "" );

TEST_CASE("configuration field access") {
    registers().reset();

    gpio_mode::set( 2, 13, GPIO_CNF_OUTPUT_ODRAIN, GPIO_MODE_OUTPUT_2M );
    CHECK( gpio_mode::get( 2, 13 ) == 0x6 );
    CHECK( registers().peek( port_reg< 'C' >( GPIO_CRH ) ) == 0x44644444 );

    gpio_mode::speed( 2, 13, GPIO_MODE_OUTPUT_50M );
    CHECK( gpio_mode::get( 2, 13 ) == 0x7 );

    gpio_mode::set( 0, 7, GPIO_CNF_ALT_OUTPUT_PUSH_PULL, GPIO_MODE_OUTPUT_50M );
    CHECK( registers().peek( port_reg< 'A' >( GPIO_CRL ) ) == 0xb4444444 );
}

TEST_CASE("current mode decodes the hardware") {
    registers().reset();

    CHECK( current_mode( 0, 0 ) == dynamic_mode::input_floating );

    apply_mode( 0, 1, dynamic_mode::input_pull_up );
    CHECK( current_mode( 0, 1 ) == dynamic_mode::input_pull_up );

    apply_mode( 0, 1, dynamic_mode::input_pull_down );
    CHECK( current_mode( 0, 1 ) == dynamic_mode::input_pull_down );

    apply_mode< alternate< 0, open_drain > >( 0, 2 );
    CHECK( current_mode( 0, 2 ) == dynamic_mode::output_open_drain );

    apply_mode< analog >( 3, 9 );
    CHECK( current_mode( 3, 9 ) == dynamic_mode::analog );
}

TEST_CASE("mode strings") {
    CHECK( std::string( gpio_mode::toString( 0x4 ) ) == "GPIO_INPUT_FLOATING" );
    CHECK( std::string( gpio_mode::toString( 0x8 ) ) == "GPIO_INPUT_PUSH_PULL" );
    CHECK( std::string( gpio_mode::toString( 0x0 ) ) == "GPIO_INPUT_ANALOG" );
    CHECK( std::string( gpio_mode::toString( 0x3 ) ) == "GPIO_CNF_OUTPUT_PUSH_PULL,OUTPUT_50M" );
    CHECK( std::string( gpio_mode::toString( 0x6 ) ) == "GPIO_CNF_OUTPUT_ODRAIN,OUTPUT_2M" );
    CHECK( std::string( gpio_mode::toString( 0xb ) ) == "GPIO_CNF_ALT_OUTPUT_PUSH_PULL,OUTPUT_50M" );
    CHECK( std::string( gpio_mode::toString( 0xd ) ) == "GPIO_CNF_ALT_OUTPUT_ODRAIN,OUTPUT_10M" );
}

TEST_CASE("stream formats") {
    registers().reset();

    stream() << int32_t( -42 ) << ' ' << uint8_t( 0x1f ) << ' ' << uint32_t( GPIOA_BASE ) << ' ' << true << endl;
    CHECK( registers().console() == "-42 1f 40010800 1\n" );

    registers().console().clear();
    stream() << INT64_MIN << ' ' << INT32_MIN << ' ' << int16_t( -32768 ) << ' ' << int8_t( -128 ) << ' ' << INT64_MAX;
    CHECK( registers().console() == "-9223372036854775808 -2147483648 -32768 -128 9223372036854775807" );

    registers().console().clear();
    stream() << int32_t( 0 ) << ' ' << int64_t( -1 );
    CHECK( registers().console() == "0 -1" );

    registers().console().clear();
    stream( "pin.cpp", 7 ) << "x";
    CHECK( registers().console() == "pin.cpp 7: x" );
}
