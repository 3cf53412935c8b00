// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "test.h"
#include "pinstate/pin.hpp"
#include "pinstate/stream.hpp"
#include <string>
#include <system_error>
#include <utility>

using namespace pinstate;

TEST_CASE("dynamic pin refuses to write while an input") {
    registers().reset();
    auto d = std::move( gpio_port< 'A' >::steal().p7 ).into_dynamic();
    CHECK( d.mode() == dynamic_mode::input_floating );

    const uint32_t odr = registers().peek( port_reg< 'A' >( GPIO_ODR ) );
    registers().clear_history();

    auto ec = d.set_high();
    CHECK( ( ec == pin_errc::mode_mismatch ) );
    CHECK( registers().history().empty() );
    CHECK( registers().peek( port_reg< 'A' >( GPIO_ODR ) ) == odr );

    CHECK( ( d.set_low() == pin_errc::mode_mismatch ) );
    CHECK( ( d.toggle() == pin_errc::mode_mismatch ) );
    CHECK( ( d.set_state( pin_state::high ) == pin_errc::mode_mismatch ) );

    bool level = true;
    CHECK( ( d.is_set_high( level ) == pin_errc::mode_mismatch ) );
    CHECK( level );                     // untouched on failure
    CHECK( registers().count_writes() == 0 );
}

TEST_CASE("dynamic pin operations after a mode change") {
    registers().reset();
    auto d = std::move( gpio_port< 'B' >::steal().p0 ).into_dynamic();

    d.make_push_pull_output();
    CHECK( d.mode() == dynamic_mode::output_push_pull );
    CHECK( field_of< 'B' >( 0 ) == 0x3 );

    CHECK_FALSE( d.set_high() );
    bool level = false;
    CHECK_FALSE( d.is_set_high( level ) );
    CHECK( level );
    CHECK_FALSE( d.is_high( level ) );  // push-pull readback of the pad
    CHECK( level );

    CHECK_FALSE( d.toggle() );
    CHECK_FALSE( d.is_set_low( level ) );
    CHECK( level );

    d.make_analog();
    CHECK( field_of< 'B' >( 0 ) == 0x0 );
    level = false;
    CHECK( ( d.is_high( level ) == pin_errc::mode_mismatch ) );
    CHECK( ( d.is_low( level ) == pin_errc::mode_mismatch ) );
    CHECK_FALSE( level );

    d.make_pull_up_input();
    CHECK( field_of< 'B' >( 0 ) == 0x8 );
    CHECK_FALSE( d.is_high( level ) );
    CHECK( level );
    CHECK_FALSE( d.is_low( level ) );
    CHECK_FALSE( level );
}

TEST_CASE("dynamic pin output in state latches first") {
    registers().reset();
    auto d = std::move( gpio_port< 'C' >::steal().p15 ).into_dynamic();

    registers().clear_history();
    d.make_open_drain_output_in_state( pin_state::high );
    auto bsrr = registers().first_write( port_reg< 'C' >( GPIO_BSRR ) );
    auto crh = registers().first_write( port_reg< 'C' >( GPIO_CRH ) );
    REQUIRE( bsrr != test::register_file::npos );
    REQUIRE( crh != test::register_file::npos );
    CHECK( bsrr < crh );
    CHECK( d.mode() == dynamic_mode::output_open_drain );
    CHECK( field_of< 'C' >( 15 ) == 0x7 );
}

TEST_CASE("into_dynamic picks up the configured mode") {
    registers().reset();
    auto a = gpio_port< 'A' >::steal();

    CHECK( std::move( a.p1 ).into_pull_up_input().into_dynamic().mode() == dynamic_mode::input_pull_up );
    CHECK( std::move( a.p2 ).into_pull_down_input().into_dynamic().mode() == dynamic_mode::input_pull_down );
    CHECK( std::move( a.p3 ).into_open_drain_output().into_dynamic().mode() == dynamic_mode::output_open_drain );
    CHECK( std::move( a.p4 ).into_push_pull_output().into_dynamic().mode() == dynamic_mode::output_push_pull );
    CHECK( std::move( a.p5 ).into_analog().into_dynamic().mode() == dynamic_mode::analog );
}

TEST_CASE("mode mismatch error code") {
    std::error_code ec = pin_errc::mode_mismatch;
    CHECK( bool( ec ) );
    CHECK( ec.message() == "pin mode mismatch" );
    CHECK( std::string( ec.category().name() ) == "pinstate.pin" );
    CHECK( ( ec.category() == pin_category() ) );
    CHECK( ( make_error_code( pin_errc::mode_mismatch ) == ec ) );
}

TEST_CASE("modes from a runtime table, mismatches logged and skipped") {
    registers().reset();
    auto d = std::move( gpio_port< 'D' >::steal().p2 ).into_dynamic();

    const dynamic_mode table[] = { dynamic_mode::output_push_pull, dynamic_mode::input_floating, dynamic_mode::output_open_drain };
    int failures = 0;

    for ( auto mode: table ) {
        d.set_mode( mode );
        if ( auto ec = d.set_high() ) {
            stream() << "PD2: " << ec.message().c_str() << endl;
            ++failures;
        }
    }
    CHECK( failures == 1 );
    CHECK( registers().console() == "PD2: pin mode mismatch\n" );
    CHECK( d.mode() == dynamic_mode::output_open_drain );
    CHECK( odr_bit< 'D' >( 2 ) );
}
