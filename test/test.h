// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <doctest/doctest.h>

#include "mmio_mock.hpp"
#include "pinstate/stm32f103.hpp"

using pinstate::test::access;
using pinstate::test::registers;

// register address of port P
template< char P >
constexpr uint32_t port_reg( pinstate::GPIO_REG reg ) { return pinstate::gpio_base( pinstate::port_id( P ) ) + reg; }

// 4-bit CNF|MODE field of line N as seen by the register file
template< char P >
inline uint8_t field_of( uint8_t n )
{
    const uint32_t cr = registers().peek( port_reg< P >( n < 8 ? pinstate::GPIO_CRL : pinstate::GPIO_CRH ) );
    return uint8_t( ( cr >> ( ( n % 8 ) * 4 ) ) & 0x0f );
}

template< char P >
inline bool odr_bit( uint8_t n )
{
    return registers().peek( port_reg< P >( pinstate::GPIO_ODR ) ) & ( 1u << n );
}
