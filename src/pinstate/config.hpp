// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include "stm32f103.hpp"

#ifndef PINSTATE_OUTPUT_SPEED
# define PINSTATE_OUTPUT_SPEED GPIO_MODE_OUTPUT_50M
#endif

namespace pinstate {

    namespace config {
        // MODE[1:0] used when a line is switched to output or alternate function
        constexpr GPIO_MODE output_speed = PINSTATE_OUTPUT_SPEED;

        // console (USART1) defaults; pclk2 = 72MHz as set up by the firmware clock tree
        constexpr uint32_t console_baud = 115200;
        constexpr uint32_t console_pclk = 72000000;
    }

}
