// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "rcc.hpp"
#include "bitset.hpp"
#include "stm32f103.hpp"

using namespace pinstate;

// See RM0008 section 7.3.7 p111-112 (DocID 13902, Rev. 17) APB2 peripheral clock enable register
// 7.3.8 p114 (APB1 peripheral clock enable register)

void
rcc::enable( RCC_REG enr, uint32_t bit )
{
    bitset::set( RCC_BASE + enr, bit );
}

void
rcc::disable( RCC_REG enr, uint32_t bit )
{
    bitset::reset( RCC_BASE + enr, bit );
}

void
rcc::reset( RCC_REG rstr, uint32_t bit )
{
    bitset::set( RCC_BASE + rstr, bit );
    bitset::reset( RCC_BASE + rstr, bit );
}

bool
rcc::enabled( RCC_REG enr, uint32_t bit )
{
    return bitset::test( RCC_BASE + enr, bit );
}
