// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstddef>

void gpio_command( size_t argc, const char ** argv );
void rcc_status( size_t argc, const char ** argv );
void afio_status( size_t argc, const char ** argv );

// console commands over the pin layer; unknown commands print the help table
class command_processor {
    command_processor( const command_processor& ) = delete;
    command_processor& operator = ( const command_processor& ) = delete;

public:
    command_processor();

    bool operator()( size_t argc, const char ** argv ) const;
};
