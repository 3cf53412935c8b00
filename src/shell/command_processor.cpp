// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "command_processor.hpp"
#include "pinstate/mmio.hpp"
#include "pinstate/stm32f103.hpp"
#include "pinstate/stream.hpp"
#include <cstring>

using namespace pinstate;

void
afio_status( size_t, const char ** )
{
    stream() << "\tAFIO MAPR: 0x" << mmio::read( AFIO_BASE + AFIO_MAPR ) << endl;
}

command_processor::command_processor()
{
}

namespace {

    class premitive {
    public:
        const char * arg0_;
        void (*f_)(size_t, const char **);
        const char * help_;
    };

    const premitive command_table [] = {
        { "gpio",   gpio_command,   " [PA..PE][#] list line modes, or one line with its levels" }
        , { "rcc",  rcc_status,     " RCC clock enable register list" }
        , { "afio", afio_status,    " AFIO MAPR list" }
    };
}

bool
command_processor::operator()( size_t argc, const char ** argv ) const
{
    bool processed( false );

    if ( argc > 0 && argv[ 0 ] ) {
        for ( auto& cmd: command_table ) {
            if ( std::strcmp( cmd.arg0_, argv[0] ) == 0 ) {
                processed = true;
                cmd.f_( argc, argv );
                break;
            }
        }

        if ( ! processed ) {
            stream() << "command processor -- help" << endl;
            for ( auto& cmd: command_table )
                stream() << "\t" << cmd.arg0_ << cmd.help_ << endl;
        }
    }
    return processed;
}
