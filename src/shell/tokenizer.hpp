// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>

// splits a console line in place; argv points into the buffer
template< size_t argv_size >
class tokenizer {
    tokenizer( const tokenizer& ) = delete;
    tokenizer& operator = ( const tokenizer& ) = delete;

    static bool is_separator( char c ) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

public:
    typedef std::array< const char *, argv_size > argv_type;

    tokenizer() {}

    size_t operator()( char * buffer, argv_type& argv ) const {

        std::fill( argv.begin(), argv.end(), static_cast< const char * >( nullptr ) );

        if ( buffer == nullptr )
            return 0;

        size_t argc = 0;
        char * p = buffer;

        while ( argc < argv_size ) {
            while ( *p && is_separator( *p ) )
                ++p;
            if ( *p == '\0' )
                break;
            argv[ argc++ ] = p;
            while ( *p && !is_separator( *p ) )
                ++p;
            if ( *p == '\0' )
                break;
            *p++ = '\0';
        }
        return argc;
    }
};
