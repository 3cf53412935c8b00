// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <cstdint>
#include <cstddef>

extern "C" {
    void serial_putc( int );  // console sink, provided by the firmware (or the test harness)
}

namespace pinstate {

    constexpr const char * endl = "\n";

    // console logger: signed values print in decimal, unsigned in hex
    class stream {
    public:
        stream();
        stream( const char * file, const int line, const char * function = 0 );

        void flush();
        stream& operator << ( const bool );
        stream& operator << ( const char );
        stream& operator << ( const char * );
        stream& operator << ( const int8_t );
        stream& operator << ( const uint8_t );
        stream& operator << ( const int16_t );
        stream& operator << ( const uint16_t );
        stream& operator << ( const int32_t );
        stream& operator << ( const uint32_t );
        stream& operator << ( const int64_t );
        stream& operator << ( const uint64_t );
#if __GNUC__ >= 7 && defined __arm__
        stream& operator << ( const int );
        stream& operator << ( const size_t );
#endif
    };

}
