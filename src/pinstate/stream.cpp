// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "stream.hpp"
#include <type_traits>

using namespace pinstate;

namespace {

    struct putc_t {
        void operator()( const char * s ) const {
            while ( s && *s )
                serial_putc( *s++ );
        }
    };

    class stream_t {
        constexpr const static char * __chars__ = "0123456789abcdef";
    public:
        template<typename T>
        void operator()( T d ) const {
            if constexpr ( std::is_signed< T >::value ) {
                // signed int -- output in decimal numbers
                char buf[ 22 ]; // 64bit signed max = 20 chars + sign and '\0'
                char * p = &buf[21];
                *p-- = '\0';

                // magnitude in the unsigned type; -INT_MIN is not representable in T
                using U = std::make_unsigned_t< T >;
                U u = U( d );
                if ( d < 0 ) {
                    serial_putc( '-' );
                    u = U( 0 ) - u;
                }
                do  {
                    *p-- = __chars__[ u % 10 ];
                    u /= 10;
                } while ( u );
                putc_t()( ++p );

            } else {
                // unsigned values always output in hex
                for ( size_t i = 0; i < sizeof(T) * 2; ++i )
                    serial_putc( __chars__[ ( d >> (( sizeof(T) * 2 - 1 - i )*4) ) & 0x0f ] );
            }
        }
    };
}

stream::stream()
{
}

stream::stream( const char * file, const int line, const char * function )
{
    (*this) << file << " " << int32_t( line ) << ": ";
    if ( function )
        (*this) << function << "\t";
}

stream&
stream::operator << ( const bool c )
{
    serial_putc( c ? '1' : '0' );
    return *this;
}

stream&
stream::operator << ( const char c )
{
    serial_putc( c );
    return *this;
}

stream&
stream::operator << ( const char * s )
{
    putc_t()( s );
    return *this;
}

stream&
stream::operator << ( const int8_t d )
{
    stream_t()( d );
    return *this;
}

stream&
stream::operator << ( const uint8_t d )
{
    stream_t()( d );
    return *this;
}

stream&
stream::operator << ( const int16_t d )
{
    stream_t()( d );
    return *this;
}

stream&
stream::operator << ( const uint16_t d )
{
    stream_t()( d );
    return *this;
}

stream&
stream::operator << ( const int32_t d )
{
    stream_t()( d );
    return *this;
}

stream&
stream::operator << ( const uint32_t d )
{
    stream_t()( d );
    return *this;
}

// require lldivm
stream&
stream::operator << ( const int64_t d )
{
    stream_t()( uint64_t( d ) );
    return *this;
}

stream&
stream::operator << ( const uint64_t d )
{
    stream_t()( d );
    return *this;
}

#if __GNUC__ >= 7 && defined __arm__
stream&
stream::operator << ( const int d )
{
    stream_t()( static_cast< const int32_t > (d) );
    return *this;
}

stream&
stream::operator << ( const size_t d )
{
    stream_t()( static_cast< const uint32_t > (d) );
    return *this;
}
#endif

void
stream::flush()
{
    // nothing to do
}
