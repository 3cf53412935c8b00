// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "uart.hpp"
#include "mmio.hpp"
#include "stm32f103.hpp"

namespace {
    enum UART_CR1_MASK {
        Reserved = 0xfffc0000
        , UE     = 0x2000  // uart enable
        , M      = 0x1000  // Word length 0 := 1-start bit, 8 bits, n stop bit, 1 := 1 start bit, 9 data bits, n stop bit
        , WAKE   = 0x0800  // 0: idle line, 1: address mark
        , PCE    = 0x0400  // Parity control enable ( 0: disabled, 1:enabled )
        , PS     = 0x0200  // Parity 0: even, 1: odd
        , PEIE   = 0x0100  // PE interrupt enable
        , TXEIE  = 0x0080  // TXE interrupt enable
        , TCIE   = 0x0040  // Transmission complete interrupt enable
        , RXNEIE = 0x0020  // RXNE interrupt enable
        , IDLEIE = 0x0010  // IDLE interrupt enable
        , TE     = 0x0008  // Transmitter enable
        , RE     = 0x0004  // Receiver enable
        , RWU    = 0x0002  // Receiver wakeup
        , SBK    = 0x0001  // Send brak
    };

    enum UART_STATUS {
        ST_PE      =	0x0001
        , ST_FE    =	0x0002
        , ST_NE	   =	0x0004
        , ST_OVER  =	0x0008
        , ST_IDLE  =	0x0010
        , ST_RXNE  =	0x0020		// Receiver not empty
        , ST_TC	   =	0x0040		// Transmission complete
        , ST_TXE   =	0x0080		// Transmitter empty
        , ST_BREAK =	0x0100
        , ST_CTS   =	0x0200
    };
}

using namespace pinstate;

uart::uart() : base_( 0 )
             , baud_( config::console_baud )
{
}

bool
uart::init( uint32_t base )
{
    base_ = base;
    return true;
}

bool
uart::config( parity parity, int nbits, uint32_t baud, uint32_t pclk )
{
    if ( base_ == 0 || baud == 0 )
        return false;

    baud_ = baud;

    uint32_t flag( UE | TE | RE ); // uart enable, transmitter enable, receiver enable
    if ( nbits == 9 )
        flag |= M;
    if ( parity != parity_none )
        flag |= PCE | ( parity == parity_odd ? PS : 0 );

    mmio::write( base_ + USART_CR1, flag );
    mmio::write( base_ + USART_CR2, 0 );  // 1 stop bit
    mmio::write( base_ + USART_CR3, 0 );  // CTS/RTS...
    mmio::write( base_ + USART_GTPR, 0 );
    // baud = pclk / (16 * USARTDIV); BRR holds USARTDIV as mantissa + 4bit fraction
    mmio::write( base_ + USART_BRR, pclk / baud );  // 72000000 / 115200

    return true;
}

uart&
uart::operator << ( const char * s )
{
    while ( s && *s ) {
        if ( *s == '\n' )
            putc( '\r' );
        putc( *s++ );
    }
    return *this;
}

void
uart::putc( int c )
{
    while ( ! ( mmio::read( base_ + USART_SR ) & ST_TXE ) )
        ;
    mmio::write( base_ + USART_DR, uint32_t( c ) & 0x1ff );
}

int
uart::getc()
{
    while ( ! ( mmio::read( base_ + USART_SR ) & ST_RXNE ) )
        ;
    return int( mmio::read( base_ + USART_DR ) & 0xff );
}

size_t
uart::gets( char * s, size_t size )
{
    if ( s == nullptr || size == 0 )
        return 0;

    char * p = s;
    while ( size > 1 ) {
        uint8_t c = getc() & 0x7f;
        if ( c == '\r' ) {
            putc( '\r' );
            putc( '\n' );
            *p++ = '\n';
            break;
        } else if ( c == '\b' || c == 0x7f || c == 0x15 ) {
            if ( p > s ) {
                --p;
                ++size;
                putc( '\b' );
            }
        } else if ( c >= ' ' && c < 0x7f ) {
            putc( c );
            *p++ = c;
            --size;
        }
    }
    *p = '\0';
    return size_t( p - s );
}
