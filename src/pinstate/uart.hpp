// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <utility>
#include "config.hpp"
#include "pin.hpp"
#include "pin_a.hpp"
#include "rcc.hpp"
#include "stream.hpp"

namespace pinstate {

    // polled USART; the console binds serial_putc() to USART1
    class uart {
        uint32_t base_;
        uint32_t baud_;

        uart( const uart& ) = delete;
        uart& operator = ( const uart& ) = delete;
        uart();
    public:
        enum parity { parity_even, parity_odd, parity_none };

        bool config( parity = parity_none, int nbits = 8
                     , uint32_t baud = config::console_baud, uint32_t pclk = config::console_pclk );

        uart& operator << ( const char * );

        void putc( int );
        int getc();                               // blocks on RXNE
        size_t gets( char * p, size_t size );     // line edit with echo, '\r' ends the line

        inline uint32_t address() const { return base_; }
        inline uint32_t baud() const { return baud_; }
    private:
        bool init( uint32_t base );
        template< typename > friend struct uart_t;
    };

    // TX and RX committed to a USART; 'enabled' is false when the USART
    // could not be configured.  The lines stay claimed either way.
    template< typename TX, typename RX >
    struct uart_lines {
        TX tx;
        RX rx;
        bool enabled;
    };

    template< typename USARTX > struct uart_t {
        static std::atomic_flag once_flag_;

        static inline uart * instance() {
            static uart __instance;
            if ( !once_flag_.test_and_set() )
                __instance.init( USARTX::base );
            return &__instance;
        }

        // Claims TX and RX for USARTX: clock on, lines committed to the
        // alternate function, AFIO remap written, then the USART configured.
        // The committed lines are handed back; keep them for as long as the
        // USART owns the pads.
        template< char TP, uint8_t TN, typename TM, char RP, uint8_t RN, typename RM >
        static uart_lines< alt_pin_t< usart_tx, USARTX, pin< TP, TN, TM > >, alt_pin_t< usart_rx, USARTX, pin< RP, RN, RM > > >
        enable( pin< TP, TN, TM >&& tx, pin< RP, RN, RM >&& rx
                , uart::parity parity = uart::parity_none, int nbits = 8
                , uint32_t baud = config::console_baud, uint32_t pclk = config::console_pclk ) {
            static_assert( is_pin_a< usart_tx, USARTX, pin< TP, TN, TM > >::value, "TX line can not carry this USART" );
            static_assert( is_pin_a< usart_rx, USARTX, pin< RP, RN, RM > >::value, "RX line can not carry this USART" );
            constexpr uint8_t remap = pin_a< usart_tx, USARTX, TP, TN >::remap;
            static_assert( remap == pin_a< usart_rx, USARTX, RP, RN >::remap, "TX and RX belong to different remaps" );

            rcc::enable< USARTX >();
            auto tx_line = set_alt_mode< usart_tx, USARTX >( std::move( tx ) );
            auto rx_line = set_alt_mode< usart_rx, USARTX >( std::move( rx ) );
            set_remap< USARTX >( remap );

            const bool enabled = instance()->config( parity, nbits, baud, pclk );
            if ( enabled )
                stream() << "uart enabled: 0x" << USARTX::base
                         << " tx P" << TP << int8_t( TN ) << " rx P" << RP << int8_t( RN )
                         << " brr 0x" << uint32_t( pclk / baud ) << endl;

            return { std::move( tx_line ), std::move( rx_line ), enabled };
        }
    };

    template< typename USARTX > std::atomic_flag uart_t< USARTX >::once_flag_ = ATOMIC_FLAG_INIT;

}
