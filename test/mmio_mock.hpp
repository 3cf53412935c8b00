// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pinstate {
    namespace test {

        struct access {
            enum kind_t { read, write };
            kind_t kind;
            uint32_t address;
            uint32_t value;
        };

        // Register file standing in for the peripheral bus on the host.
        // GPIO data registers behave like the chip: BSRR/BRR update ODR,
        // IDR reports the pad (ODR for outputs, pull or injected level for inputs).
        class register_file {
            std::map< uint32_t, uint32_t > regs_;
            std::array< uint16_t, 5 > driven_;      // lines with an external driver
            std::array< uint16_t, 5 > external_;    // level of that driver
            std::vector< access > history_;
            std::string console_;

            uint32_t stored( uint32_t address ) const;
            uint32_t pad( uint8_t port ) const;
        public:
            register_file();

            void reset();                           // back to reset values, history and console cleared
            void clear_history() { history_.clear(); }

            uint32_t read( uint32_t address );
            void write( uint32_t address, uint32_t value );

            // access without recording
            uint32_t peek( uint32_t address ) const;
            void poke( uint32_t address, uint32_t value );

            // external circuit forcing a pad level; release() lets it float again
            void drive( uint8_t port, uint8_t line, bool level );
            void release( uint8_t port, uint8_t line );

            const std::vector< access >& history() const { return history_; }
            std::vector< access > writes_to( uint32_t address ) const;
            size_t count_writes() const;

            // index into history() of the first write to address, or npos
            size_t first_write( uint32_t address ) const;
            static constexpr size_t npos = size_t( -1 );

            std::string& console() { return console_; }
        };

        register_file& registers();

    }
}
