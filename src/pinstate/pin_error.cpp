// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#include "pin_error.hpp"
#include <string>

namespace pinstate {

    class pin_category_t : public std::error_category {
    public:
        const char * name() const noexcept override { return "pinstate.pin"; }

        std::string message( int ev ) const override {
            switch ( static_cast< pin_errc >( ev ) ) {
            case pin_errc::mode_mismatch:
                return "pin mode mismatch";
            }
            return "unknown pin error";
        }
    };

    const std::error_category&
    pin_category() noexcept
    {
        static pin_category_t __category;
        return __category;
    }

    std::error_code
    make_error_code( pin_errc e )
    {
        return std::error_code( static_cast< int >( e ), pin_category() );
    }

}
