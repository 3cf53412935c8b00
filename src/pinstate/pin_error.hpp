// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

#pragma once

#include <system_error>

namespace pinstate {

    enum class pin_errc {
        mode_mismatch = 1   // operation not permitted by the line's current mode; nothing was written
    };

    const std::error_category& pin_category() noexcept;

    std::error_code make_error_code( pin_errc );

}

namespace std {
    template<> struct is_error_code_enum< pinstate::pin_errc > : true_type {};
}
