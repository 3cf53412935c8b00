// Copyright (C) 2018 MS-Cheminformatics LLC
// Licence: CC BY-NC
// Author: Toshinobu Hondo, Ph.D.
// Contact: toshi.hondo@qtplatz.com
//

// ports are 16 lines wide

#include "pinstate/pin.hpp"

using namespace pinstate;

static_assert( pin< 'A', 16 >::line() == 16, "" );
