// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "errors.hpp"

namespace git_migrator {

char const* to_string(error_phase p)
{
    switch (p)
    {
    case error_phase::configuration: return "configuration";
    case error_phase::validation:    return "validation";
    case error_phase::read:          return "read";
    case error_phase::apply:         return "apply";
    case error_phase::state:         return "state";
    }
    return "unknown";
}

} // namespace git_migrator
