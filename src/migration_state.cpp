// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "migration_state.hpp"
#include "hash.hpp"

#include <stdexcept>

namespace git_migrator {

char const* to_string(migration_status s)
{
    return s == migration_status::completed ? "completed" : "in_progress";
}

migration_status parse_migration_status(std::string const& s)
{
    if (s == "completed")
        return migration_status::completed;
    if (s == "in_progress")
        return migration_status::in_progress;
    throw std::runtime_error("unknown migration status '" + s + "'");
}

std::string make_migration_id(std::string const& source_path, std::string const& target_path)
{
    return to_hex(sha256(source_path + ":" + target_path), 8);
}

} // namespace git_migrator
