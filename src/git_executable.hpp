// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_GIT_EXECUTABLE_HPP
# define GIT_MIGRATOR_GIT_EXECUTABLE_HPP

# include "options.hpp"
# include <boost/process/search_path.hpp>
# include <stdexcept>
# include <string>

namespace git_migrator {

inline std::string find_executable(std::string const& configured, char const* name)
{
    if (!configured.empty())
        return configured;
    std::string found = boost::process::search_path(name).string();
    if (found.empty())
        throw std::runtime_error(std::string(name) + " executable not found in PATH");
    return found;
}

inline std::string const& git_executable()
{
    static std::string git_exe = find_executable(options.git_executable, "git");
    return git_exe;
}

inline std::string const& cvs_executable()
{
    static std::string cvs_exe = find_executable(options.cvs_executable, "cvs");
    return cvs_exe;
}

} // namespace git_migrator

#endif // GIT_MIGRATOR_GIT_EXECUTABLE_HPP
