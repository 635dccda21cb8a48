// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_COMMAND_HPP
# define GIT_MIGRATOR_COMMAND_HPP

# include <stdexcept>
# include <string>
# include <vector>

namespace git_migrator {

struct command_result
{
    int exit_code;
    std::string out;
    std::string err;
};

// Runs exe with args in work_dir (the current directory when empty)
// and collects both output streams.
command_result run_command(
    std::string const& exe,
    std::vector<std::string> const& args,
    std::string const& work_dir = std::string());

struct command_failed : std::runtime_error
{
    command_failed(std::string const& command_line, command_result const& result);

    command_result result;
};

// As run_command, but a non-zero exit status throws command_failed.
// Returns the standard output.
std::string run_checked(
    std::string const& exe,
    std::vector<std::string> const& args,
    std::string const& work_dir = std::string());

} // namespace git_migrator

#endif // GIT_MIGRATOR_COMMAND_HPP
