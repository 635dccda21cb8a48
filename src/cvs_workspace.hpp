// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_CVS_WORKSPACE_HPP
# define GIT_MIGRATOR_CVS_WORKSPACE_HPP

# include "vcs.hpp"

namespace git_migrator {

// Writes commits into a CVS module through a checkout and the cvs
// command line client.
struct cvs_workspace : source_writer
{
    cvs_workspace(std::string const& cvsroot, std::string const& module);

    void init(std::string const& work_dir) override;
    void apply_commit(commit const& c) override;
    void close() override {}

    // The log message recorded for c
    static std::string log_message(commit const& c);

    // True for a CVS log message written by log_message()
    static bool exported(std::string const& message);

 private:
    std::string cvs(std::vector<std::string> const& args);

    std::string cvsroot;
    std::string module;
    std::string work_dir;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_CVS_WORKSPACE_HPP
