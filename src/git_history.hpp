// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_GIT_HISTORY_HPP
# define GIT_MIGRATOR_GIT_HISTORY_HPP

# include "vcs.hpp"

namespace git_migrator {

// Reads the history of HEAD in a Git repository with the git command
// line tools.
struct git_history : history_reader
{
    explicit git_history(std::string const& path);

    void validate() override;
    std::vector<commit> commits_since(std::string const& revision) override;
    std::string head_revision() override;
    void close() override {}

    // All commits of HEAD, oldest first
    std::vector<commit> commits();

 private:
    std::vector<std::string> revisions();
    commit read_commit(std::string const& sha);
    std::string git(std::vector<std::string> const& args);

    std::string path;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_GIT_HISTORY_HPP
