// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_VCS_HPP
# define GIT_MIGRATOR_VCS_HPP

# include "commit.hpp"

# include <map>
# include <string>
# include <vector>

namespace git_migrator {

// A repository history is read from.  Each query may rescan the whole
// repository, so callers ask each question once.
struct source_reader
{
    virtual ~source_reader() {}

    // Throws when the repository is missing or malformed
    virtual void validate() = 0;

    // Oldest first
    virtual std::vector<commit> commits() = 0;
    virtual std::vector<std::string> branches() = 0;

    // Tag name to the revision it points at
    virtual std::map<std::string, std::string> tags() = 0;

    virtual void close() = 0;
};

// A Git repository commits are written to
struct target_writer
{
    virtual ~target_writer() {}

    // Creates the repository if necessary
    virtual void init(std::string const& path) = 0;

    // Opens an existing repository
    virtual void open(std::string const& path) = 0;

    // Returns the new revision, which also becomes the current tip
    virtual std::string apply_commit(commit const& c) = 0;

    // Makes every commit applied so far durable and visible to others
    virtual void flush() = 0;

    // "HEAD" names the current tip
    virtual void create_branch(std::string const& name, std::string const& ref) = 0;
    virtual void create_tag(std::string const& name, std::string const& ref,
                            std::string const& message) = 0;

    // Empty before the first commit
    virtual std::string head() = 0;

    virtual void close() = 0;
};

// Reads new history back out of a Git repository
struct history_reader
{
    virtual ~history_reader() {}

    virtual void validate() = 0;

    // Commits strictly after revision, oldest first.  An empty revision,
    // or one that isn't in the history, yields every commit.
    virtual std::vector<commit> commits_since(std::string const& revision) = 0;

    // Empty for a repository without commits
    virtual std::string head_revision() = 0;

    virtual void close() = 0;
};

// A legacy repository commits are written back to, through a checkout
struct source_writer
{
    virtual ~source_writer() {}

    // Checks the module out into work_dir
    virtual void init(std::string const& work_dir) = 0;

    // One legacy commit per call
    virtual void apply_commit(commit const& c) = 0;

    virtual void close() = 0;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_VCS_HPP
