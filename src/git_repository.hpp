// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_GIT_REPOSITORY_HPP
# define GIT_MIGRATOR_GIT_REPOSITORY_HPP

# include "git_fast_import.hpp"
# include "vcs.hpp"

# include <memory>
# include <vector>

namespace git_migrator {

// Writes commits into a Git repository through git fast-import.  Commits
// go to the branch HEAD refers to.
struct git_repository : target_writer
{
    git_repository();
    ~git_repository();

    void init(std::string const& path) override;
    void open(std::string const& path) override;
    std::string apply_commit(commit const& c) override;
    void flush() override;
    void create_branch(std::string const& name, std::string const& ref) override;
    void create_tag(std::string const& name, std::string const& ref,
                    std::string const& message) override;
    std::string head() override;
    void close() override;

    std::string const& ref_name() const { return ref; }

 private:
    // Returns true iff the repository had to be created
    static bool ensure_existence(std::string const& path);

    git_fast_import& fast_import();
    std::string git(std::vector<std::string> const& args);
    std::string resolve(std::string const& ref);
    void update_work_tree();

 private: // data members
    std::string path;
    std::string ref;            // e.g. refs/heads/master
    std::string tip;            // last commit on ref; empty when unborn
    std::string opened_at;      // tip when the repository was opened
    bool created;
    bool bare;
    std::size_t last_mark;
    std::unique_ptr<git_fast_import> fast_import_;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_GIT_REPOSITORY_HPP
