// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_CVS_REPOSITORY_HPP
# define GIT_MIGRATOR_CVS_REPOSITORY_HPP

# include "vcs.hpp"

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <set>

namespace git_migrator {

// Reads the trunk history of a CVS repository straight from its RCS
// files.  File revisions with the same author and log message that were
// committed within cluster_window of the first one are grouped into one
// changeset, unless the changeset already touches that file or another
// changeset has started since.  A changeset is dated by its latest file
// revision.
struct cvs_repository : source_reader
{
    // module selects a subdirectory of the repository; empty means all
    cvs_repository(std::string const& path, std::string const& module = std::string());

    void validate() override;
    std::vector<commit> commits() override;
    std::vector<std::string> branches() override;
    std::map<std::string, std::string> tags() override;
    void close() override {}

    // Non-fatal findings of the last validate()
    std::vector<std::string> const& warnings() const { return warnings_; }

    std::size_t file_count();

    static boost::posix_time::time_duration const cluster_window;

    // One file revision on the trunk
    struct file_revision
    {
        std::string path;
        std::string rcs_revision;
        std::string author;
        boost::posix_time::ptime date;
        std::string log;
        change_action action;
        std::string content;
    };

 private:
    void load();
    void scan(std::string const& dir);
    void read_file(std::string const& rcs_path, std::string const& path);
    void cluster();

    std::string root;
    std::string module;
    bool loaded;
    std::size_t files;
    std::vector<std::string> warnings_;

    std::vector<file_revision> revisions;
    std::set<std::string> branch_names;
    // tag -> (path, rcs revision) of every tagged trunk revision
    std::multimap<std::string, std::pair<std::string, std::string> > tagged;

    std::vector<commit> changesets;
    std::map<std::pair<std::string, std::string>, std::size_t> changeset_of;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_CVS_REPOSITORY_HPP
