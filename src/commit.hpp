// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_COMMIT_HPP
# define GIT_MIGRATOR_COMMIT_HPP

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/optional.hpp>
# include <iosfwd>
# include <string>
# include <vector>

namespace git_migrator {

enum class change_action { add, modify, remove };

std::ostream& operator<<(std::ostream& os, change_action action);

struct file_change
{
    file_change() : action(change_action::modify) {}
    file_change(std::string const& path, change_action action,
                std::string const& content = std::string())
        : path(path), action(action), content(content) {}

    std::string path;           // relative, '/'-separated
    change_action action;
    std::string content;        // empty for change_action::remove
};

// One unit of history as handed from a reader to a writer.  Dates are
// always UTC.
struct commit
{
    std::string revision;
    std::string author;
    std::string email;
    boost::posix_time::ptime date;
    std::string message;
    boost::optional<std::string> branch;
    std::vector<file_change> files;
};

// Seconds since the epoch, as git wants them
long long epoch_seconds(boost::posix_time::ptime const& t);
boost::posix_time::ptime from_epoch_seconds(long long seconds);

// First 8 characters of a revision, for human consumption
std::string short_revision(std::string const& revision);

} // namespace git_migrator

#endif // GIT_MIGRATOR_COMMIT_HPP
