// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_SYNC_STATE_HPP
# define GIT_MIGRATOR_SYNC_STATE_HPP

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <string>

namespace git_migrator {

// Watermarks of a sync configuration.  Both only ever move forward.
struct sync_state
{
    // Last Git commit exported to CVS, or taken as the tip after a
    // CVS to Git pass
    std::string last_git_commit;

    // Date of the newest CVS commit imported into Git; not_a_date_time
    // when nothing was imported yet
    boost::posix_time::ptime last_cvs_sync;

    boost::posix_time::ptime synced_at;
};

// A missing file yields a zero state.  A file that exists but can't be
// parsed throws state_error.
sync_state load_sync_state(std::string const& path);

// Written to a sibling file first and renamed into place
void save_sync_state(std::string const& path, sync_state const& state);

} // namespace git_migrator

#endif // GIT_MIGRATOR_SYNC_STATE_HPP
