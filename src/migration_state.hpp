// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_MIGRATION_STATE_HPP
# define GIT_MIGRATOR_MIGRATION_STATE_HPP

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/optional.hpp>
# include <string>
# include <vector>

namespace git_migrator {

enum class migration_status { in_progress, completed };

char const* to_string(migration_status s);
migration_status parse_migration_status(std::string const& s);

// Progress of one migration, keyed by migration_id.  processed never
// exceeds total, and total is fixed for the duration of a run.
struct migration_state
{
    migration_state()
        : processed(0), total(0), status(migration_status::in_progress) {}

    std::string migration_id;
    std::string last_commit;
    std::size_t processed;
    std::size_t total;
    std::string source_path;
    std::string target_path;
    boost::posix_time::ptime last_updated;
    migration_status status;
};

// Stable identifier of a (source, target) pair: the hex encoding of the
// first 8 bytes of SHA-256("<source>:<target>").
std::string make_migration_id(std::string const& source_path, std::string const& target_path);

// Persistent checkpoints of migrations
struct checkpoint_store
{
    virtual ~checkpoint_store() {}

    // Inserts or replaces the record, stamping last_updated
    virtual void save(migration_state const& state) = 0;

    virtual boost::optional<migration_state> load(std::string const& migration_id) = 0;

    // Marks a record completed, distinct from any save
    virtual void complete(std::string const& migration_id) = 0;

    virtual void remove(std::string const& migration_id) = 0;

    // All records, most recently updated first
    virtual std::vector<migration_state> history() = 0;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_MIGRATION_STATE_HPP
