// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_SQLITE_CHECKPOINT_STORE_HPP
# define GIT_MIGRATOR_SQLITE_CHECKPOINT_STORE_HPP

# include "migration_state.hpp"

struct sqlite3;

namespace git_migrator {

// A checkpoint_store in an SQLite database file.  One connection, which
// waits up to five seconds for a lock held by another process.
struct sqlite_checkpoint_store : checkpoint_store
{
    // Creates the file, its parent directories and the schema as needed
    explicit sqlite_checkpoint_store(std::string const& path);
    ~sqlite_checkpoint_store();

    sqlite_checkpoint_store(sqlite_checkpoint_store const&) = delete;
    sqlite_checkpoint_store& operator=(sqlite_checkpoint_store const&) = delete;

    void save(migration_state const& state) override;
    boost::optional<migration_state> load(std::string const& migration_id) override;
    void complete(std::string const& migration_id) override;
    void remove(std::string const& migration_id) override;
    std::vector<migration_state> history() override;

    std::string const& path() const { return path_; }

 private:
    void exec(char const* sql);

    std::string path_;
    sqlite3* db;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_SQLITE_CHECKPOINT_STORE_HPP
