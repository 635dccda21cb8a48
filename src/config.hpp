// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_CONFIG_HPP
# define GIT_MIGRATOR_CONFIG_HPP

# include <iosfwd>
# include <map>
# include <string>

namespace git_migrator {

typedef std::map<std::string, std::string> name_map;

struct migration_config
{
    migration_config()
        : source_type("cvs"), target_type("git"),
          dry_run(false), resume(false), verbose(false),
          chunk_size(100), interrupt_at(0) {}

    std::string source_type;
    std::string source_path;
    std::string source_module;
    std::string target_type;
    std::string target_path;
    std::string target_remote;

    name_map authors;           // username -> "Name <email>"
    std::string authors_file;
    name_map branches;          // source name -> Git name
    name_map tags;

    bool dry_run;
    bool resume;
    bool verbose;

    // Checkpoint every chunk_size commits; zero or less disables it
    int chunk_size;

    // Checkpoint database; next to the target when empty
    std::string state_file;

    // Stop with an interrupted error after this many commits; for tests
    std::size_t interrupt_at;
};

enum class sync_direction { git_to_cvs, cvs_to_git, bidirectional };

char const* to_string(sync_direction d);

// Throws configuration_error for unknown names
sync_direction parse_sync_direction(std::string const& name);

struct sync_config
{
    sync_config()
        : direction(sync_direction::bidirectional), dry_run(false), verbose(false) {}

    std::string git_path;
    std::string cvs_path;
    std::string cvs_module;
    std::string work_dir;       // a temporary checkout when empty
    sync_direction direction;
    name_map authors;
    std::string authors_file;
    std::string state_file;     // no persistence when empty
    bool dry_run;
    bool verbose;
};

// <dirname(target_path)>/.git-migrator-state.db
std::string default_state_file(std::string const& target_path);

// Both formats are property trees: JSON when the file name ends in
// ".json", INFO otherwise.  Missing required fields throw
// configuration_error.
migration_config load_migration_config(std::string const& path);
sync_config load_sync_config(std::string const& path);

void print(std::ostream& os, migration_config const& config);
void print(std::ostream& os, sync_config const& config);

} // namespace git_migrator

#endif // GIT_MIGRATOR_CONFIG_HPP
