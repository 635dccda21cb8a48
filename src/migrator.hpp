// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_MIGRATOR_HPP
# define GIT_MIGRATOR_MIGRATOR_HPP

# include "authors.hpp"
# include "config.hpp"
# include "migration_state.hpp"
# include "progress_reporter.hpp"
# include "run_report.hpp"
# include "vcs.hpp"

# include <functional>
# include <memory>

namespace git_migrator {

// Copies the history of a source repository into a Git repository,
// checkpointing every chunk_size commits so that an interrupted
// migration can be resumed.
struct migrator
{
    typedef std::function<std::unique_ptr<source_reader>(migration_config const&)> source_factory;
    typedef std::function<std::unique_ptr<target_writer>()> target_factory;
    typedef std::function<std::unique_ptr<checkpoint_store>(std::string const&)> store_factory;

    explicit migrator(migration_config const& config);
    migrator(migration_config const& config,
             source_factory make_source,
             target_factory make_target,
             store_factory make_store);

    // Runs the whole migration on the calling thread.  Fatal failures
    // throw git_migrator::error; everything else ends up in the report.
    run_report run();

    progress_reporter& progress() { return progress_; }
    std::string const& migration_id() const { return id; }
    migration_config const& config() const { return config_; }

    static std::unique_ptr<source_reader> default_source(migration_config const& config);
    static std::unique_ptr<target_writer> default_target();
    static std::unique_ptr<checkpoint_store> default_store(std::string const& path);

 private:
    void check_config() const;
    std::size_t start_index(std::vector<commit> const& commits, run_report& report);
    void checkpoint(migration_state const& state);
    void create_branches(run_report& report);
    void create_tags(run_report& report);
    void finish(migration_state& state, run_report& report);

    migration_config config_;
    std::string id;
    std::string state_file;
    Authors authors;
    progress_reporter progress_;

    source_factory make_source;
    target_factory make_target;
    store_factory make_store;

    // Live during run()
    std::unique_ptr<source_reader> source;
    std::unique_ptr<target_writer> target;
    std::unique_ptr<checkpoint_store> store;
    boost::optional<migration_state> prior;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_MIGRATOR_HPP
