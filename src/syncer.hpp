// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_SYNCER_HPP
# define GIT_MIGRATOR_SYNCER_HPP

# include "authors.hpp"
# include "config.hpp"
# include "progress_reporter.hpp"
# include "run_report.hpp"
# include "sync_state.hpp"
# include "vcs.hpp"

# include <functional>
# include <memory>

namespace git_migrator {

// Keeps a Git repository and a CVS module in step.  Each direction is
// incremental: CVS commits are filtered by date against
// state().last_cvs_sync, Git commits by identity against
// state().last_git_commit.
struct syncer
{
    typedef std::function<std::unique_ptr<source_reader>(sync_config const&)> source_factory;
    typedef std::function<std::unique_ptr<target_writer>()> git_writer_factory;
    typedef std::function<std::unique_ptr<history_reader>(std::string const&)> history_factory;
    typedef std::function<std::unique_ptr<source_writer>(sync_config const&)> source_writer_factory;

    explicit syncer(sync_config const& config);
    syncer(sync_config const& config,
           source_factory make_source,
           git_writer_factory make_git_writer,
           history_factory make_history,
           source_writer_factory make_source_writer);

    run_report run();

    progress_reporter& progress() { return progress_; }
    sync_state const& state() const { return state_; }
    sync_config const& config() const { return config_; }

    static std::unique_ptr<source_reader> default_source(sync_config const& config);
    static std::unique_ptr<target_writer> default_git_writer();
    static std::unique_ptr<history_reader> default_history(std::string const& path);
    static std::unique_ptr<source_writer> default_source_writer(sync_config const& config);

 private:
    void load();
    void cvs_to_git(run_report& report);
    void git_to_cvs(run_report& report);
    void snapshot_tip(run_report& report);
    void persist(run_report& report);

    sync_config config_;
    sync_state state_;
    Authors authors;
    progress_reporter progress_;

    source_factory make_source;
    git_writer_factory make_git_writer;
    history_factory make_history;
    source_writer_factory make_source_writer;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_SYNCER_HPP
