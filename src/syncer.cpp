// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "syncer.hpp"
#include "cvs_repository.hpp"
#include "cvs_workspace.hpp"
#include "errors.hpp"
#include "git_history.hpp"
#include "git_repository.hpp"
#include "log.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

namespace git_migrator {

namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

namespace {

// The CVS checkout a git-to-cvs pass commits from.  A temporary one
// is removed again when the pass ends, however it ends.
struct work_dir
{
    work_dir(std::string const& configured, run_report& report)
        : temporary(configured.empty()), report(report)
    {
        try
        {
            if (temporary)
                path = fs::temp_directory_path()
                    / fs::unique_path("git-migrator-cvs-%%%%-%%%%-%%%%");
            else
                path = configured;
            fs::create_directories(path);
        }
        catch (fs::filesystem_error const& e)
        {
            throw error(error_phase::validation,
                        "failed to create CVS work directory: " + std::string(e.what()));
        }
        if (temporary)
            Log::debug() << "using temporary CVS checkout " << path << std::endl;
    }

    ~work_dir()
    {
        if (!temporary)
            return;
        boost::system::error_code ec;
        fs::remove_all(path, ec);
        if (ec)
            report.warn(warning_kind::cleanup, path.string(), ec.message());
    }

    fs::path path;
    bool temporary;
    run_report& report;
};

std::string summary(commit const& c)
{
    std::string::size_type eol = c.message.find('\n');
    return c.message.substr(0, eol);
}

} // namespace

syncer::syncer(sync_config const& config)
    : syncer(config, &syncer::default_source, &syncer::default_git_writer,
             &syncer::default_history, &syncer::default_source_writer)
{
}

syncer::syncer(
    sync_config const& config,
    source_factory make_source,
    git_writer_factory make_git_writer,
    history_factory make_history,
    source_writer_factory make_source_writer)
    : config_(config),
      make_source(make_source),
      make_git_writer(make_git_writer),
      make_history(make_history),
      make_source_writer(make_source_writer)
{
}

std::unique_ptr<source_reader> syncer::default_source(sync_config const& config)
{
    return std::unique_ptr<source_reader>(
        new cvs_repository(config.cvs_path, config.cvs_module));
}

std::unique_ptr<target_writer> syncer::default_git_writer()
{
    return std::unique_ptr<target_writer>(new git_repository);
}

std::unique_ptr<history_reader> syncer::default_history(std::string const& path)
{
    return std::unique_ptr<history_reader>(new git_history(path));
}

std::unique_ptr<source_writer> syncer::default_source_writer(sync_config const& config)
{
    return std::unique_ptr<source_writer>(
        new cvs_workspace(config.cvs_path, config.cvs_module));
}

void syncer::load()
{
    if (config_.git_path.empty())
        throw configuration_error("git path is required");
    if (config_.cvs_path.empty())
        throw configuration_error("cvs path is required");

    authors = Authors(config_.authors);
    if (!config_.authors_file.empty())
    {
        try
        {
            authors.load(config_.authors_file);
        }
        catch (std::runtime_error const& e)
        {
            throw configuration_error(e.what());
        }
    }

    // Before any repository is touched
    state_ = load_sync_state(config_.state_file);
}

run_report syncer::run()
{
    run_report report;
    load();

    Log::info() << "syncing " << config_.git_path << " and " << config_.cvs_path
                << " (" << to_string(config_.direction) << ")"
                << (config_.dry_run ? ", dry run" : "") << std::endl;

    switch (config_.direction)
    {
    case sync_direction::cvs_to_git:
        cvs_to_git(report);
        break;

    case sync_direction::git_to_cvs:
        git_to_cvs(report);
        break;

    case sync_direction::bidirectional:
        cvs_to_git(report);
        snapshot_tip(report);
        git_to_cvs(report);
        break;
    }

    Log::info() << "sync complete, " << report.applied << " commits applied, "
                << report.warnings.size() << " warnings" << std::endl;
    return report;
}

void syncer::cvs_to_git(run_report& report)
{
    progress_.set_operation("Syncing CVS → Git");

    std::unique_ptr<source_reader> reader = make_source(config_);
    try
    {
        reader->validate();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::validation, "failed to open CVS repository "
                    + config_.cvs_path + ": " + e.what());
    }

    std::vector<commit> candidates;
    try
    {
        for (auto const& c : reader->commits())
        {
            // A commit exactly at the watermark is already synced
            if (!state_.last_cvs_sync.is_not_a_date_time() && c.date <= state_.last_cvs_sync)
                continue;
            // Came from Git in an earlier git-to-cvs pass
            if (cvs_workspace::exported(c.message))
            {
                Log::debug() << "skipping CVS commit " << c.revision
                             << ", it was exported from Git" << std::endl;
                continue;
            }
            candidates.push_back(c);
        }
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::read, "failed to read CVS commits: " + std::string(e.what()));
    }

    try
    {
        reader->close();
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::cleanup, config_.cvs_path, e.what());
    }

    if (candidates.empty())
    {
        progress_.set_operation("CVS → Git: up to date");
        Log::info() << "CVS → Git: up to date" << std::endl;
        return;
    }

    std::string const count = boost::lexical_cast<std::string>(candidates.size());
    progress_.start(candidates.size());
    progress_.set_operation("CVS → Git: " + count + " new commit(s)");

    if (config_.dry_run)
    {
        for (auto const& c : candidates)
            Log::info() << "DRY RUN: would sync CVS commit " << c.revision
                        << " (" << summary(c) << ") to Git" << std::endl;
        return;
    }

    std::unique_ptr<target_writer> writer = make_git_writer();
    try
    {
        writer->open(config_.git_path);
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::validation, "failed to open Git repository "
                    + config_.git_path + ": " + e.what());
    }

    for (auto& c : candidates)
    {
        identity who = authors[c.author];
        c.author = who.first;
        c.email = who.second;

        Log::set_commit(c.revision);
        progress_.set_operation("Applying CVS commit " + c.revision + " to Git");
        try
        {
            writer->apply_commit(c);
            writer->flush();
        }
        catch (std::exception const& e)
        {
            throw apply_error(c.revision, e.what());
        }
        ++report.applied;
        progress_.increment();

        if (state_.last_cvs_sync.is_not_a_date_time() || c.date > state_.last_cvs_sync)
            state_.last_cvs_sync = c.date;
        state_.synced_at = pt::microsec_clock::universal_time();
        persist(report);
    }

    try
    {
        writer->close();
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::cleanup, config_.git_path, e.what());
    }

    progress_.set_operation("CVS → Git: synced " + count + " commit(s)");
}

void syncer::git_to_cvs(run_report& report)
{
    progress_.set_operation("Syncing Git → CVS");

    std::unique_ptr<history_reader> history = make_history(config_.git_path);
    try
    {
        history->validate();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::validation, "failed to open Git repository "
                    + config_.git_path + ": " + e.what());
    }

    std::vector<commit> candidates;
    try
    {
        candidates = history->commits_since(state_.last_git_commit);
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::read, "failed to read Git commits: " + std::string(e.what()));
    }

    try
    {
        history->close();
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::cleanup, config_.git_path, e.what());
    }

    if (candidates.empty())
    {
        progress_.set_operation("Git → CVS: up to date");
        Log::info() << "Git → CVS: up to date" << std::endl;
        return;
    }

    std::string const count = boost::lexical_cast<std::string>(candidates.size());
    progress_.start(candidates.size());
    progress_.set_operation("Git → CVS: " + count + " new commit(s)");

    if (config_.dry_run)
    {
        for (auto const& c : candidates)
            Log::info() << "DRY RUN: would sync git commit " << short_revision(c.revision)
                        << " (" << summary(c) << ") to CVS" << std::endl;
        return;
    }

    work_dir checkout(config_.work_dir, report);
    std::unique_ptr<source_writer> writer = make_source_writer(config_);
    try
    {
        writer->init(checkout.path.string());
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::validation, "failed to check out CVS module "
                    + config_.cvs_module + " into " + checkout.path.string() + ": " + e.what());
    }

    for (auto const& c : candidates)
    {
        Log::set_commit(c.revision);
        progress_.set_operation("Applying git commit " + short_revision(c.revision) + " to CVS");
        try
        {
            writer->apply_commit(c);
        }
        catch (std::exception const& e)
        {
            throw apply_error(c.revision, e.what());
        }
        ++report.applied;
        progress_.increment();

        state_.last_git_commit = c.revision;
        state_.synced_at = pt::microsec_clock::universal_time();
        persist(report);
    }

    try
    {
        writer->close();
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::cleanup, checkout.path.string(), e.what());
    }

    progress_.set_operation("Git → CVS: synced " + count + " commit(s)");
}

// Takes the Git tip after a cvs-to-git pass as already synced, so the
// commits just imported from CVS aren't exported back.
void syncer::snapshot_tip(run_report& report)
{
    try
    {
        std::unique_ptr<history_reader> history = make_history(config_.git_path);
        history->validate();
        std::string tip = history->head_revision();
        history->close();
        if (!tip.empty() && tip != state_.last_git_commit)
        {
            Log::debug() << "Git tip is now " << tip << std::endl;
            state_.last_git_commit = tip;
            persist(report);
        }
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::tip_snapshot, config_.git_path, e.what());
    }
}

void syncer::persist(run_report& report)
{
    if (config_.state_file.empty() || config_.dry_run)
        return;
    try
    {
        save_sync_state(config_.state_file, state_);
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::watermark, config_.state_file, e.what());
    }
}

} // namespace git_migrator
