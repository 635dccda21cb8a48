// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "migrator.hpp"
#include "cvs_repository.hpp"
#include "errors.hpp"
#include "git_repository.hpp"
#include "log.hpp"
#include "sqlite_checkpoint_store.hpp"

#include <boost/filesystem/operations.hpp>

namespace git_migrator {

migrator::migrator(migration_config const& config)
    : migrator(config, &migrator::default_source, &migrator::default_target,
               &migrator::default_store)
{
}

migrator::migrator(
    migration_config const& config,
    source_factory make_source,
    target_factory make_target,
    store_factory make_store)
    : config_(config),
      id(make_migration_id(config.source_path, config.target_path)),
      state_file(config.state_file.empty()
                 ? default_state_file(config.target_path) : config.state_file),
      make_source(make_source),
      make_target(make_target),
      make_store(make_store)
{
}

std::unique_ptr<source_reader> migrator::default_source(migration_config const& config)
{
    if (config.source_type == "cvs")
        return std::unique_ptr<source_reader>(
            new cvs_repository(config.source_path, config.source_module));
    throw configuration_error("unsupported source type: " + config.source_type);
}

std::unique_ptr<target_writer> migrator::default_target()
{
    return std::unique_ptr<target_writer>(new git_repository);
}

std::unique_ptr<checkpoint_store> migrator::default_store(std::string const& path)
{
    return std::unique_ptr<checkpoint_store>(new sqlite_checkpoint_store(path));
}

void migrator::check_config() const
{
    if (config_.source_path.empty())
        throw configuration_error("source path is required");
    if (config_.target_path.empty())
        throw configuration_error("target path is required");
}

// A name from the rename map, or the name itself
static std::string renamed(name_map const& renames, std::string const& name)
{
    auto found = renames.find(name);
    return found == renames.end() ? name : found->second;
}

run_report migrator::run()
{
    run_report report;

    check_config();
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

    Log::info() << "migrating " << config_.source_path << " to " << config_.target_path
                << (config_.dry_run ? " (dry run)" : "") << std::endl;

    progress_.set_operation("Validating source repository");
    source = make_source(config_);
    try
    {
        source->validate();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::validation, "source validation failed: " + std::string(e.what()));
    }

    // Under dry run no target object exists at all
    if (!config_.dry_run)
    {
        progress_.set_operation("Initializing target repository");
        target = make_target();
        try
        {
            target->init(config_.target_path);
        }
        catch (std::exception const& e)
        {
            throw error(error_phase::validation, "failed to initialize target repository "
                        + config_.target_path + ": " + e.what());
        }
    }

    // A dry run only reads the store, to report where a resume would start
    if (config_.dry_run && config_.resume && !boost::filesystem::exists(state_file))
        Log::debug() << "no migration state at " << state_file << ", nothing to resume";
    else if (!config_.dry_run || config_.resume)
    {
        try
        {
            store = make_store(state_file);
            if (config_.resume)
                prior = store->load(id);
        }
        catch (std::exception const& e)
        {
            throw error(error_phase::state, "failed to load migration state from "
                        + state_file + ": " + e.what());
        }
    }

    progress_.set_operation("Reading commits");
    std::vector<commit> commits;
    try
    {
        commits = source->commits();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::read, "failed to read commits: " + std::string(e.what()));
    }

    std::size_t const total = commits.size();
    std::size_t const start = start_index(commits, report);

    migration_state state;
    state.migration_id = id;
    state.source_path = config_.source_path;
    state.target_path = config_.target_path;
    state.total = total;
    state.processed = start;
    state.last_commit = start > 0 ? commits[start - 1].revision : std::string();

    progress_.start(total);
    progress_.set_current(start);
    progress_.set_operation("Starting migration");

    std::size_t const chunk = config_.chunk_size > 0 ? config_.chunk_size : 0;
    for (std::size_t i = start; i < total; ++i)
    {
        commit c = commits[i];
        identity who = authors[c.author];
        c.author = who.first;
        c.email = who.second;

        Log::set_commit(c.revision);
        progress_.set_operation("Processing commit " + short_revision(c.revision));

        if (config_.dry_run)
        {
            Log::debug() << "DRY RUN: would apply " << c.revision << " by "
                         << c.author << " <" << c.email << ">, "
                         << c.files.size() << " files" << std::endl;
        }
        else
        {
            try
            {
                target->apply_commit(c);
            }
            catch (std::exception const& e)
            {
                throw apply_error(c.revision, e.what());
            }
            ++report.applied;
        }
        progress_.increment();

        state.last_commit = c.revision;
        state.processed = i + 1;

        if (chunk > 0 && (i + 1) % chunk == 0)
            checkpoint(state);

        if (config_.interrupt_at > 0 && i + 1 >= config_.interrupt_at)
        {
            try
            {
                checkpoint(state);
                if (target)
                    target->close();
            }
            catch (std::exception const& e)
            {
                Log::warn() << "failed to save state at interruption: " << e.what() << std::endl;
            }
            throw interrupted(i + 1);
        }
    }

    create_branches(report);
    create_tags(report);
    finish(state, report);

    progress_.set_operation("Migration complete");
    Log::info() << "migration of " << total << " commits complete, "
                << report.warnings.size() << " warnings" << std::endl;
    return report;
}

std::size_t migrator::start_index(std::vector<commit> const& commits, run_report& report)
{
    if (!prior || prior->last_commit.empty())
        return 0;

    for (std::size_t i = 0; i < commits.size(); ++i)
    {
        if (commits[i].revision == prior->last_commit)
        {
            Log::info() << "resuming after commit " << prior->last_commit
                        << " (" << i + 1 << " of " << commits.size() << " done)" << std::endl;
            return i + 1;
        }
    }

    // Indistinguishable from a fresh start; replay everything
    report.warn(warning_kind::resume_mismatch, prior->last_commit,
                "checkpointed commit not found in the source history, starting from the first commit");
    return 0;
}

void migrator::checkpoint(migration_state const& state)
{
    if (config_.dry_run)
        return;
    try
    {
        target->flush();
        store->save(state);
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::state, "failed to save checkpoint at commit "
                    + state.last_commit + ": " + e.what());
    }
    Log::debug() << "checkpoint: " << state.processed << " of " << state.total
                 << " commits, last " << state.last_commit << std::endl;
}

void migrator::create_branches(run_report& report)
{
    progress_.set_operation("Creating branches");
    std::vector<std::string> names;
    try
    {
        names = source->branches();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::read, "failed to read branches: " + std::string(e.what()));
    }

    for (auto const& name : names)
    {
        std::string git_name = renamed(config_.branches, name);
        if (config_.dry_run)
        {
            Log::info() << "DRY RUN: would create branch " << git_name << std::endl;
            continue;
        }
        progress_.set_operation("Creating branch " + git_name);
        try
        {
            target->create_branch(git_name, "HEAD");
        }
        catch (std::exception const& e)
        {
            report.warn(warning_kind::branch, git_name, e.what());
        }
    }
}

void migrator::create_tags(run_report& report)
{
    progress_.set_operation("Creating tags");
    std::map<std::string, std::string> tags;
    try
    {
        tags = source->tags();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::read, "failed to read tags: " + std::string(e.what()));
    }

    for (auto const& tag : tags)
    {
        std::string git_name = renamed(config_.tags, tag.first);
        if (config_.dry_run)
        {
            Log::info() << "DRY RUN: would create tag " << git_name << std::endl;
            continue;
        }
        progress_.set_operation("Creating tag " + git_name);
        try
        {
            target->create_tag(git_name, "HEAD", std::string());
        }
        catch (std::exception const& e)
        {
            report.warn(warning_kind::tag, git_name, e.what());
        }
    }
}

void migrator::finish(migration_state& state, run_report& report)
{
    progress_.set_operation("Finalizing migration");
    try
    {
        source->close();
    }
    catch (std::exception const& e)
    {
        report.warn(warning_kind::cleanup, config_.source_path, e.what());
    }

    if (config_.dry_run)
        return;

    try
    {
        target->close();
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::apply, "failed to finish writing "
                    + config_.target_path + ": " + e.what());
    }

    state.status = migration_status::completed;
    try
    {
        store->save(state);
        store->complete(id);
    }
    catch (std::exception const& e)
    {
        throw error(error_phase::state, "failed to mark migration complete: " + std::string(e.what()));
    }
}

} // namespace git_migrator
