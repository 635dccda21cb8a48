// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_TEST_FAKES_HPP
# define GIT_MIGRATOR_TEST_FAKES_HPP

// In-memory stand-ins for the repositories and the checkpoint store.
// Each fake writes what happens to it into a *_data record owned by
// the test, so the record outlives the fake the factory hands out.

# include "migration_state.hpp"
# include "migrator.hpp"
# include "syncer.hpp"
# include "vcs.hpp"

# include <boost/date_time/posix_time/posix_time.hpp>
# include <boost/filesystem.hpp>
# include <map>
# include <memory>
# include <set>
# include <stdexcept>
# include <string>
# include <vector>

namespace git_migrator { namespace test {

inline boost::posix_time::ptime at(long long seconds)
{
    return from_epoch_seconds(seconds);
}

inline commit make_commit(std::string const& revision, std::string const& author, long long seconds)
{
    commit c;
    c.revision = revision;
    c.author = author;
    c.date = at(seconds);
    c.message = "commit " + revision;
    c.files.push_back(file_change(revision + ".txt", change_action::add, revision + "\n"));
    return c;
}

// r1..rN by "dev", one minute apart
inline std::vector<commit> numbered_commits(std::size_t n, char const* prefix = "r")
{
    std::vector<commit> result;
    for (std::size_t i = 1; i <= n; ++i)
        result.push_back(make_commit(prefix + std::to_string(i), "dev", 1000000000 + 60 * i));
    return result;
}

struct source_data
{
    source_data() : invalid(false), constructed(0), closed(0) {}

    std::vector<commit> commits;
    std::vector<std::string> branches;
    std::map<std::string, std::string> tags;
    bool invalid;
    std::size_t constructed;
    std::size_t closed;
};

struct fake_source : source_reader
{
    explicit fake_source(source_data& data) : data(data) { ++data.constructed; }

    void validate() override
    {
        if (data.invalid)
            throw std::runtime_error("no such repository");
    }
    std::vector<commit> commits() override { return data.commits; }
    std::vector<std::string> branches() override { return data.branches; }
    std::map<std::string, std::string> tags() override { return data.tags; }
    void close() override { ++data.closed; }

    source_data& data;
};

struct target_data
{
    target_data()
        : fail_init(false), fail_open(false), constructed(0), flushes(0), closes(0),
          mirror(0) {}

    std::vector<std::string> applied;       // source revisions, in order
    std::vector<std::string> identities;    // "Name <email>" of each applied commit
    std::vector<std::string> branches;
    std::vector<std::string> tags;
    std::set<std::string> failing_branches;
    std::set<std::string> failing_tags;
    std::string fail_on;                    // revision whose apply throws
    bool fail_init;
    bool fail_open;
    std::string init_path;
    std::string open_path;
    std::size_t constructed;
    std::size_t flushes;
    std::size_t closes;
    std::string tip;

    // applied.size() at each flush
    std::vector<std::size_t> flushed_at;

    // Receives every applied commit under its new revision, to let a
    // history_data see what was imported
    std::vector<commit>* mirror;
};

struct fake_target : target_writer
{
    explicit fake_target(target_data& data) : data(data) { ++data.constructed; }

    void init(std::string const& path) override
    {
        if (data.fail_init)
            throw std::runtime_error("permission denied");
        data.init_path = path;
    }
    void open(std::string const& path) override
    {
        if (data.fail_open)
            throw std::runtime_error("not a git repository");
        data.open_path = path;
    }
    std::string apply_commit(commit const& c) override
    {
        if (c.revision == data.fail_on)
            throw std::runtime_error("disk full");
        data.applied.push_back(c.revision);
        data.identities.push_back(c.author + " <" + c.email + ">");
        data.tip = "git-" + c.revision;
        if (data.mirror)
        {
            commit imported = c;
            imported.revision = data.tip;
            data.mirror->push_back(imported);
        }
        return data.tip;
    }
    void flush() override
    {
        ++data.flushes;
        data.flushed_at.push_back(data.applied.size());
    }
    void create_branch(std::string const& name, std::string const&) override
    {
        if (data.failing_branches.count(name))
            throw std::runtime_error("invalid ref name");
        data.branches.push_back(name);
    }
    void create_tag(std::string const& name, std::string const&, std::string const&) override
    {
        if (data.failing_tags.count(name))
            throw std::runtime_error("tag exists");
        data.tags.push_back(name);
    }
    std::string head() override { return data.tip; }
    void close() override { ++data.closes; }

    target_data& data;
};

struct store_data
{
    store_data() : opened(0) {}

    std::map<std::string, migration_state> records;
    std::vector<migration_state> saves;
    std::vector<std::string> completed;
    std::string path;
    std::size_t opened;
};

struct fake_store : checkpoint_store
{
    fake_store(store_data& data, std::string const& path) : data(data)
    {
        ++data.opened;
        data.path = path;
    }

    void save(migration_state const& state) override
    {
        migration_state stamped = state;
        stamped.last_updated = boost::posix_time::microsec_clock::universal_time();
        data.records[state.migration_id] = stamped;
        data.saves.push_back(stamped);
    }
    boost::optional<migration_state> load(std::string const& id) override
    {
        auto found = data.records.find(id);
        if (found == data.records.end())
            return boost::none;
        return found->second;
    }
    void complete(std::string const& id) override
    {
        data.records[id].status = migration_status::completed;
        data.completed.push_back(id);
    }
    void remove(std::string const& id) override { data.records.erase(id); }
    std::vector<migration_state> history() override
    {
        std::vector<migration_state> result;
        for (auto const& r : data.records)
            result.push_back(r.second);
        return result;
    }

    store_data& data;
};

struct history_data
{
    history_data() : invalid(false), head_fails(false), constructed(0) {}

    std::vector<commit> commits;
    bool invalid;
    bool head_fails;
    std::size_t constructed;
    std::vector<std::string> asked_since;
};

struct fake_history : history_reader
{
    explicit fake_history(history_data& data) : data(data) { ++data.constructed; }

    void validate() override
    {
        if (data.invalid)
            throw std::runtime_error("not a git repository");
    }
    std::vector<commit> commits_since(std::string const& revision) override
    {
        data.asked_since.push_back(revision);
        for (std::size_t i = 0; i < data.commits.size(); ++i)
        {
            if (data.commits[i].revision == revision)
                return std::vector<commit>(data.commits.begin() + i + 1, data.commits.end());
        }
        return data.commits;
    }
    std::string head_revision() override
    {
        if (data.head_fails)
            throw std::runtime_error("bad HEAD");
        return data.commits.empty() ? std::string() : data.commits.back().revision;
    }
    void close() override {}

    history_data& data;
};

struct cvs_data
{
    cvs_data() : work_dir_existed(false), inits(0), closes(0) {}

    std::vector<std::string> applied;
    std::string fail_on;
    std::string work_dir;
    bool work_dir_existed;
    std::size_t inits;
    std::size_t closes;
};

struct fake_source_writer : source_writer
{
    explicit fake_source_writer(cvs_data& data) : data(data) {}

    void init(std::string const& work_dir) override
    {
        ++data.inits;
        data.work_dir = work_dir;
        data.work_dir_existed = boost::filesystem::is_directory(work_dir);
    }
    void apply_commit(commit const& c) override
    {
        if (c.revision == data.fail_on)
            throw std::runtime_error("cvs commit failed");
        data.applied.push_back(c.revision);
    }
    void close() override { ++data.closes; }

    cvs_data& data;
};

// The orchestrators own a mutex, so they live on the heap
inline std::unique_ptr<migrator> make_migrator(
    migration_config const& config, source_data& source, target_data& target, store_data& store)
{
    return std::unique_ptr<migrator>(new migrator(
        config,
        [&source](migration_config const&)
        { return std::unique_ptr<source_reader>(new fake_source(source)); },
        [&target]()
        { return std::unique_ptr<target_writer>(new fake_target(target)); },
        [&store](std::string const& path)
        { return std::unique_ptr<checkpoint_store>(new fake_store(store, path)); }));
}

inline std::unique_ptr<syncer> make_syncer(
    sync_config const& config, source_data& source, target_data& git,
    history_data& history, cvs_data& cvs)
{
    return std::unique_ptr<syncer>(new syncer(
        config,
        [&source](sync_config const&)
        { return std::unique_ptr<source_reader>(new fake_source(source)); },
        [&git]()
        { return std::unique_ptr<target_writer>(new fake_target(git)); },
        [&history](std::string const&)
        { return std::unique_ptr<history_reader>(new fake_history(history)); },
        [&cvs](sync_config const&)
        { return std::unique_ptr<source_writer>(new fake_source_writer(cvs)); }));
}

}} // namespace git_migrator::test

#endif // GIT_MIGRATOR_TEST_FAKES_HPP
