// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE syncer
#include <boost/test/unit_test.hpp>

#include <boost/filesystem.hpp>
#include <fstream>

#include "cvs_repository.hpp"
#include "cvs_workspace.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "rcs_builder.hpp"
#include "sync_state.hpp"

using namespace git_migrator;
using namespace git_migrator::test;
namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

struct scratch
{
    scratch() : dir(fs::temp_directory_path() / fs::unique_path("syncer-test-%%%%-%%%%"))
    {
        fs::create_directories(dir);
    }
    ~scratch()
    {
        boost::system::error_code ec;
        fs::remove_all(dir, ec);
    }

    // Entries the syncer would create for a checkout of its own
    static std::size_t temporary_checkouts()
    {
        std::size_t n = 0;
        for (fs::directory_iterator i(fs::temp_directory_path()), end; i != end; ++i)
            if (i->path().filename().string().compare(0, 17, "git-migrator-cvs-") == 0)
                ++n;
        return n;
    }

    fs::path dir;
};

struct sync_fixture : scratch
{
    sync_fixture()
    {
        config.git_path = "/srv/git/project";
        config.cvs_path = "/srv/cvs";
        config.cvs_module = "project";
        config.state_file = (dir / "sync.json").string();
        config.direction = sync_direction::cvs_to_git;
    }

    run_report run()
    {
        return make_syncer(config, source, git, history, cvs)->run();
    }

    sync_state saved() const
    {
        return load_sync_state(config.state_file);
    }

    sync_config config;
    source_data source;
    target_data git;
    history_data history;
    cvs_data cvs;
};

BOOST_FIXTURE_TEST_CASE(bidirectional_with_nothing_new_is_up_to_date, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  history.commits = numbered_commits(1, "g");

  std::unique_ptr<syncer> s = make_syncer(config, source, git, history, cvs);
  run_report report = s->run();

  BOOST_CHECK_EQUAL(report.applied, 0u);
  BOOST_CHECK(report.warnings.empty());
  BOOST_CHECK_EQUAL(git.constructed, 0u);
  BOOST_CHECK_EQUAL(cvs.inits, 0u);
  BOOST_CHECK_EQUAL(s->state().last_git_commit, "g1");
  BOOST_CHECK_EQUAL(s->progress().operation(), "Git → CVS: up to date");

  BOOST_REQUIRE_EQUAL(history.asked_since.size(), 1u);
  BOOST_CHECK_EQUAL(history.asked_since[0], "g1");
  BOOST_CHECK_EQUAL(saved().last_git_commit, "g1");
  }

BOOST_FIXTURE_TEST_CASE(corrupt_state_fails_before_any_repository_io, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  std::ofstream(config.state_file.c_str()) << "{ this is not json";

  BOOST_CHECK_THROW(run(), state_error);
  BOOST_CHECK_EQUAL(source.constructed, 0u);
  BOOST_CHECK_EQUAL(history.constructed, 0u);
  BOOST_CHECK_EQUAL(git.constructed, 0u);
  }

BOOST_FIXTURE_TEST_CASE(missing_state_starts_from_scratch, sync_fixture)
  {
  source.commits = numbered_commits(2, "c");
  run_report report = run();

  BOOST_CHECK_EQUAL(report.applied, 2u);
  BOOST_CHECK_EQUAL(git.open_path, config.git_path);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, source.commits[1].date);
  }

BOOST_FIXTURE_TEST_CASE(commit_at_watermark_is_already_synced, sync_fixture)
  {
  source.commits.push_back(make_commit("c1", "dev", 1000));
  source.commits.push_back(make_commit("c2", "dev", 2000));
  source.commits.push_back(make_commit("c3", "dev", 3000));

  sync_state state;
  state.last_cvs_sync = at(2000);
  save_sync_state(config.state_file, state);

  run_report report = run();

  std::vector<std::string> expected = { "c3" };
  BOOST_CHECK(git.applied == expected);
  BOOST_CHECK_EQUAL(report.applied, 1u);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, at(3000));
  BOOST_CHECK(!saved().synced_at.is_not_a_date_time());
  }

BOOST_FIXTURE_TEST_CASE(watermark_never_moves_back, sync_fixture)
  {
  source.commits = numbered_commits(3, "c");
  run();
  pt::ptime first = saved().last_cvs_sync;
  BOOST_CHECK_EQUAL(git.applied.size(), 3u);

  // Nothing new: no applies and the same watermark
  run_report again = run();
  BOOST_CHECK_EQUAL(again.applied, 0u);
  BOOST_CHECK_EQUAL(git.applied.size(), 3u);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, first);

  source.commits.push_back(make_commit("c4", "dev", epoch_seconds(first) + 1));
  run();
  BOOST_CHECK_EQUAL(git.applied.back(), "c4");
  BOOST_CHECK(saved().last_cvs_sync > first);
  }

BOOST_FIXTURE_TEST_CASE(each_import_is_flushed_before_the_watermark_moves, sync_fixture)
  {
  source.commits = numbered_commits(3, "c");
  run();

  std::vector<std::size_t> expected = { 1, 2, 3 };
  BOOST_CHECK(git.flushed_at == expected);
  }

BOOST_FIXTURE_TEST_CASE(imported_authors_are_mapped, sync_fixture)
  {
  source.commits.push_back(make_commit("c1", "alice", 1000));
  source.commits.push_back(make_commit("c2", "bob", 2000));
  config.authors["alice"] = "Alice Smith <alice@example.com>";
  run();

  BOOST_REQUIRE_EQUAL(git.identities.size(), 2u);
  BOOST_CHECK_EQUAL(git.identities[0], "Alice Smith <alice@example.com>");
  BOOST_CHECK_EQUAL(git.identities[1], "bob <bob@users.noreply.cvs.example.org>");
  }

BOOST_FIXTURE_TEST_CASE(dry_run_lists_without_writing, sync_fixture)
  {
  source.commits = numbered_commits(2, "c");
  config.dry_run = true;
  run_report report = run();

  BOOST_CHECK_EQUAL(report.applied, 0u);
  BOOST_CHECK_EQUAL(git.constructed, 0u);
  BOOST_CHECK(!fs::exists(config.state_file));
  }

BOOST_FIXTURE_TEST_CASE(unwritable_watermark_is_a_warning, sync_fixture)
  {
  // A regular file where the state file's directory should be
  std::ofstream((dir / "blocker").string().c_str()) << "x";
  config.state_file = (dir / "blocker" / "sync.json").string();
  source.commits = numbered_commits(2, "c");

  run_report report = run();

  BOOST_CHECK_EQUAL(report.applied, 2u);
  BOOST_CHECK_EQUAL(git.applied.size(), 2u);
  BOOST_CHECK_EQUAL(report.count(warning_kind::watermark), 2u);
  }

BOOST_FIXTURE_TEST_CASE(import_failure_is_fatal_and_keeps_earlier_progress, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  source.commits = numbered_commits(3, "c");
  git.fail_on = "c2";

  try
  {
      run();
      BOOST_ERROR("apply failure must be fatal");
  }
  catch (apply_error const& e)
  {
      BOOST_CHECK_EQUAL(e.revision(), "c2");
  }

  BOOST_CHECK_EQUAL(saved().last_cvs_sync, source.commits[0].date);
  // The git-to-cvs pass never started
  BOOST_CHECK_EQUAL(history.constructed, 0u);
  }

BOOST_FIXTURE_TEST_CASE(git_commits_after_watermark_go_to_cvs, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  history.commits = numbered_commits(3, "g");

  sync_state state;
  state.last_git_commit = "g1";
  save_sync_state(config.state_file, state);

  run_report report = run();

  std::vector<std::string> expected = { "g2", "g3" };
  BOOST_CHECK(cvs.applied == expected);
  BOOST_CHECK_EQUAL(report.applied, 2u);
  BOOST_CHECK_EQUAL(cvs.inits, 1u);
  BOOST_CHECK_EQUAL(cvs.closes, 1u);
  BOOST_CHECK_EQUAL(saved().last_git_commit, "g3");
  BOOST_CHECK_EQUAL(source.constructed, 0u);
  }

BOOST_FIXTURE_TEST_CASE(temporary_checkout_is_removed, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  history.commits = numbered_commits(1, "g");
  run();

  BOOST_CHECK(cvs.work_dir_existed);
  BOOST_CHECK(!cvs.work_dir.empty());
  BOOST_CHECK(!fs::exists(cvs.work_dir));
  }

BOOST_FIXTURE_TEST_CASE(configured_checkout_is_kept, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  config.work_dir = (dir / "checkout").string();
  fs::create_directories(config.work_dir);
  history.commits = numbered_commits(1, "g");
  run();

  BOOST_CHECK_EQUAL(cvs.work_dir, config.work_dir);
  BOOST_CHECK(fs::exists(config.work_dir));
  }

BOOST_FIXTURE_TEST_CASE(export_failure_keeps_earlier_progress, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  history.commits = numbered_commits(3, "g");
  cvs.fail_on = "g2";

  BOOST_CHECK_THROW(run(), apply_error);
  BOOST_CHECK_EQUAL(saved().last_git_commit, "g1");
  }

BOOST_FIXTURE_TEST_CASE(imported_commits_are_not_exported_back, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  history.commits = numbered_commits(1, "g");
  git.mirror = &history.commits;
  source.commits = numbered_commits(2, "c");

  sync_state state;
  state.last_git_commit = "g1";
  save_sync_state(config.state_file, state);

  run_report report = run();

  BOOST_CHECK_EQUAL(git.applied.size(), 2u);
  BOOST_CHECK(cvs.applied.empty());
  BOOST_CHECK_EQUAL(report.applied, 2u);
  BOOST_CHECK_EQUAL(saved().last_git_commit, "git-c2");
  }

BOOST_FIXTURE_TEST_CASE(failed_tip_snapshot_is_a_warning, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  history.commits = numbered_commits(2, "g");
  history.head_fails = true;

  sync_state state;
  state.last_git_commit = "g1";
  save_sync_state(config.state_file, state);

  run_report report = run();

  BOOST_CHECK_EQUAL(report.count(warning_kind::tip_snapshot), 1u);
  std::vector<std::string> expected = { "g2" };
  BOOST_CHECK(cvs.applied == expected);
  }

BOOST_FIXTURE_TEST_CASE(exported_commits_are_not_imported_back, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  history.commits = numbered_commits(2, "g");
  // Keeps the tip snapshot from marking g2 as synced
  history.head_fails = true;

  sync_state state;
  state.last_git_commit = "g1";
  state.last_cvs_sync = at(1000);
  save_sync_state(config.state_file, state);

  run();
  std::vector<std::string> exported = { "g2" };
  BOOST_CHECK(cvs.applied == exported);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, at(1000));

  // What the pass above committed to CVS
  commit echo = make_commit("cvs-g2", "dev", 5000);
  echo.message = cvs_workspace::log_message(history.commits[1]);
  source.commits.push_back(echo);

  run_report report = run();
  BOOST_CHECK(git.applied.empty());
  BOOST_CHECK_EQUAL(report.applied, 0u);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, at(1000));
  }

BOOST_FIXTURE_TEST_CASE(cvs_commits_made_during_an_export_are_imported, sync_fixture)
  {
  config.direction = sync_direction::bidirectional;
  history.commits = numbered_commits(2, "g");
  // Keeps the tip snapshot from marking g2 as synced
  history.head_fails = true;

  sync_state state;
  state.last_git_commit = "g1";
  state.last_cvs_sync = at(1000);
  save_sync_state(config.state_file, state);

  run();
  BOOST_CHECK_EQUAL(cvs.applied.size(), 1u);

  // A colleague committed to CVS while g2 was being exported
  commit echo = make_commit("cvs-g2", "dev", 5000);
  echo.message = cvs_workspace::log_message(history.commits[1]);
  source.commits.push_back(make_commit("colleague", "carol", 4000));
  source.commits.push_back(echo);
  source.commits.push_back(make_commit("late", "carol", 6000));

  run_report report = run();
  std::vector<std::string> expected = { "colleague", "late" };
  BOOST_CHECK(git.applied == expected);
  BOOST_CHECK_EQUAL(report.applied, 2u);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, at(6000));
  }

BOOST_FIXTURE_TEST_CASE(git_to_cvs_dry_run_has_no_side_effects, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  config.dry_run = true;
  history.commits = numbered_commits(2, "g");

  std::size_t const checkouts = temporary_checkouts();
  run_report report = run();

  BOOST_CHECK_EQUAL(report.applied, 0u);
  BOOST_CHECK_EQUAL(cvs.inits, 0u);
  BOOST_CHECK(cvs.applied.empty());
  BOOST_CHECK(cvs.work_dir.empty());
  BOOST_CHECK_EQUAL(temporary_checkouts(), checkouts);
  BOOST_CHECK(!fs::exists(config.state_file));
  }

BOOST_FIXTURE_TEST_CASE(unwritable_work_dir_is_a_validation_error, sync_fixture)
  {
  config.direction = sync_direction::git_to_cvs;
  std::ofstream((dir / "blocker").string().c_str()) << "x";
  config.work_dir = (dir / "blocker" / "checkout").string();
  history.commits = numbered_commits(1, "g");

  try
  {
      run();
      BOOST_ERROR("work directory failure must be reported");
  }
  catch (error const& e)
  {
      BOOST_CHECK(e.phase() == error_phase::validation);
  }
  BOOST_CHECK_EQUAL(cvs.inits, 0u);
  }

// A real CVS repository on the reading side
struct cvs_sync_fixture : sync_fixture
{
    cvs_sync_fixture()
    {
        fs::create_directories(dir / "cvsroot" / "CVSROOT");
        fs::create_directories(dir / "cvsroot" / "proj");
        config.cvs_path = (dir / "cvsroot").string();
        config.cvs_module = "proj";
        git.mirror = &imported;
    }

    void write(std::string const& name, std::vector<revision> const& revs)
    {
        std::ofstream out((dir / "cvsroot" / "proj" / name).string().c_str(), std::ios::binary);
        out << rcs_text(revs);
    }

    run_report run()
    {
        return std::unique_ptr<syncer>(new syncer(
            config,
            [](sync_config const& c)
            { return std::unique_ptr<source_reader>(new cvs_repository(c.cvs_path, c.cvs_module)); },
            [this]()
            { return std::unique_ptr<target_writer>(new fake_target(git)); },
            [this](std::string const&)
            { return std::unique_ptr<history_reader>(new fake_history(history)); },
            [this](sync_config const&)
            { return std::unique_ptr<source_writer>(new fake_source_writer(cvs)); }))->run();
    }

    std::vector<commit> imported;
};

BOOST_FIXTURE_TEST_CASE(late_file_in_a_changeset_is_still_synced, cvs_sync_fixture)
  {
  write("a.txt,v", std::vector<revision>{ rev("alice", "2024.01.01.12.00.00", "wip", "a\n") });
  BOOST_CHECK_EQUAL(run().applied, 1u);

  // Same author and message, inside the window of the changeset already synced
  write("b.txt,v", std::vector<revision>{ rev("alice", "2024.01.01.12.02.00", "wip", "b\n") });
  run_report report = run();

  BOOST_CHECK_EQUAL(report.applied, 1u);
  BOOST_REQUIRE_EQUAL(imported.size(), 2u);
  bool found = false;
  for (auto const& f : imported.back().files)
      found = found || f.path == "b.txt";
  BOOST_CHECK(found);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, pt::time_from_string("2024-01-01 12:02:00"));
  }

BOOST_FIXTURE_TEST_CASE(changesets_sync_in_date_order, cvs_sync_fixture)
  {
  write("a.txt,v", std::vector<revision>{ rev("alice", "2024.01.01.12.00.00", "import", "a\n") });
  write("b.txt,v", std::vector<revision>{ rev("bob", "2024.01.01.12.01.00", "fix", "b\n") });
  write("c.txt,v", std::vector<revision>{ rev("alice", "2024.01.01.12.03.00", "import", "c\n") });

  BOOST_CHECK_EQUAL(run().applied, 3u);
  BOOST_REQUIRE_EQUAL(imported.size(), 3u);
  BOOST_CHECK(imported[0].date <= imported[1].date);
  BOOST_CHECK(imported[1].date <= imported[2].date);
  BOOST_CHECK_EQUAL(saved().last_cvs_sync, imported[2].date);

  // Nothing is left behind the watermark
  BOOST_CHECK_EQUAL(run().applied, 0u);
  }

BOOST_FIXTURE_TEST_CASE(missing_paths_are_configuration_errors, sync_fixture)
  {
  config.git_path.clear();
  BOOST_CHECK_THROW(run(), configuration_error);
  BOOST_CHECK_EQUAL(source.constructed, 0u);
  }
