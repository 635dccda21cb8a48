// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "git_repository.hpp"
#include "git_executable.hpp"
#include "command.hpp"
#include "log.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <stdexcept>

namespace git_migrator {

namespace fs = boost::filesystem;
using boost::algorithm::trim_copy;

git_repository::git_repository()
    : created(false), bare(false), last_mark(0)
{
}

git_repository::~git_repository()
{
    if (fast_import_ && fast_import_->running())
        Log::warn() << "repository " << path << " destroyed without close()" << std::endl;
}

bool git_repository::ensure_existence(std::string const& path)
{
    fs::path dir(path);
    if (fs::exists(dir))
    {
        if (!fs::is_directory(dir))
            throw std::runtime_error(path + " exists and is not a directory");
        if (fs::exists(dir / ".git")
            || (fs::exists(dir / "HEAD") && fs::is_directory(dir / "objects")))
            return false;
    }

    // Create the new repository
    fs::create_directories(dir);
    run_checked(git_executable(), {"init", "--quiet"}, path);
    Log::info() << "initialized Git repository " << path << std::endl;
    return true;
}

void git_repository::init(std::string const& path)
{
    created = ensure_existence(path);
    open(path);
}

void git_repository::open(std::string const& path)
{
    if (!fs::is_directory(path))
        throw std::runtime_error("Git repository " + path + " does not exist");

    this->path = path;
    command_result probe = run_command(git_executable(), {"rev-parse", "--is-bare-repository"}, path);
    if (probe.exit_code != 0)
        throw std::runtime_error(path + " is not a Git repository");
    bare = trim_copy(probe.out) == "true";

    command_result symref = run_command(git_executable(), {"symbolic-ref", "-q", "HEAD"}, path);
    ref = symref.exit_code == 0 ? trim_copy(symref.out) : "refs/heads/master";

    command_result head = run_command(git_executable(), {"rev-parse", "--verify", "-q", ref}, path);
    tip = head.exit_code == 0 ? trim_copy(head.out) : std::string();
    opened_at = tip;

    Log::debug() << "opened " << path << " at " << ref
                 << (tip.empty() ? " (no commits)" : " " + tip) << std::endl;
}

git_fast_import& git_repository::fast_import()
{
    if (path.empty())
        throw std::runtime_error("repository not initialized");
    if (!fast_import_)
        fast_import_.reset(new git_fast_import(path));
    return *fast_import_;
}

std::string git_repository::git(std::vector<std::string> const& args)
{
    return trim_copy(run_checked(git_executable(), args, path));
}

std::string git_repository::apply_commit(commit const& c)
{
    git_fast_import& fi = fast_import();
    std::size_t mark = ++last_mark;

    std::string message = c.message;
    if (message.empty() || message[message.size() - 1] != '\n')
        message += '\n';

    fi.commit(ref, mark, c.author + " <" + c.email + ">", epoch_seconds(c.date), message);

    // The first commit of this session continues the existing history
    if (mark == 1 && !tip.empty())
        fi.from(tip);

    for (auto const& f : c.files)
    {
        if (f.action == change_action::remove)
        {
            fi.filedelete(f.path);
        }
        else
        {
            fi.filemodify_hdr(f.path);
            fi.data(f.content.data(), f.content.size());
        }
    }
    fi << LF;

    tip = fi.get_mark(mark);
    Log::trace() << "commit " << c.revision << " written as " << tip << std::endl;
    return tip;
}

void git_repository::flush()
{
    if (fast_import_ && fast_import_->running())
        fast_import_->checkpoint();
}

std::string git_repository::resolve(std::string const& ref)
{
    if (ref.empty() || ref == "HEAD")
    {
        if (tip.empty())
            throw std::runtime_error("no commits to point at");
        return tip;
    }
    return git({"rev-parse", "--verify", "-q", ref + "^{commit}"});
}

void git_repository::create_branch(std::string const& name, std::string const& ref)
{
    flush();
    std::string target = resolve(ref);
    git({"branch", name, target});
    Log::debug() << "created branch " << name << " at " << target << std::endl;
}

void git_repository::create_tag(
    std::string const& name, std::string const& ref, std::string const& message)
{
    flush();
    std::string target = resolve(ref);
    if (message.empty())
    {
        git({"tag", name, target});
    }
    else
    {
        // The tagger is the author of the tagged commit
        std::string who = git({"log", "-1", "--format=%an%n%ae", target});
        std::string::size_type nl = who.find('\n');
        std::string tagger_name = who.substr(0, nl);
        std::string tagger_email = nl == std::string::npos ? "" : who.substr(nl + 1);
        git({"-c", "user.name=" + tagger_name, "-c", "user.email=" + tagger_email,
             "tag", "-a", "-m", message, name, target});
    }
    Log::debug() << "created tag " << name << " at " << target << std::endl;
}

std::string git_repository::head()
{
    return tip;
}

// Brings the checked-out files in line with what fast-import wrote
void git_repository::update_work_tree()
{
    if (bare || tip == opened_at)
        return;
    try
    {
        if (created || opened_at.empty())
            git({"reset", "--hard", "-q"});
        else
            git({"read-tree", "-m", "-u", opened_at, tip});
    }
    catch (std::exception const& e)
    {
        Log::warn() << "could not update the work tree of " << path << ": " << e.what() << std::endl;
    }
}

void git_repository::close()
{
    if (fast_import_)
    {
        std::unique_ptr<git_fast_import> fi(std::move(fast_import_));
        fi->finish();
        update_work_tree();
    }
}

} // namespace git_migrator
