// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "cvs_workspace.hpp"
#include "git_executable.hpp"
#include "command.hpp"
#include "log.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <set>
#include <stdexcept>

namespace git_migrator {

namespace fs = boost::filesystem;

cvs_workspace::cvs_workspace(std::string const& cvsroot, std::string const& module)
    : cvsroot(fs::absolute(cvsroot).string()), module(module)
{
}

std::string cvs_workspace::cvs(std::vector<std::string> const& args)
{
    std::vector<std::string> full = {"-Q", "-d", cvsroot};
    full.insert(full.end(), args.begin(), args.end());
    return run_checked(cvs_executable(), full, work_dir);
}

void cvs_workspace::init(std::string const& work_dir)
{
    fs::create_directories(work_dir);
    this->work_dir = work_dir;
    cvs({"checkout", "-d", ".", module});
    Log::debug() << "checked out " << module << " into " << work_dir << std::endl;
}

std::string cvs_workspace::log_message(commit const& c)
{
    std::string message = c.message.empty() ? "*** empty log message ***" : c.message;
    return message + "\n\nGit-Author: " + c.author + " <" + c.email + ">";
}

bool cvs_workspace::exported(std::string const& message)
{
    // The trailer is the last paragraph and a single line
    std::string::size_type at = message.rfind("\n\nGit-Author: ");
    return at != std::string::npos && message.find('\n', at + 2) == std::string::npos;
}

void cvs_workspace::apply_commit(commit const& c)
{
    if (work_dir.empty())
        throw std::runtime_error("CVS working directory not initialized");

    fs::path const base(work_dir);

    // Directories unknown to CVS must be added before the files in
    // them.  A std::set orders a directory before its subdirectories.
    std::set<std::string> new_dirs;
    std::vector<std::string> added, removed;

    for (auto const& f : c.files)
    {
        fs::path file = base / f.path;
        if (f.action == change_action::remove)
        {
            fs::remove(file);
            removed.push_back(f.path);
            continue;
        }

        fs::path relative_dir = fs::path(f.path).parent_path();
        fs::path dir;
        for (auto const& part : relative_dir)
        {
            dir /= part;
            if (!fs::is_directory(base / dir / "CVS"))
                new_dirs.insert(dir.generic_string());
        }

        fs::create_directories(file.parent_path());
        fs::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(f.content.data(), f.content.size());
        out.close();
        if (!out)
            throw std::runtime_error("cannot write " + file.string());

        if (f.action == change_action::add)
            added.push_back(f.path);
    }

    for (auto const& dir : new_dirs)
        cvs({"add", dir});

    if (!added.empty())
    {
        std::vector<std::string> args = {"add"};
        args.insert(args.end(), added.begin(), added.end());
        cvs(args);
    }
    if (!removed.empty())
    {
        std::vector<std::string> args = {"remove"};
        args.insert(args.end(), removed.begin(), removed.end());
        cvs(args);
    }

    cvs({"commit", "-m", log_message(c)});
    Log::debug() << "committed " << short_revision(c.revision) << " to CVS module "
                 << module << std::endl;
}

} // namespace git_migrator
