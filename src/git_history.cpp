// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "git_history.hpp"
#include "git_executable.hpp"
#include "command.hpp"
#include "log.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <sstream>

namespace git_migrator {

namespace fs = boost::filesystem;

git_history::git_history(std::string const& path)
    : path(path)
{
}

std::string git_history::git(std::vector<std::string> const& args)
{
    return run_checked(git_executable(), args, path);
}

void git_history::validate()
{
    if (!fs::is_directory(path))
        throw std::runtime_error("Git repository " + path + " does not exist");
    if (run_command(git_executable(), {"rev-parse", "--git-dir"}, path).exit_code != 0)
        throw std::runtime_error(path + " is not a Git repository");
}

std::string git_history::head_revision()
{
    command_result head = run_command(git_executable(), {"rev-parse", "--verify", "-q", "HEAD"}, path);
    return head.exit_code == 0 ? boost::algorithm::trim_copy(head.out) : std::string();
}

std::vector<std::string> git_history::revisions()
{
    std::vector<std::string> result;
    if (head_revision().empty())
        return result;

    std::istringstream lines(git({"rev-list", "--reverse", "--topo-order", "HEAD"}));
    std::string line;
    while (std::getline(lines, line))
    {
        if (!line.empty())
            result.push_back(line);
    }
    return result;
}

commit git_history::read_commit(std::string const& sha)
{
    // Fields are NUL separated; the message comes last because it may
    // contain anything but NUL.
    std::string meta = git({"show", "-s", "--format=%H%x00%an%x00%ae%x00%at%x00%B", sha});
    std::vector<std::string> fields;
    boost::algorithm::split(fields, meta, [](char c) { return c == '\0'; });
    if (fields.size() < 5)
        throw std::runtime_error("cannot parse metadata of commit " + sha);

    commit c;
    c.revision = fields[0];
    c.author = fields[1];
    c.email = fields[2];
    c.date = from_epoch_seconds(boost::lexical_cast<long long>(fields[3]));
    c.message = boost::algorithm::trim_right_copy(fields[4]);

    // "<status>\0<path>\0" pairs
    std::string changes = git({"diff-tree", "-r", "--root", "--no-commit-id",
                               "--no-renames", "--name-status", "-z", sha});
    std::vector<std::string> parts;
    boost::algorithm::split(parts, changes, [](char c) { return c == '\0'; });
    for (std::size_t i = 0; i + 1 < parts.size(); i += 2)
    {
        std::string const& status = parts[i];
        std::string const& file = parts[i + 1];
        if (status.empty())
            continue;

        switch (status[0])
        {
        case 'D':
            c.files.push_back(file_change(file, change_action::remove));
            break;
        case 'A':
            c.files.push_back(file_change(file, change_action::add,
                                          git({"cat-file", "blob", sha + ":" + file})));
            break;
        default:
            c.files.push_back(file_change(file, change_action::modify,
                                          git({"cat-file", "blob", sha + ":" + file})));
        }
    }
    return c;
}

std::vector<commit> git_history::commits()
{
    return commits_since(std::string());
}

std::vector<commit> git_history::commits_since(std::string const& revision)
{
    std::vector<std::string> all = revisions();
    auto first = all.begin();
    if (!revision.empty())
    {
        auto found = std::find(all.begin(), all.end(), revision);
        if (found != all.end())
            first = found + 1;
        else
            Log::debug() << "revision " << revision << " not in the history of "
                         << path << ", reading all commits" << std::endl;
    }

    std::vector<commit> result;
    for (auto it = first; it != all.end(); ++it)
        result.push_back(read_commit(*it));
    return result;
}

} // namespace git_migrator
