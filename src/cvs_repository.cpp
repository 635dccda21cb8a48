// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "cvs_repository.hpp"
#include "rcs_file.hpp"
#include "hash.hpp"
#include "log.hpp"

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <algorithm>
#include <stdexcept>

namespace git_migrator {

namespace fs = boost::filesystem;
namespace pt = boost::posix_time;

pt::time_duration const cvs_repository::cluster_window = pt::minutes(5);

cvs_repository::cvs_repository(std::string const& path, std::string const& module)
    : root(path), module(module), loaded(false), files(0)
{
}

void cvs_repository::validate()
{
    warnings_.clear();
    fs::path repo(root);
    if (!fs::exists(repo))
        throw std::runtime_error("path does not exist: " + root);
    if (!fs::is_directory(repo))
        throw std::runtime_error("path is not a directory: " + root);

    fs::path cvsroot = repo / "CVSROOT";
    if (!fs::is_directory(cvsroot))
        throw std::runtime_error("CVSROOT directory not found in " + root);

    for (char const* name : {"history", "val-tags"})
    {
        if (!fs::exists(cvsroot / name))
        {
            warnings_.push_back(std::string("CVSROOT/") + name + " not found");
            Log::debug() << "optional file CVSROOT/" << name << " not found in " << root << std::endl;
        }
    }

    if (!module.empty() && !fs::is_directory(repo / module))
        throw std::runtime_error("module " + module + " not found in " + root);
}

void cvs_repository::load()
{
    if (loaded)
        return;
    scan(module.empty() ? root : (fs::path(root) / module).string());
    cluster();
    loaded = true;
    Log::debug() << "read " << revisions.size() << " file revisions from " << files
                 << " RCS files, " << changesets.size() << " changesets" << std::endl;
}

void cvs_repository::scan(std::string const& dir)
{
    fs::path base = module.empty() ? fs::path(root) : fs::path(root) / module;

    // Sorted, so that the result doesn't depend on directory order
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(dir), end; it != end; ++it)
        entries.push_back(it->path());
    std::sort(entries.begin(), entries.end());

    for (auto const& entry : entries)
    {
        std::string name = entry.filename().string();
        if (fs::is_directory(entry))
        {
            if (name != "CVSROOT")
                scan(entry.string());
            continue;
        }
        if (!boost::algorithm::ends_with(name, ",v"))
            continue;

        // dir/Attic/file,v holds the removed file dir/file
        fs::path relative = entry.parent_path().lexically_relative(base);
        if (relative.filename() == "Attic")
            relative = relative.parent_path();
        relative /= name.substr(0, name.size() - 2);

        std::string path = relative.generic_string();
        if (boost::algorithm::starts_with(path, "./"))
            path.erase(0, 2);
        read_file(entry.string(), path);
    }
}

void cvs_repository::read_file(std::string const& rcs_path, std::string const& path)
{
    rcs_file rcs;
    std::vector<std::string> trunk;
    std::map<std::string, std::string> texts;
    try
    {
        rcs = read_rcs_file(rcs_path);
        trunk = rcs.trunk();
        texts = rcs.trunk_texts();
    }
    catch (std::runtime_error const& e)
    {
        warnings_.push_back("skipped " + rcs_path + ": " + e.what());
        Log::warn() << "skipping " << rcs_path << ": " << e.what() << std::endl;
        return;
    }
    ++files;

    // Oldest first
    std::reverse(trunk.begin(), trunk.end());
    bool alive = false;
    for (auto const& rev : trunk)
    {
        rcs_delta const& d = rcs.delta(rev);

        file_revision r;
        r.path = path;
        r.rcs_revision = rev;
        r.author = d.author;
        r.date = d.date;
        r.log = boost::algorithm::trim_right_copy(d.log);

        if (d.dead())
        {
            // Also drops the dead 1.1 of files first added on a branch
            if (!alive)
                continue;
            r.action = change_action::remove;
            alive = false;
        }
        else
        {
            r.action = alive ? change_action::modify : change_action::add;
            r.content = texts[rev];
            alive = true;
        }
        revisions.push_back(r);
    }

    for (auto const& symbol : rcs.symbols)
    {
        if (is_branch_number(symbol.second))
            branch_names.insert(symbol.first);
        else
            tagged.insert(std::make_pair(symbol.first, std::make_pair(path, symbol.second)));
    }
}

namespace {

struct cluster_t
{
    pt::ptime first;
    pt::ptime last;
    std::string author;
    std::string log;
    std::set<std::string> paths;
    std::vector<std::size_t> members;
};

bool earlier(cvs_repository::file_revision const& a, cvs_repository::file_revision const& b)
{
    if (a.date != b.date)
        return a.date < b.date;
    if (a.path != b.path)
        return a.path < b.path;
    return a.rcs_revision < b.rcs_revision;
}

} // unnamed namespace

void cvs_repository::cluster()
{
    std::stable_sort(revisions.begin(), revisions.end(), earlier);

    // Only the newest changeset takes further revisions.  Changesets
    // therefore cover disjoint time spans, and dating each by its latest
    // member keeps dates ascending in commit order.
    std::vector<cluster_t> clusters;
    for (std::size_t i = 0; i < revisions.size(); ++i)
    {
        file_revision const& r = revisions[i];

        bool join = false;
        if (!clusters.empty())
        {
            cluster_t const& newest = clusters.back();
            join = newest.author == r.author && newest.log == r.log
                && r.date <= newest.first + cluster_window
                && newest.paths.count(r.path) == 0;
        }
        if (!join)
        {
            cluster_t fresh;
            fresh.first = r.date;
            fresh.author = r.author;
            fresh.log = r.log;
            clusters.push_back(fresh);
        }
        cluster_t& target = clusters.back();
        target.last = r.date;
        target.paths.insert(r.path);
        target.members.push_back(i);
    }

    changesets.clear();
    changeset_of.clear();
    for (auto const& cl : clusters)
    {
        commit c;
        c.author = cl.author;
        c.date = cl.last;
        c.message = cl.log;

        std::vector<std::string> entries;
        for (std::size_t m : cl.members)
        {
            file_revision const& r = revisions[m];
            entries.push_back(r.path + ":" + r.rcs_revision);
            c.files.push_back(file_change(r.path, r.action, r.content));
            changeset_of[std::make_pair(r.path, r.rcs_revision)] = changesets.size();
        }
        std::sort(entries.begin(), entries.end());
        c.revision = "cvs-" + to_hex(sha1(boost::algorithm::join(entries, "\n")), 6);

        std::sort(c.files.begin(), c.files.end(),
                  [](file_change const& a, file_change const& b) { return a.path < b.path; });
        changesets.push_back(c);
    }
}

std::vector<commit> cvs_repository::commits()
{
    load();
    return changesets;
}

std::vector<std::string> cvs_repository::branches()
{
    load();
    return std::vector<std::string>(branch_names.begin(), branch_names.end());
}

std::map<std::string, std::string> cvs_repository::tags()
{
    load();
    std::map<std::string, std::size_t> latest;
    for (auto const& t : tagged)
    {
        auto found = changeset_of.find(t.second);
        if (found == changeset_of.end())
            continue;
        auto& slot = latest[t.first];
        slot = std::max(slot, found->second + 1);
    }

    std::map<std::string, std::string> result;
    for (auto const& l : latest)
        result[l.first] = changesets[l.second - 1].revision;
    return result;
}

std::size_t cvs_repository::file_count()
{
    load();
    return files;
}

} // namespace git_migrator
