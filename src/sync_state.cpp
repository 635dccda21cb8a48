// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "sync_state.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace git_migrator {

namespace fs = boost::filesystem;
namespace pt = boost::posix_time;
namespace ptree = boost::property_tree;

static std::string format_time(pt::ptime const& t)
{
    return t.is_not_a_date_time() ? std::string() : pt::to_iso_extended_string(t) + "Z";
}

static pt::ptime parse_time(std::string text, std::string const& key, std::string const& path)
{
    if (text.empty())
        return pt::ptime();
    if (text.back() == 'Z')
        text.erase(text.size() - 1);
    try
    {
        return pt::from_iso_extended_string(text);
    }
    catch (std::exception const& e)
    {
        throw state_error("invalid " + key + " in sync state " + path + ": " + e.what());
    }
}

sync_state load_sync_state(std::string const& path)
{
    sync_state state;
    if (path.empty() || !fs::exists(path))
    {
        Log::debug() << "no sync state at '" << path << "', starting from scratch" << std::endl;
        return state;
    }

    ptree::ptree tree;
    try
    {
        ptree::read_json(path, tree);
    }
    catch (ptree::json_parser_error const& e)
    {
        throw state_error("failed to load sync state: " + std::string(e.what()));
    }

    state.last_git_commit = tree.get("last_git_commit", "");
    state.last_cvs_sync = parse_time(tree.get("last_cvs_sync", ""), "last_cvs_sync", path);
    state.synced_at = parse_time(tree.get("synced_at", ""), "synced_at", path);
    return state;
}

void save_sync_state(std::string const& path, sync_state const& state)
{
    ptree::ptree tree;
    tree.put("last_git_commit", state.last_git_commit);
    tree.put("last_cvs_sync", format_time(state.last_cvs_sync));
    tree.put("synced_at", format_time(state.synced_at));

    fs::path target(path);
    if (target.has_parent_path())
        fs::create_directories(target.parent_path());

    fs::path temporary = target;
    temporary += ".tmp";
    ptree::write_json(temporary.string(), tree);
    fs::rename(temporary, target);
}

} // namespace git_migrator
