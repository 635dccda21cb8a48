// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "config.hpp"
#include "errors.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/property_tree/info_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <ostream>

namespace git_migrator {

namespace ptree = boost::property_tree;

char const* to_string(sync_direction d)
{
    switch (d)
    {
    case sync_direction::git_to_cvs:    return "git-to-cvs";
    case sync_direction::cvs_to_git:    return "cvs-to-git";
    case sync_direction::bidirectional: return "bidirectional";
    }
    return "unknown";
}

sync_direction parse_sync_direction(std::string const& name)
{
    if (name == "git-to-cvs")
        return sync_direction::git_to_cvs;
    if (name == "cvs-to-git")
        return sync_direction::cvs_to_git;
    if (name == "bidirectional")
        return sync_direction::bidirectional;
    throw configuration_error("unknown sync direction '" + name + "'");
}

std::string default_state_file(std::string const& target_path)
{
    boost::filesystem::path parent = boost::filesystem::path(target_path).parent_path();
    return (parent / ".git-migrator-state.db").string();
}

static ptree::ptree read_tree(std::string const& path)
{
    ptree::ptree tree;
    try
    {
        if (boost::algorithm::iends_with(path, ".json"))
            ptree::read_json(path, tree);
        else
            ptree::read_info(path, tree);
    }
    catch (ptree::file_parser_error const& e)
    {
        throw configuration_error("failed to load configuration: " + std::string(e.what()));
    }
    return tree;
}

static std::string required(ptree::ptree const& tree, char const* key)
{
    std::string value = tree.get(key, "");
    if (value.empty())
        throw configuration_error(std::string(key) + " is required");
    return value;
}

static name_map read_map(ptree::ptree const& tree, char const* key)
{
    name_map result;
    if (auto child = tree.get_child_optional(key))
    {
        for (auto const& entry : *child)
            result[entry.first] = entry.second.data();
    }
    return result;
}

template <class T>
static T read_value(ptree::ptree const& tree, char const* key, T fallback)
{
    auto child = tree.get_child_optional(key);
    if (!child || child->data().empty())
        return fallback;
    boost::optional<T> value = child->get_value_optional<T>();
    if (!value)
        throw configuration_error(std::string("invalid value for ") + key + ": '" + child->data() + "'");
    return *value;
}

migration_config load_migration_config(std::string const& path)
{
    ptree::ptree const tree = read_tree(path);
    migration_config config;

    config.source_type = required(tree, "source.type");
    config.source_path = required(tree, "source.path");
    config.source_module = tree.get("source.module", "");
    config.target_type = tree.get("target.type", "git");
    config.target_path = required(tree, "target.path");
    config.target_remote = tree.get("target.remote", "");

    config.authors = read_map(tree, "mapping.authors");
    config.authors_file = tree.get("mapping.authorsFile", "");
    config.branches = read_map(tree, "mapping.branches");
    config.tags = read_map(tree, "mapping.tags");

    config.dry_run = read_value(tree, "options.dryRun", false);
    config.verbose = read_value(tree, "options.verbose", false);
    config.resume = read_value(tree, "options.resume", false);
    config.chunk_size = read_value(tree, "options.chunkSize", 0);
    if (config.chunk_size == 0)
        config.chunk_size = 100;
    config.state_file = tree.get("options.stateFile", "");
    if (config.state_file.empty())
        config.state_file = default_state_file(config.target_path);

    if (config.target_type != "git")
        throw configuration_error("unsupported target type '" + config.target_type + "'");
    return config;
}

sync_config load_sync_config(std::string const& path)
{
    ptree::ptree const tree = read_tree(path);
    sync_config config;

    config.git_path = required(tree, "git.path");
    config.cvs_path = required(tree, "cvs.path");
    config.cvs_module = required(tree, "cvs.module");
    config.work_dir = tree.get("cvs.workDir", "");
    config.direction = parse_sync_direction(tree.get("sync.direction", "bidirectional"));
    config.state_file = tree.get("sync.stateFile", "");
    config.authors = read_map(tree, "mapping.authors");
    config.authors_file = tree.get("mapping.authorsFile", "");
    config.dry_run = read_value(tree, "options.dryRun", false);
    config.verbose = read_value(tree, "options.verbose", false);
    return config;
}

static void print_map(std::ostream& os, char const* title, name_map const& m, bool verbose)
{
    if (m.empty())
        return;
    os << "\n" << title << ": " << m.size() << "\n";
    if (!verbose)
        return;
    for (auto const& entry : m)
        os << "  " << entry.first << " -> " << entry.second << "\n";
}

void print(std::ostream& os, migration_config const& config)
{
    os << "\nMigration Configuration\n"
       << "=======================\n"
       << "Source Type:    " << config.source_type << "\n"
       << "Source Path:    " << config.source_path << "\n"
       << "Target Path:    " << config.target_path << "\n"
       << "State File:     " << config.state_file << "\n"
       << "Chunk Size:     " << config.chunk_size << "\n"
       << "Dry Run:        " << std::boolalpha << config.dry_run << "\n"
       << "Resume:         " << config.resume << "\n";
    print_map(os, "Author Mappings", config.authors, config.verbose);
    print_map(os, "Branch Mappings", config.branches, config.verbose);
    print_map(os, "Tag Mappings", config.tags, config.verbose);
}

void print(std::ostream& os, sync_config const& config)
{
    os << "\nSync Configuration\n"
       << "==================\n"
       << "Git Repository:  " << config.git_path << "\n"
       << "CVS Repository:  " << config.cvs_path << "\n"
       << "CVS Module:      " << config.cvs_module << "\n"
       << "Direction:       " << to_string(config.direction) << "\n"
       << "State File:      " << (config.state_file.empty() ? "(none)" : config.state_file) << "\n"
       << "Dry Run:         " << std::boolalpha << config.dry_run << "\n";
    print_map(os, "Author Mappings", config.authors, config.verbose);
}

} // namespace git_migrator
