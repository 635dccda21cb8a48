/*
 *  Copyright (C) 2007  Thiago Macieira <thiago@kde.org>
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/program_options.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "authors.hpp"
#include "config.hpp"
#include "cvs_repository.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "migrator.hpp"
#include "options.hpp"
#include "sqlite_checkpoint_store.hpp"
#include "syncer.hpp"

namespace po = boost::program_options;
using namespace git_migrator;

static char const version[] = "git-migrator 0.1";

// Prints a line whenever the reported operation changes
static progress_reporter::unsubscriber print_progress(progress_reporter& progress)
{
    std::shared_ptr<std::string> last(new std::string);
    return progress.subscribe([last](progress_status const& status)
        {
            if (status.operation == *last)
                return;
            *last = status.operation;
            std::ostringstream line;
            line << "[" << status.current << "/" << status.total << " "
                 << std::fixed << std::setprecision(1) << status.percentage << "%";
            if (status.eta.total_seconds() > 0)
                line << ", eta " << status.eta;
            line << "] " << status.operation;
            Log::info() << line.str() << std::endl;
        });
}

static void print_warnings(run_report const& report)
{
    for (auto const& w : report.warnings)
        std::cerr << "  " << to_string(w.kind) << " " << w.subject << ": " << w.message << std::endl;
}

static po::variables_map parse(
    po::options_description const& description, std::vector<std::string> const& args)
{
    po::variables_map variables;
    store(po::command_line_parser(args).options(description).run(), variables);
    notify(variables);
    return variables;
}

static int migrate_command(std::vector<std::string> const& args)
{
    std::string config_file;
    std::string authors_file;
    po::options_description description("migrate options");
    description.add_options()
        ("config,c", po::value(&config_file)->value_name("FILENAME")->required(), "migration configuration file")
        ("dry-run", "read the source but write nothing")
        ("resume", "continue an interrupted migration")
        ("authors", po::value(&authors_file)->value_name("FILENAME"), "map between cvs username and Git identity")
        ;
    po::variables_map variables = parse(description, args);

    migration_config config = load_migration_config(config_file);
    if (variables.count("dry-run"))
        config.dry_run = true;
    if (variables.count("resume"))
        config.resume = true;
    if (!authors_file.empty())
        config.authors_file = authors_file;
    if (config.verbose && Log::get_level() < Log::Debug)
        Log::set_level(Log::Debug);

    if (config.verbose || config.dry_run)
        print(std::cout, config);

    migrator m(config);
    progress_reporter::unsubscriber unsubscribe = print_progress(m.progress());
    run_report report = m.run();
    unsubscribe();

    std::cout << "Migrated " << report.applied << " commits"
              << (config.dry_run ? " (dry run)" : "") << std::endl;
    if (!report.warnings.empty())
    {
        std::cerr << "Warnings:" << std::endl;
        print_warnings(report);
    }
    return Log::result();
}

static int sync_command(std::vector<std::string> const& args)
{
    std::string config_file;
    std::string authors_file;
    std::string direction;
    po::options_description description("sync options");
    description.add_options()
        ("config,c", po::value(&config_file)->value_name("FILENAME")->required(), "sync configuration file")
        ("dry-run", "list what would be synced")
        ("direction", po::value(&direction)->value_name("DIRECTION"), "git-to-cvs, cvs-to-git or bidirectional")
        ("authors", po::value(&authors_file)->value_name("FILENAME"), "map between cvs username and Git identity")
        ;
    po::variables_map variables = parse(description, args);

    sync_config config = load_sync_config(config_file);
    if (variables.count("dry-run"))
        config.dry_run = true;
    if (!direction.empty())
        config.direction = parse_sync_direction(direction);
    if (!authors_file.empty())
        config.authors_file = authors_file;
    if (config.verbose && Log::get_level() < Log::Debug)
        Log::set_level(Log::Debug);

    if (config.verbose || config.dry_run)
        print(std::cout, config);

    syncer s(config);
    progress_reporter::unsubscriber unsubscribe = print_progress(s.progress());
    run_report report = s.run();
    unsubscribe();

    std::cout << "Synced " << report.applied << " commits" << std::endl;
    if (!report.warnings.empty())
    {
        std::cerr << "Warnings:" << std::endl;
        print_warnings(report);
    }
    return Log::result();
}

static cvs_repository open_source(std::string const& type, std::string const& path, std::string const& module)
{
    if (type == "svn")
        throw configuration_error("svn repositories are not supported yet");
    if (type != "cvs")
        throw configuration_error("unsupported source type: " + type + " (supported: cvs, svn)");
    cvs_repository source(path, module);
    source.validate();
    for (auto const& w : source.warnings())
        Log::warn() << w << std::endl;
    return source;
}

static int analyze_command(std::vector<std::string> const& args)
{
    std::string source_path;
    std::string source_type;
    std::string module;
    po::options_description description("analyze options");
    description.add_options()
        ("source,s", po::value(&source_path)->value_name("PATH")->required(), "path to the source repository")
        ("source-type,t", po::value(&source_type)->value_name("TYPE")->default_value("cvs"), "cvs or svn")
        ("module,m", po::value(&module)->value_name("MODULE"), "restrict to one CVS module")
        ;
    parse(description, args);

    std::cout << "Analyzing " << source_type << " repository at: " << source_path << "\n\n";
    cvs_repository source = open_source(source_type, source_path, module);

    std::vector<std::string> branches = source.branches();
    std::map<std::string, std::string> tags = source.tags();
    std::vector<commit> commits = source.commits();
    AuthorExtractor authors;
    for (auto const& c : commits)
        authors.add(c.author);
    source.close();

    std::cout << "Repository Analysis Results\n"
              << "===========================\n"
              << "Type:           " << source_type << "\n"
              << "Path:           " << source_path << "\n"
              << "Files:          " << source.file_count() << "\n"
              << "Commits:        " << commits.size() << "\n"
              << "Branches:       " << branches.size() << "\n"
              << "Tags:           " << tags.size() << "\n"
              << "Unique Authors: " << authors.list().size() << "\n\n";

    if (!branches.empty())
    {
        std::cout << "Branches:\n";
        for (auto const& b : branches)
            std::cout << "  - " << b << "\n";
        std::cout << "\n";
    }
    if (!tags.empty())
    {
        std::cout << "Tags:\n";
        for (auto const& t : tags)
            std::cout << "  - " << t.first << " (revision: " << t.second << ")\n";
        std::cout << "\n";
    }
    if (!authors.list().empty())
    {
        std::cout << "Authors:\n";
        for (auto const& a : authors.list())
            std::cout << "  - " << a << "\n";
        std::cout << "\n";
    }
    std::cout << "Repository is valid and ready for migration." << std::endl;
    return Log::result();
}

static int authors_command(std::vector<std::string> const& args)
{
    std::string source_path;
    std::string module;
    std::string format;
    po::options_description description("authors options");
    description.add_options()
        ("source,s", po::value(&source_path)->value_name("PATH")->required(), "path to the CVS repository")
        ("module,m", po::value(&module)->value_name("MODULE"), "restrict to one CVS module")
        ("format,f", po::value(&format)->value_name("FORMAT")->default_value("text"), "text or authors")
        ;
    parse(description, args);
    if (format != "text" && format != "authors")
        throw configuration_error("unknown format: " + format + " (supported: text, authors)");

    cvs_repository source = open_source("cvs", source_path, module);
    AuthorExtractor extractor;
    for (auto const& c : source.commits())
        extractor.add(c.author);
    source.close();

    if (format == "authors")
    {
        std::cout << extractor.authors_file_template();
    }
    else
    {
        for (auto const& a : extractor.list())
            std::cout << a << "\n";
    }
    std::cout.flush();
    return Log::result();
}

static int status_command(std::vector<std::string> const& args)
{
    std::string state_file;
    po::options_description description("status options");
    description.add_options()
        ("state-file", po::value(&state_file)->value_name("FILENAME")->required(), "checkpoint database of a migration")
        ;
    parse(description, args);

    if (!boost::filesystem::exists(state_file))
        throw state_error("no migration state at " + state_file);

    sqlite_checkpoint_store store(state_file);
    std::vector<migration_state> history = store.history();
    if (history.empty())
    {
        std::cout << "No migrations recorded" << std::endl;
        return Log::result();
    }
    for (auto const& s : history)
    {
        std::cout << s.migration_id << "  " << to_string(s.status) << "  "
                  << s.processed << "/" << s.total << "  "
                  << boost::posix_time::to_simple_string(s.last_updated) << "\n"
                  << "    " << s.source_path << " -> " << s.target_path << "\n";
        if (!s.last_commit.empty())
            std::cout << "    last commit " << s.last_commit << "\n";
    }
    std::cout.flush();
    return Log::result();
}

int main(int argc, char **argv)
{
    // A git or cvs child dying must surface as an error, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::string command;
        po::options_description program_options("Allowed options");
        program_options.add_options()
            ("help,h", "produce help message")
            ("version,v", "print version string")
            ("quiet,q", "be quiet")
            ("verbose,V", "be verbose")
            ("extra-verbose,VV", "be even more verbose")
            ("git", po::value(&options.git_executable)->value_name("PATH"), "git executable to run")
            ("cvs", po::value(&options.cvs_executable)->value_name("PATH"), "cvs executable to run")
            ;
        po::options_description hidden;
        hidden.add_options()
            ("command", po::value(&command), "migrate, sync, analyze, authors, status or version")
            ("arguments", po::value<std::vector<std::string> >(), "command arguments")
            ;
        po::options_description all;
        all.add(program_options).add(hidden);
        po::positional_options_description positional;
        positional.add("command", 1).add("arguments", -1);

        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(all)
            .positional(positional)
            .allow_unregistered()
            .run();
        po::variables_map variables;
        store(parsed, variables);
        notify(variables);

        if (variables.count("help") || (command.empty() && !variables.count("version")))
        {
            std::cout << "usage: git-migrator [options] <command> [command options]\n\n"
                      << "commands:\n"
                      << "  migrate   copy the history of a CVS repository into Git\n"
                      << "  sync      synchronize a Git repository and a CVS module\n"
                      << "  analyze   report commits, branches, tags and authors\n"
                      << "  authors   list the authors of a CVS repository\n"
                      << "  status    show the migrations recorded in a state file\n"
                      << "  version   print version string\n\n"
                      << program_options << std::endl;
            return command.empty() && !variables.count("help") ? EXIT_FAILURE : EXIT_SUCCESS;
        }
        if (variables.count("version") || command == "version")
        {
            std::cout << version << std::endl;
            return EXIT_SUCCESS;
        }
        if (variables.count("quiet"))
        {
            Log::set_level(Log::Warning);
        }
        if (variables.count("verbose"))
        {
            Log::set_level(Log::Debug);
        }
        if (variables.count("extra-verbose"))
        {
            Log::set_level(Log::Trace);
        }

        // Everything after the command name belongs to the command
        std::vector<std::string> args = po::collect_unrecognized(parsed.options, po::include_positional);
        args.erase(args.begin());

        if (command == "migrate")
            return migrate_command(args);
        if (command == "sync")
            return sync_command(args);
        if (command == "analyze")
            return analyze_command(args);
        if (command == "authors")
            return authors_command(args);
        if (command == "status")
            return status_command(args);
        throw configuration_error("unknown command: " + command);
    }
    catch (std::exception const& error)
    {
        Log::error() << error.what() << "\n\n";
        return EXIT_FAILURE;
    }
}
