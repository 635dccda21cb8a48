// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)

#include "git_fast_import.hpp"
#include "git_executable.hpp"

#include <boost/process/io.hpp>
#include <boost/process/start_dir.hpp>
#include <stdexcept>

namespace git_migrator {

namespace bp = boost::process;

git_fast_import::git_fast_import(std::string const& work_dir)
    : process(
          git_executable(), "fast-import", "--quiet", "--force", "--done",
          bp::start_dir = work_dir,
          bp::std_in < cin,
          bp::std_out > cout),
      checkpoints(0),
      finished(false)
{
}

git_fast_import::~git_fast_import()
{
    // Note: an unfinished stream is abandoned; fast-import refuses to
    // update refs without its "done" command.
    if (!finished)
    {
        cin.pipe().close();
        std::error_code ec;
        process.wait(ec);
    }
}

git_fast_import& git_fast_import::write_raw(char const* data, std::size_t nbytes)
{
    cin.write(data, nbytes);
    return *this;
}

git_fast_import& git_fast_import::data_hdr(std::size_t size)
{
    return *this << "data " << size << LF;
}

git_fast_import& git_fast_import::data(char const* data, std::size_t size)
{
    return data_hdr(size).write_raw(data, size) << LF;
}

git_fast_import& git_fast_import::commit(
    std::string const& ref_name,
    std::size_t mark,
    std::string const& author,
    long long epoch,
    std::string const& log_message)
{
    *this << "commit " << ref_name << LF
          << "mark :" << mark << LF
          << "author " << author << " " << epoch << " +0000" << LF
          << "committer " << author << " " << epoch << " +0000" << LF;
    return data(log_message.data(), log_message.size());
}

git_fast_import& git_fast_import::from(std::string const& committish)
{
    return *this << "from " << committish << LF;
}

git_fast_import& git_fast_import::filedelete(std::string const& path)
{
    return *this << "D " << fast_import_path(path) << LF;
}

git_fast_import& git_fast_import::filemodify_hdr(std::string const& path)
{
    return *this << "M 100644 inline " << fast_import_path(path) << LF;
}

void git_fast_import::send()
{
    cin << std::flush;
    if (!cin)
        throw std::runtime_error("git fast-import is not accepting input");
}

std::string git_fast_import::readline()
{
    std::string result;
    if (!std::getline(cout, result))
        throw std::runtime_error("git fast-import terminated unexpectedly");
    return result;
}

void git_fast_import::checkpoint()
{
    std::string token = "checkpoint-" + std::to_string(++checkpoints);
    *this << "checkpoint" << LF << LF
          << "progress " << token << LF << LF;
    send();

    std::string expected = "progress " + token;
    while (readline() != expected)
        ;
}

std::string git_fast_import::get_mark(std::size_t mark)
{
    *this << "get-mark :" << mark << LF;
    send();
    std::string sha = readline();
    if (sha.size() != 40)
        throw std::runtime_error("unexpected reply from git fast-import: " + sha);
    return sha;
}

void git_fast_import::finish()
{
    if (finished)
        return;
    finished = true;

    *this << "done" << LF;
    cin << std::flush;
    cin.pipe().close();
    process.wait();
    if (process.exit_code() != 0)
        throw std::runtime_error(
            "git fast-import exited with status " + std::to_string(process.exit_code()));
}

std::string fast_import_path(std::string const& path)
{
    if (path.empty() || (path[0] != '"' && path.find('\n') == std::string::npos))
        return path;

    std::string quoted = "\"";
    for (char c : path)
    {
        switch (c)
        {
        case '"':  quoted += "\\\""; break;
        case '\\': quoted += "\\\\"; break;
        case '\n': quoted += "\\n"; break;
        default:   quoted += c;
        }
    }
    return quoted + "\"";
}

} // namespace git_migrator
