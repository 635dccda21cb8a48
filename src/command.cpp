// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "command.hpp"
#include "log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <future>
#include <sstream>

namespace git_migrator {

namespace bp = boost::process;
namespace fs = boost::filesystem;

static std::string command_line(std::string const& exe, std::vector<std::string> const& args)
{
    std::string result = fs::path(exe).filename().string();
    for (auto const& a : args)
        result += " " + a;
    return result;
}

command_result run_command(
    std::string const& exe,
    std::vector<std::string> const& args,
    std::string const& work_dir)
{
    Log::trace() << "running " << command_line(exe, args)
                 << (work_dir.empty() ? "" : " in " + work_dir) << std::endl;

    boost::asio::io_context ios;
    std::future<std::string> out, err;
    bp::child c(
        bp::exe = exe,
        bp::args = args,
        bp::start_dir = work_dir.empty() ? fs::current_path() : fs::path(work_dir),
        bp::std_in < bp::null,
        bp::std_out > out,
        bp::std_err > err,
        ios);
    ios.run();
    c.wait();

    command_result result;
    result.exit_code = c.exit_code();
    result.out = out.get();
    result.err = err.get();
    return result;
}

static std::string describe(std::string const& command_line, command_result const& result)
{
    std::ostringstream message;
    message << "'" << command_line << "' exited with status " << result.exit_code;
    std::string detail = boost::algorithm::trim_copy(result.err.empty() ? result.out : result.err);
    if (!detail.empty())
        message << ": " << detail;
    return message.str();
}

command_failed::command_failed(std::string const& command_line, command_result const& result)
    : std::runtime_error(describe(command_line, result)), result(result)
{
}

std::string run_checked(
    std::string const& exe,
    std::vector<std::string> const& args,
    std::string const& work_dir)
{
    command_result result = run_command(exe, args, work_dir);
    if (result.exit_code != 0)
        throw command_failed(command_line(exe, args), result);
    return result.out;
}

} // namespace git_migrator
