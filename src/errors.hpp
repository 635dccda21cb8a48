// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_ERRORS_HPP
# define GIT_MIGRATOR_ERRORS_HPP

# include <stdexcept>
# include <string>
# include <cstddef>

namespace git_migrator {

// Where in a run a fatal failure happened
enum class error_phase
{
    configuration,
    validation,
    read,
    apply,
    state
};

char const* to_string(error_phase p);

// Every fatal failure of a run is reported as one of these, with a
// message of the form "<context>: <cause>".
struct error : std::runtime_error
{
    error(error_phase where, std::string const& message)
        : std::runtime_error(message), where(where) {}

    error_phase phase() const { return where; }

 private:
    error_phase where;
};

struct configuration_error : error
{
    explicit configuration_error(std::string const& message)
        : error(error_phase::configuration, message) {}
};

struct apply_error : error
{
    apply_error(std::string const& revision, std::string const& cause)
        : error(error_phase::apply, "failed to apply commit " + revision + ": " + cause),
          revision_(revision) {}

    std::string const& revision() const { return revision_; }

 private:
    std::string revision_;
};

// Persisted state exists but can't be parsed
struct state_error : error
{
    explicit state_error(std::string const& message)
        : error(error_phase::state, message) {}
};

// Raised when a run stops early at its configured interruption point
struct interrupted : error
{
    explicit interrupted(std::size_t at)
        : error(error_phase::apply, "interrupted at commit " + std::to_string(at)),
          at(at) {}

    std::size_t commit_count() const { return at; }

 private:
    std::size_t at;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_ERRORS_HPP
