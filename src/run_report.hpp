// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_RUN_REPORT_HPP
# define GIT_MIGRATOR_RUN_REPORT_HPP

# include <string>
# include <vector>

namespace git_migrator {

// Failures a run recovers from
enum class warning_kind
{
    branch,             // a branch could not be created
    tag,                // a tag could not be created
    resume_mismatch,    // checkpointed revision not found, replaying everything
    watermark,          // sync state could not be written after a commit
    tip_snapshot,       // Git tip could not be read between sync passes
    cleanup             // closing or removing something failed after success
};

char const* to_string(warning_kind kind);

struct run_warning
{
    warning_kind kind;
    std::string subject;
    std::string message;
};

// What a successful run did
struct run_report
{
    run_report() : applied(0) {}

    std::size_t applied;
    std::vector<run_warning> warnings;

    void warn(warning_kind kind, std::string const& subject, std::string const& message);
    std::size_t count(warning_kind kind) const;
};

} // namespace git_migrator

#endif // GIT_MIGRATOR_RUN_REPORT_HPP
