// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "run_report.hpp"
#include "log.hpp"

#include <algorithm>

namespace git_migrator {

char const* to_string(warning_kind kind)
{
    switch (kind)
    {
    case warning_kind::branch:          return "branch";
    case warning_kind::tag:             return "tag";
    case warning_kind::resume_mismatch: return "resume";
    case warning_kind::watermark:       return "watermark";
    case warning_kind::tip_snapshot:    return "tip";
    case warning_kind::cleanup:         return "cleanup";
    }
    return "unknown";
}

void run_report::warn(warning_kind kind, std::string const& subject, std::string const& message)
{
    Log::warn() << to_string(kind) << " " << subject << ": " << message << std::endl;
    run_warning w;
    w.kind = kind;
    w.subject = subject;
    w.message = message;
    warnings.push_back(w);
}

std::size_t run_report::count(warning_kind kind) const
{
    return std::count_if(warnings.begin(), warnings.end(),
                         [kind](run_warning const& w) { return w.kind == kind; });
}

} // namespace git_migrator
