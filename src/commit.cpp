// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#include "commit.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <ostream>

namespace git_migrator {

namespace pt = boost::posix_time;

std::ostream& operator<<(std::ostream& os, change_action action)
{
    switch (action)
    {
    case change_action::add:    return os << "A";
    case change_action::modify: return os << "M";
    case change_action::remove: return os << "D";
    }
    return os << "?";
}

static pt::ptime const epoch(boost::gregorian::date(1970, 1, 1));

long long epoch_seconds(pt::ptime const& t)
{
    return (t - epoch).total_seconds();
}

pt::ptime from_epoch_seconds(long long seconds)
{
    return epoch + pt::seconds(static_cast<long>(seconds));
}

std::string short_revision(std::string const& revision)
{
    return revision.size() > 8 ? revision.substr(0, 8) : revision;
}

} // namespace git_migrator
