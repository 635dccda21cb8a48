// Distributed under the Boost Software License, Version 1.0. (See
// accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)
#ifndef GIT_MIGRATOR_RCS_FILE_HPP
# define GIT_MIGRATOR_RCS_FILE_HPP

# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <iosfwd>
# include <map>
# include <stdexcept>
# include <string>
# include <utility>
# include <vector>

namespace git_migrator {

struct rcs_parse_error : std::runtime_error
{
    rcs_parse_error(std::string const& file, std::size_t line, std::string const& message)
        : std::runtime_error(file + ":" + std::to_string(line) + ": " + message),
          line(line) {}

    std::size_t line;
};

// One revision of an RCS file.  log and text come from the deltatext
// section; text is the full contents for the head revision and a
// reverse diff for every other trunk revision.
struct rcs_delta
{
    std::string revision;
    boost::posix_time::ptime date;
    std::string author;
    std::string state;
    std::vector<std::string> branches;
    std::string next;
    std::string log;
    std::string text;

    bool dead() const { return state == "dead"; }
};

struct rcs_file
{
    rcs_file() : strict(false) {}

    std::string head;
    std::string branch;
    std::vector<std::string> access;
    std::vector<std::pair<std::string, std::string> > symbols;   // in file order
    std::map<std::string, std::string> locks;                  // locker -> revision
    bool strict;
    std::string comment;
    std::string expand;
    std::string description;
    std::map<std::string, rcs_delta> deltas;
    std::vector<std::string> delta_order;

    rcs_delta const& delta(std::string const& revision) const;

    // Trunk revisions from the head back to the first
    std::vector<std::string> trunk() const;

    // The full text of every trunk revision
    std::map<std::string, std::string> trunk_texts() const;
};

// name is used in error messages only
rcs_file parse_rcs(std::istream& in, std::string const& name);
rcs_file read_rcs_file(std::string const& path);

// YY.MM.DD.hh.mm.ss (19YY) or YYYY.MM.DD.hh.mm.ss, UTC
boost::posix_time::ptime parse_rcs_date(std::string const& text);

// Applies an RCS diff ("aN M" / "dN M" commands) to source
std::string apply_rcs_diff(std::string const& source, std::string const& diff);

// True for branch numbers: an odd number of components (1.1.1), or a
// magic branch number whose next to last component is 0 (1.2.0.4)
bool is_branch_number(std::string const& revision);

} // namespace git_migrator

#endif // GIT_MIGRATOR_RCS_FILE_HPP
