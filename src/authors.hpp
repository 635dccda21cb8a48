/*
 *  Copyright (C) 2013 Daniel Pfeifer <daniel@pfeifer-mail.de>
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

#ifndef GIT_MIGRATOR_AUTHORS_HPP
#define GIT_MIGRATOR_AUTHORS_HPP

#include <boost/unordered_map.hpp>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace git_migrator
{

// A display name and email address
typedef std::pair<std::string, std::string> identity;

// Splits "Name <email>"; returns false when either part is missing.
bool parse_identity(std::string const& text, identity& result);

class Authors
  {
  public:
    Authors();
    explicit Authors(std::map<std::string, std::string> const& entries);

    // Reads "user = Name <email>" lines; '#' starts a comment line.
    void load(std::string const& filename);
    void add(std::string const& username, std::string const& mapping);

    // Unmapped users, and users whose mapping can't be parsed, get
    // their username as the name and a synthetic email.
    identity operator[](std::string const& username) const;

    std::size_t size() const { return map.size(); }

    static std::string default_email(std::string const& username);

  private:
    boost::unordered_map<std::string, std::string> map;
  };

// Collects the distinct usernames seen in a history
class AuthorExtractor
  {
  public:
    void add(std::string const& username);
    std::set<std::string> const& list() const { return authors; }

    // One "user = user <user@example.com>" line per author
    std::string authors_file_template() const;

  private:
    std::set<std::string> authors;
  };

} // namespace git_migrator

#endif /* GIT_MIGRATOR_AUTHORS_HPP */
