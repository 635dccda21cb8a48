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

#include "authors.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace git_migrator
{

static boost::regex line_regex("(.+\\H)\\h*=\\h*(.+)");
static boost::regex identity_regex("^(.+?)\\s*<(.+?)>$");

bool parse_identity(std::string const& text, identity& result)
  {
  boost::smatch match;
  if (!regex_match(text, match, identity_regex))
    {
    return false;
    }
  std::string name = boost::algorithm::trim_copy(match.str(1));
  std::string email = boost::algorithm::trim_copy(match.str(2));
  if (name.empty() || email.empty())
    {
    return false;
    }
  result = identity(name, email);
  return true;
  }

Authors::Authors()
  {
  }

Authors::Authors(std::map<std::string, std::string> const& entries)
  : map(entries.begin(), entries.end())
  {
  }

void Authors::load(std::string const& filename)
  {
  std::ifstream file(filename.c_str());
  if (!file)
    {
    throw std::runtime_error("cannot open authors file " + filename);
    }
  std::string line;
  boost::smatch match;
  while (std::getline(file, line))
    {
    boost::algorithm::trim_right(line);
    if (line.empty() || line[0] == '#')
      {
      continue;
      }
    if (regex_match(line, match, line_regex))
      {
      add(match[1], match[2]);
      }
    else
      {
      throw std::runtime_error("error in authors file: " + line);
      }
    }
  }

void Authors::add(std::string const& username, std::string const& mapping)
  {
  map[username] = mapping;
  }

identity Authors::operator[](std::string const& username) const
  {
  typedef boost::unordered_map<std::string, std::string> map_t;
  map_t::const_iterator it = map.find(username);
  identity result;
  if (it != map.end() && parse_identity(it->second, result))
    {
    return result;
    }
  return identity(username, default_email(username));
  }

std::string Authors::default_email(std::string const& username)
  {
  return username + "@users.noreply.cvs.example.org";
  }

void AuthorExtractor::add(std::string const& username)
  {
  authors.insert(username);
  }

std::string AuthorExtractor::authors_file_template() const
  {
  std::ostringstream out;
  for (std::string const& author : authors)
    {
    out << author << " = " << author << " <" << author << "@example.com>\n";
    }
  return out.str();
  }

} // namespace git_migrator
