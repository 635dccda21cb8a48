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

#include "log.hpp"
#include <cstdlib>

namespace Log
{

static Level level = Log::Info;

static std::string commit;
static std::string commit_reported;
static std::ostream dummy(0);
static std::size_t num_errors = 0;
static std::size_t num_warnings = 0;

void set_level(Level value)
  {
  level = value;
  }

Level get_level()
  {
  return level;
  }

void set_commit(std::string const& revision)
  {
  commit = revision;
  }

// Output at or above Debug is grouped under the commit it belongs to
static std::ostream& stream(Level threshold, std::ostream& out, char const* prefix)
  {
  if (level < threshold)
    {
    return dummy;
    }
  if (level >= Log::Debug && !commit.empty() && commit != commit_reported)
    {
    std::cout << "\nCommit " << commit << std::endl;
    commit_reported = commit;
    }
  return out << prefix;
  }

std::ostream& error()
  {
  ++num_errors;
  return stream(Log::Warning, std::cerr, "++ ERROR: ");
  }

std::ostream& warn()
  {
  ++num_warnings;
  return stream(Log::Warning, std::cerr, "++ WARNING: ");
  }

std::ostream& info()
  {
  return stream(Log::Info, std::cout, "-- ");
  }

std::ostream& debug()
  {
  return stream(Log::Debug, std::cout, "-- ");
  }

std::ostream& trace()
  {
  return stream(Log::Trace, std::cout, "-- ");
  }

int result()
  {
  if (num_warnings != 0 && level >= Log::Info)
    {
    std::cerr << num_warnings << " warnings" << std::endl;
    }
  if (num_errors == 0)
    {
    return EXIT_SUCCESS;
    }
  std::cerr << "\n" << num_errors << " errors occurred" << std::endl;
  return EXIT_FAILURE;
  }

} // namespace Log
