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

#ifndef GIT_MIGRATOR_LOG_HPP
#define GIT_MIGRATOR_LOG_HPP

#include <cstddef>
#include <iostream>
#include <string>

namespace Log
{

enum Level
  {
  Warning,
  Info,
  Debug,
  Trace
  };

void set_level(Level value);
Level get_level();

// Names the commit currently being processed; at Debug and above a
// header is printed before the next output that follows a change.
void set_commit(std::string const& revision);

std::ostream& error();
std::ostream& trace();
std::ostream& debug();
std::ostream& info();
std::ostream& warn();

// EXIT_FAILURE once anything was logged through error()
int result();

} // namespace Log

#endif /* GIT_MIGRATOR_LOG_HPP */
