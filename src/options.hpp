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

#ifndef GIT_MIGRATOR_OPTIONS_HPP
#define GIT_MIGRATOR_OPTIONS_HPP

#include <string>

// Process-wide settings taken from the command line
struct Options
  {
  std::string git_executable;
  std::string cvs_executable;
  };

extern Options options;

#endif /* GIT_MIGRATOR_OPTIONS_HPP */
