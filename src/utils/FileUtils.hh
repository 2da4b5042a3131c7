// ----------------------------------------------------------------------
// File: FileUtils.hh
// Author: Georgios Bitzes - CERN
// ----------------------------------------------------------------------

/************************************************************************
 * slotdb - a sharded, replicated redis-compatible key-value store      *
 * Copyright (C) 2016 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#ifndef SLOTDB_FILE_UTILS_HH
#define SLOTDB_FILE_UTILS_HH

#include <string>
#include <string_view>
#include <sys/types.h>

namespace slotdb {

std::string pathJoin(std::string_view part1, std::string_view part2);
bool mkpath(const std::string &path, mode_t mode, std::string &err);
bool directoryExists(const std::string &path, std::string &err);
bool fileExists(const std::string &path);
bool readFile(FILE *f, std::string &contents);
bool readFile(const std::string &path, std::string &contents);
bool areFilePermissionsSecure(mode_t mode);
bool readPasswordFile(const std::string &path, std::string &contents);

// Write the contents to '<path>.tmp', fsync, then rename over 'path'. Either
// the old or the new contents are visible at 'path' at any point, never a
// partial write.
bool writeFileAtomically(const std::string &path, std::string_view contents, std::string &err);

}

#endif
