// ----------------------------------------------------------------------
// File: TimeFormatting.cc
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

#include <sstream>
#include "Macros.hh"
#include "TimeFormatting.hh"

namespace slotdb {

std::string formatTime(const std::chrono::seconds &totalSeconds) {
  int64_t remaining = totalSeconds.count();

  const std::pair<int64_t, const char*> units[] = {
    { std::chrono::duration_cast<std::chrono::seconds>(Days(1)).count(), "days" },
    { 3600, "hours" },
    { 60, "minutes" }
  };

  std::stringstream ss;
  bool started = false;

  for(const auto &unit : units) {
    int64_t amount = remaining / unit.first;
    remaining -= amount * unit.first;

    if(amount != 0 || started) {
      ss << amount << " " << unit.second << ", ";
      started = true;
    }
  }

  ss << remaining << " seconds";
  sdb_assert(remaining < 60);
  return ss.str();
}

}
