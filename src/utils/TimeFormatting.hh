// ----------------------------------------------------------------------
// File: TimeFormatting.hh
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

#ifndef SLOTDB_UTILS_TIME_FORMATTING_HH
#define SLOTDB_UTILS_TIME_FORMATTING_HH

#include <chrono>
#include <string>

namespace slotdb {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

// "2 days, 3 hours, 0 minutes, 5 seconds" - leading zero units are omitted
std::string formatTime(const std::chrono::seconds &totalSeconds);

}

#endif
