// ----------------------------------------------------------------------
// File: Stacktrace.hh
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

#ifndef SLOTDB_UTILS_STACKTRACE_HH
#define SLOTDB_UTILS_STACKTRACE_HH

#define BACKWARD_HAS_DW 1

#include <backward.hpp>
#include <sstream>

namespace slotdb {

inline std::string getStacktrace(size_t depth = 32) {
  std::ostringstream ss;

  backward::StackTrace st;
  st.load_here(depth);
  st.skip_n_firsts(2);

  backward::Printer p;
  p.object = true;
  p.color_mode = backward::ColorMode::never;
  p.address = true;
  p.print(st, ss);

  return ss.str();
}

}

#endif
