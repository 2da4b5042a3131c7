// ----------------------------------------------------------------------
// File: ClockWrapper.hh
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

#ifndef SLOTDB_CLOCK_WRAPPER_HH
#define SLOTDB_CLOCK_WRAPPER_HH

#include <chrono>
#include <mutex>

namespace slotdb {

//------------------------------------------------------------------------------
// Wraps a std clock so that tests can control time. A fake clock starts at
// the default-constructed time_point and only moves through advance() or
// set(). A real clock forwards to T::now() and ignores both.
//------------------------------------------------------------------------------
template<typename T>
class ClockWrapper {
public:
  using duration = typename T::duration;
  using time_point = typename T::time_point;

  ClockWrapper(bool fake = false) : faking(fake) {}

  bool fake() const {
    return faking;
  }

  time_point now() const {
    if(faking) {
      std::unique_lock<std::mutex> lock(mtx);
      return fakeTime;
    }

    return T::now();
  }

  //----------------------------------------------------------------------------
  // Milliseconds since the clock's epoch
  //----------------------------------------------------------------------------
  int64_t nowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch()).count();
  }

  template<typename Dur>
  void advance(Dur duration) {
    std::unique_lock<std::mutex> lock(mtx);
    fakeTime += duration;
  }

  void set(time_point point) {
    std::unique_lock<std::mutex> lock(mtx);
    fakeTime = point;
  }

private:
  bool faking;
  mutable std::mutex mtx;
  time_point fakeTime;
};

using SystemClock = ClockWrapper<std::chrono::system_clock>;

}

#endif
