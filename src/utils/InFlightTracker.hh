// ----------------------------------------------------------------------
// File: InFlightTracker.hh
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

#ifndef SLOTDB_IN_FLIGHT_TRACKER_HH
#define SLOTDB_IN_FLIGHT_TRACKER_HH

#include <atomic>
#include <thread>
#include "Macros.hh"

namespace slotdb {

//------------------------------------------------------------------------------
// Keep track of how many requests are currently in-flight.
// It's also possible to use this as a barrier to further requests - useful
// when shutting down.
//------------------------------------------------------------------------------
class InFlightTracker {
public:
  InFlightTracker(bool accepting = true) : acceptingRequests(accepting) {}

  bool up() {
    if(!acceptingRequests) return false;
    inFlight++;

    // setAcceptingRequests(false) may have raced with us - back off, so that
    // a zero in-flight count observed after it is final.
    if(!acceptingRequests) {
      inFlight--;
      return false;
    }

    return true;
  }

  void down() {
    int64_t prev = inFlight--;
    sdb_assert(prev > 0);
  }

  void setAcceptingRequests(bool value) {
    acceptingRequests = value;
  }

  bool isAcceptingRequests() const {
    return acceptingRequests;
  }

  void spinUntilNoRequestsInFlight() const {
    sdb_assert(!acceptingRequests);
    while(inFlight != 0) {
      std::this_thread::yield();
    }
  }

  int64_t getInFlight() const {
    return inFlight;
  }

private:
  std::atomic<bool> acceptingRequests {true};
  std::atomic<int64_t> inFlight {0};
};

class InFlightRegistration {
public:
  InFlightRegistration(InFlightTracker &tracker) : inFlightTracker(tracker) {
    registered = inFlightTracker.up();
  }

  ~InFlightRegistration() {
    if(registered) {
      inFlightTracker.down();
    }
  }

  bool ok() const {
    return registered;
  }

private:
  InFlightTracker &inFlightTracker;
  bool registered;
};

}

#endif
