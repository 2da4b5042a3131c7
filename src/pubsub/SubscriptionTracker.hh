// ----------------------------------------------------------------------
// File: SubscriptionTracker.hh
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

#ifndef SLOTDB_PUBSUB_SUBSCRIPTION_TRACKER_HH
#define SLOTDB_PUBSUB_SUBSCRIPTION_TRACKER_HH

#include <string>
#include <set>
#include <vector>

namespace slotdb {

//------------------------------------------------------------------------------
// Simple class to keep track of the pubsub state of a particular connection.
// Not thread-safe, need to synchronize externally.
//------------------------------------------------------------------------------
class SubscriptionTracker {
public:
  SubscriptionTracker() {}

  //----------------------------------------------------------------------------
  // Add channel, return false if it existed already
  //----------------------------------------------------------------------------
  bool addChannel(const std::string &item);

  //----------------------------------------------------------------------------
  // Remove channel, return false if it did not exist
  //----------------------------------------------------------------------------
  bool removeChannel(const std::string &item);

  bool hasChannel(const std::string &item) const;

  size_t size() const {
    return channels.size();
  }

  std::vector<std::string> getChannels() const;

private:
  std::set<std::string> channels;
};

}

#endif
