// ----------------------------------------------------------------------
// File: SubscriptionTracker.cc
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

#include "SubscriptionTracker.hh"

using namespace slotdb;

bool SubscriptionTracker::addChannel(const std::string &item) {
  return channels.insert(item).second;
}

bool SubscriptionTracker::removeChannel(const std::string &item) {
  return channels.erase(item);
}

bool SubscriptionTracker::hasChannel(const std::string &item) const {
  return channels.find(item) != channels.end();
}

std::vector<std::string> SubscriptionTracker::getChannels() const {
  return std::vector<std::string>(channels.begin(), channels.end());
}
