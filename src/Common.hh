// ----------------------------------------------------------------------
// File: Common.hh
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

#ifndef SLOTDB_COMMON_HH
#define SLOTDB_COMMON_HH

#include <vector>
#include <string>
#include <string_view>
#include "utils/Macros.hh"

namespace slotdb {

//------------------------------------------------------------------------------
// host:port of a node taking part in the cluster
//------------------------------------------------------------------------------
struct NodeAddress {
  std::string hostname;
  int port = 0;

  NodeAddress() {}
  NodeAddress(std::string_view h, int p) : hostname(h), port(p) {}

  bool operator==(const NodeAddress& rhs) const {
    return hostname == rhs.hostname && port == rhs.port;
  }

  bool operator!=(const NodeAddress& rhs) const {
    return !(*this == rhs);
  }

  bool operator<(const NodeAddress &rhs) const {
    if(hostname != rhs.hostname) {
      return hostname < rhs.hostname;
    }
    return port < rhs.port;
  }

  std::string toString() const {
    if(hostname.empty()) return "";
    return hostname + ":" + std::to_string(port);
  }

  bool empty() const {
    return hostname.empty();
  }
};

// Slot space is fixed for the lifetime of a cluster.
constexpr int64_t kSlotCount = 16384;

enum class NodeRole {
  kPrimary,
  kReplica
};

inline std::string roleToString(NodeRole role) {
  if(role == NodeRole::kPrimary) return "primary";
  return "replica";
}

}

#endif
