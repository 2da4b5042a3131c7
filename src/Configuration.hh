// ----------------------------------------------------------------------
// File: Configuration.hh
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

#ifndef SLOTDB_CONFIGURATION_HH
#define SLOTDB_CONFIGURATION_HH

#include <chrono>
#include <string>
#include <vector>

#include "Common.hh"
#include "cluster/SlotMap.hh"
#include "utils/Macros.hh"

namespace slotdb {

class ConfigurationReader;

//------------------------------------------------------------------------------
// Static node configuration, immutable once loaded. The listening port is
// not part of the file, it comes from the command line and selects which of
// the nodes named in the topology we are.
//------------------------------------------------------------------------------
class Configuration {
public:
  static bool fromFile(const std::string &filename, int port, Configuration &out);
  static bool fromString(const std::string &str, int port, Configuration &out);
  bool isValid();

  NodeAddress getMyself() const { return myself; }
  const SlotMap& getSlotMap() const { return slotMap; }
  const std::vector<ShardInfo>& getShards() const { return shards; }
  std::string getSnapshotDir() const { return snapshotDir; }
  std::chrono::seconds getSnapshotInterval() const { return std::chrono::seconds(snapshotInterval); }
  std::chrono::seconds getIdleTimeout() const { return std::chrono::seconds(idleTimeout); }
  std::string getNotifyPrefix() const { return notifyPrefix; }
  size_t getThreads() const { return threads; }
  size_t getMaxPendingBytes() const { return maxPendingBytes; }
  TraceLevel getTraceLevel() const { return trace; }

  //----------------------------------------------------------------------------
  // Our own shard, and role within it. Only meaningful after isValid().
  //----------------------------------------------------------------------------
  const ShardInfo& getMyShard() const { return myShard; }
  NodeRole getRole() const { return role; }

  //----------------------------------------------------------------------------
  // Returns the password, reading it from the password file if necessary.
  // Throws if the password file is unreadable.
  //----------------------------------------------------------------------------
  std::string extractPasswordOrDie() const;

private:
  static bool fromReader(ConfigurationReader &reader, int port, Configuration &out);

  NodeAddress myself {"localhost", 0};
  std::vector<ShardInfo> shards;
  std::string snapshotDir;
  int64_t snapshotInterval = 60;
  int64_t idleTimeout = 0;
  std::string password;
  std::string passwordFilePath;
  std::string notifyPrefix = "__keyspace__:";
  size_t threads = 4;
  size_t maxPendingBytes = 64 * 1024 * 1024;
  TraceLevel trace = TraceLevel::info;

  SlotMap slotMap;
  ShardInfo myShard;
  NodeRole role = NodeRole::kPrimary;
};

}

#endif
