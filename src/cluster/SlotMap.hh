// ----------------------------------------------------------------------
// File: SlotMap.hh
// Author: SlotDB authors
// ----------------------------------------------------------------------

/************************************************************************
 * slotdb - a sharded, replicated redis-compatible key-value store      *
 * Copyright (C) 2026 SlotDB authors                                    *
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

#ifndef SLOTDB_CLUSTER_SLOT_MAP_HH
#define SLOTDB_CLUSTER_SLOT_MAP_HH

#include "Common.hh"
#include <vector>

namespace slotdb {

//------------------------------------------------------------------------------
// A contiguous, inclusive slot range, and the nodes serving it. The first
// node is the primary, the rest are replicas.
//------------------------------------------------------------------------------
struct ShardInfo {
  int64_t start = 0;
  int64_t end = 0;
  std::vector<NodeAddress> nodes;

  const NodeAddress& primary() const {
    return nodes[0];
  }

  std::vector<NodeAddress> replicas() const {
    return std::vector<NodeAddress>(nodes.begin() + 1, nodes.end());
  }

  bool ownsSlot(int64_t slot) const {
    return start <= slot && slot <= end;
  }

  std::string describe() const;

  bool operator==(const ShardInfo &rhs) const {
    return start == rhs.start && end == rhs.end && nodes == rhs.nodes;
  }
};

//------------------------------------------------------------------------------
// Static mapping of the slot space to shards. Immutable after construction,
// safe to share between threads.
//------------------------------------------------------------------------------
class SlotMap {
public:
  SlotMap() {}
  SlotMap(const std::vector<ShardInfo> &shards);

  //----------------------------------------------------------------------------
  // CRC16-CCITT (XMODEM): poly 0x1021, init 0x0000, no reflection.
  //----------------------------------------------------------------------------
  static uint16_t crc16(std::string_view data);

  //----------------------------------------------------------------------------
  // Pure function from key to slot. When the key contains a non-empty
  // "{...}" section, only its contents are hashed, so related keys can be
  // forced onto the same slot.
  //----------------------------------------------------------------------------
  static int64_t slotForKey(std::string_view key);

  //----------------------------------------------------------------------------
  // Parse "<start> <end> <primary> [<replica> ...]"
  //----------------------------------------------------------------------------
  static bool parseShard(const std::string &str, ShardInfo &shard, std::string &err);

  //----------------------------------------------------------------------------
  // Shards must be disjoint, cover the full slot space, and no node may
  // appear twice.
  //----------------------------------------------------------------------------
  bool validate(std::string &err) const;

  const ShardInfo* getShardForSlot(int64_t slot) const;
  const ShardInfo* getShardForNode(const NodeAddress &node) const;

  const std::vector<ShardInfo>& getShards() const {
    return shards;
  }

private:
  std::vector<ShardInfo> shards;

  // slot -> index into shards, -1 for unassigned slots
  std::vector<int32_t> slotToShard;
};

}

#endif
