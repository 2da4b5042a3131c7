// ----------------------------------------------------------------------
// File: SlotMap.cc
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

#include "cluster/SlotMap.hh"
#include "Utils.hh"

using namespace slotdb;

std::string ShardInfo::describe() const {
  return SSTR("[" << start << ", " << end << "] " << serializeNodes(nodes));
}

SlotMap::SlotMap(const std::vector<ShardInfo> &sh) : shards(sh), slotToShard(kSlotCount, -1) {
  for(size_t i = 0; i < shards.size(); i++) {
    for(int64_t slot = std::max<int64_t>(0, shards[i].start); slot <= shards[i].end && slot < kSlotCount; slot++) {
      if(slotToShard[slot] == -1) {
        slotToShard[slot] = i;
      }
    }
  }
}

uint16_t SlotMap::crc16(std::string_view data) {
  uint16_t crc = 0;

  for(size_t i = 0; i < data.size(); i++) {
    crc ^= (uint16_t) ((uint8_t) data[i]) << 8;

    for(int bit = 0; bit < 8; bit++) {
      if(crc & 0x8000) {
        crc = (crc << 1) ^ 0x1021;
      }
      else {
        crc = crc << 1;
      }
    }
  }

  return crc;
}

int64_t SlotMap::slotForKey(std::string_view key) {
  size_t open = key.find('{');

  if(open != std::string_view::npos) {
    size_t close = key.find('}', open+1);

    if(close != std::string_view::npos && close != open+1) {
      key = key.substr(open+1, close-open-1);
    }
  }

  return crc16(key) % kSlotCount;
}

bool SlotMap::parseShard(const std::string &str, ShardInfo &shard, std::string &err) {
  std::vector<std::string> parts;
  std::istringstream ss(str);
  std::string part;

  while(ss >> part) {
    parts.emplace_back(part);
  }

  if(parts.size() < 3) {
    err = SSTR("expected '<start> <end> <primary> [<replica> ...]', got " << quotes(str));
    return false;
  }

  if(!my_strtoll(parts[0], shard.start) || !my_strtoll(parts[1], shard.end)) {
    err = SSTR("could not parse slot range in " << quotes(str));
    return false;
  }

  if(shard.start < 0 || shard.end >= kSlotCount || shard.start > shard.end) {
    err = SSTR("invalid slot range [" << shard.start << ", " << shard.end << "]");
    return false;
  }

  shard.nodes.clear();
  for(size_t i = 2; i < parts.size(); i++) {
    NodeAddress node;
    if(!parseServer(parts[i], node)) {
      err = SSTR("could not parse node address " << quotes(parts[i]));
      return false;
    }

    shard.nodes.emplace_back(node);
  }

  return true;
}

bool SlotMap::validate(std::string &err) const {
  if(shards.empty()) {
    err = "no shards defined";
    return false;
  }

  std::vector<NodeAddress> allNodes;
  std::vector<int> coverage(kSlotCount, 0);

  for(size_t i = 0; i < shards.size(); i++) {
    const ShardInfo &shard = shards[i];

    if(shard.nodes.empty()) {
      err = SSTR("shard " << shard.describe() << " has no nodes");
      return false;
    }

    if(shard.start < 0 || shard.end >= kSlotCount || shard.start > shard.end) {
      err = SSTR("shard " << shard.describe() << " has an invalid slot range");
      return false;
    }

    for(int64_t slot = shard.start; slot <= shard.end; slot++) {
      if(coverage[slot]++ != 0) {
        err = SSTR("slot " << slot << " is assigned to more than one shard");
        return false;
      }
    }

    allNodes.insert(allNodes.end(), shard.nodes.begin(), shard.nodes.end());
  }

  for(int64_t slot = 0; slot < kSlotCount; slot++) {
    if(coverage[slot] == 0) {
      err = SSTR("slot " << slot << " is not assigned to any shard");
      return false;
    }
  }

  if(!checkUnique(allNodes)) {
    err = "a node appears more than once in the topology";
    return false;
  }

  return true;
}

const ShardInfo* SlotMap::getShardForSlot(int64_t slot) const {
  if(slot < 0 || slot >= (int64_t) slotToShard.size()) return nullptr;

  int32_t idx = slotToShard[slot];
  if(idx < 0) return nullptr;
  return &shards[idx];
}

const ShardInfo* SlotMap::getShardForNode(const NodeAddress &node) const {
  for(size_t i = 0; i < shards.size(); i++) {
    if(contains(shards[i].nodes, node)) {
      return &shards[i];
    }
  }

  return nullptr;
}
