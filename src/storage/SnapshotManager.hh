// ----------------------------------------------------------------------
// File: SnapshotManager.hh
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

#ifndef SLOTDB_STORAGE_SNAPSHOT_MANAGER_HH
#define SLOTDB_STORAGE_SNAPSHOT_MANAGER_HH

#include <chrono>
#include <mutex>
#include "storage/KeyValueStore.hh"
#include "utils/AssistedThread.hh"

namespace slotdb {

struct ShardInfo;

//------------------------------------------------------------------------------
// Thrown when a snapshot file exists, but cannot be trusted: bad magic,
// unsupported version, truncation, or checksum mismatch.
//------------------------------------------------------------------------------
class PersistenceError : public std::exception {
public:
  PersistenceError(const std::string &m) : msg(m) {}
  virtual ~PersistenceError() {}

  virtual const char* what() const noexcept {
    return msg.c_str();
  }

private:
  std::string msg;
};

//------------------------------------------------------------------------------
// Owns the on-disk snapshot of a single node.
//
// Layout, all integers little-endian:
//   magic "SLOTDB\0\1" | u32 version | u64 count | records ... | sha256
// Each record:
//   u8 type | i64 expiration | u32 keylen, key | payload
//------------------------------------------------------------------------------
class SnapshotManager {
public:
  static constexpr char kMagic[8] = {'S', 'L', 'O', 'T', 'D', 'B', '\0', '\1'};
  static constexpr uint32_t kFormatVersion = 1;

  SnapshotManager(KeyValueStore &store, const std::string &path,
    std::chrono::seconds interval);
  ~SnapshotManager();

  static std::string filename(const std::string &dir, const ShardInfo &shard, int port);

  static std::string serialize(const KeyValueStore::Contents &contents);

  //----------------------------------------------------------------------------
  // Throws PersistenceError on any inconsistency. Entries already expired
  // at 'nowMs' are skipped.
  //----------------------------------------------------------------------------
  static void deserialize(std::string_view data, int64_t nowMs, KeyValueStore::Contents &out);

  //----------------------------------------------------------------------------
  // Write a point-in-time image of the store. On failure the previous
  // snapshot stays in place.
  //----------------------------------------------------------------------------
  bool snapshot(std::string &err);

  //----------------------------------------------------------------------------
  // Load the snapshot into the store. Returns false on cold start (no file),
  // throws PersistenceError if the file is corrupt.
  //----------------------------------------------------------------------------
  bool restore();

  //----------------------------------------------------------------------------
  // Start the periodic snapshot thread, if an interval has been configured.
  //----------------------------------------------------------------------------
  void start();
  void stop();

  const std::string& getPath() const {
    return path;
  }

  int64_t getSnapshotCount() const {
    return snapshotCount;
  }

private:
  void main(ThreadAssistant &assistant);

  KeyValueStore &store;
  std::string path;
  std::chrono::seconds interval;

  std::mutex snapshotMtx;
  std::atomic<int64_t> snapshotCount {0};
  AssistedThread thread;
};

}

#endif
