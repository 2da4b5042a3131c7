// ----------------------------------------------------------------------
// File: SnapshotManager.cc
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

#include "storage/SnapshotManager.hh"
#include "cluster/SlotMap.hh"
#include "utils/FileUtils.hh"
#include "utils/IntToBinaryString.hh"

#include <cstring>
#include <openssl/sha.h>
#include <openssl/crypto.h>

namespace slotdb {

constexpr char SnapshotManager::kMagic[8];
constexpr uint32_t SnapshotManager::kFormatVersion;

static void appendBlob(std::string &dest, std::string_view blob) {
  appendU32(dest, blob.size());
  dest.append(blob.data(), blob.size());
}

static std::string sha256(std::string_view data) {
  std::string digest;
  digest.resize(SHA256_DIGEST_LENGTH);
  SHA256((const unsigned char*) data.data(), data.size(), (unsigned char*) digest.data());
  return digest;
}

//------------------------------------------------------------------------------
// Bounds-checked cursor over the body of a snapshot
//------------------------------------------------------------------------------
class SnapshotReader {
public:
  SnapshotReader(std::string_view d) : data(d) {}

  void consume(size_t len, std::string_view &out) {
    if(data.size() - position < len) {
      throw PersistenceError(SSTR("snapshot truncated at offset " << position <<
        ", wanted " << len << " more bytes"));
    }

    out = data.substr(position, len);
    position += len;
  }

  uint8_t u8() {
    std::string_view out;
    consume(1, out);
    return uint8_t(out[0]);
  }

  uint32_t u32() {
    std::string_view out;
    consume(4, out);
    return binaryStringToU32(out.data());
  }

  uint64_t u64() {
    std::string_view out;
    consume(8, out);
    return binaryStringToU64(out.data());
  }

  int64_t i64() {
    std::string_view out;
    consume(8, out);
    return binaryStringToI64(out.data());
  }

  std::string blob() {
    uint32_t len = u32();
    std::string_view out;
    consume(len, out);
    return std::string(out);
  }

  bool eof() const {
    return position == data.size();
  }

private:
  std::string_view data;
  size_t position = 0;
};

SnapshotManager::SnapshotManager(KeyValueStore &st, const std::string &p,
  std::chrono::seconds iv)
: store(st), path(p), interval(iv) { }

SnapshotManager::~SnapshotManager() {
  stop();
}

std::string SnapshotManager::filename(const std::string &dir, const ShardInfo &shard, int port) {
  return pathJoin(dir, SSTR("slotdb_node_" << shard.start << "_" << shard.end << "_" << port << ".snapshot"));
}

std::string SnapshotManager::serialize(const KeyValueStore::Contents &contents) {
  std::string out;
  out.append(kMagic, sizeof(kMagic));
  appendU32(out, kFormatVersion);
  appendU64(out, contents.size());

  // std::map iterates in key order
  for(auto it = contents.begin(); it != contents.end(); it++) {
    const Entry &entry = it->second;
    appendU8(out, uint8_t(entry.getType()));
    appendI64(out, entry.expiration);
    appendBlob(out, it->first);

    switch(entry.getType()) {
      case KeyType::kString: {
        appendBlob(out, std::get<std::string>(entry.value));
        break;
      }
      case KeyType::kList: {
        const ListValue &list = std::get<ListValue>(entry.value);
        appendU32(out, list.size());
        for(const std::string &item : list) {
          appendBlob(out, item);
        }
        break;
      }
      case KeyType::kHash: {
        const HashValue &hash = std::get<HashValue>(entry.value);
        appendU32(out, hash.size());
        for(auto field = hash.begin(); field != hash.end(); field++) {
          appendBlob(out, field->first);
          appendBlob(out, field->second);
        }
        break;
      }
      case KeyType::kSet: {
        const SetValue &set = std::get<SetValue>(entry.value);
        appendU32(out, set.size());
        for(const std::string &member : set) {
          appendBlob(out, member);
        }
        break;
      }
    }
  }

  out.append(sha256(out));
  return out;
}

void SnapshotManager::deserialize(std::string_view data, int64_t nowMs, KeyValueStore::Contents &out) {
  out.clear();

  if(data.size() < sizeof(kMagic) + 4 + 8 + SHA256_DIGEST_LENGTH) {
    throw PersistenceError(SSTR("snapshot too short: " << data.size() << " bytes"));
  }

  if(memcmp(data.data(), kMagic, sizeof(kMagic)) != 0) {
    throw PersistenceError("bad magic, not a snapshot file");
  }

  std::string_view body = data.substr(0, data.size() - SHA256_DIGEST_LENGTH);
  std::string_view trailer = data.substr(data.size() - SHA256_DIGEST_LENGTH);
  std::string digest = sha256(body);

  if(CRYPTO_memcmp(digest.data(), trailer.data(), SHA256_DIGEST_LENGTH) != 0) {
    throw PersistenceError("checksum mismatch");
  }

  SnapshotReader reader(body.substr(sizeof(kMagic)));

  uint32_t version = reader.u32();
  if(version != kFormatVersion) {
    throw PersistenceError(SSTR("unsupported snapshot version: " << version));
  }

  uint64_t count = reader.u64();
  for(uint64_t i = 0; i < count; i++) {
    KeyType type;
    uint8_t rawType = reader.u8();
    if(!parseKeyType(rawType, type)) {
      throw PersistenceError(SSTR("unknown record type " << int(rawType) << " in record " << i));
    }

    Entry entry;
    entry.expiration = reader.i64();
    std::string key = reader.blob();

    switch(type) {
      case KeyType::kString: {
        entry.value = reader.blob();
        break;
      }
      case KeyType::kList: {
        ListValue list;
        uint32_t items = reader.u32();
        for(uint32_t j = 0; j < items; j++) {
          list.emplace_back(reader.blob());
        }
        entry.value = std::move(list);
        break;
      }
      case KeyType::kHash: {
        HashValue hash;
        uint32_t fields = reader.u32();
        for(uint32_t j = 0; j < fields; j++) {
          std::string field = reader.blob();
          hash[field] = reader.blob();
        }
        entry.value = std::move(hash);
        break;
      }
      case KeyType::kSet: {
        SetValue set;
        uint32_t members = reader.u32();
        for(uint32_t j = 0; j < members; j++) {
          set.emplace(reader.blob());
        }
        entry.value = std::move(set);
        break;
      }
    }

    if(entry.hasExpired(nowMs)) continue;
    out[key] = std::move(entry);
  }

  if(!reader.eof()) {
    throw PersistenceError("trailing garbage after last record");
  }
}

bool SnapshotManager::snapshot(std::string &err) {
  std::lock_guard<std::mutex> lock(snapshotMtx);

  KeyValueStore::Contents contents;
  store.copyContents(contents);

  std::string serialized = serialize(contents);
  if(!writeFileAtomically(path, serialized, err)) {
    sdb_error("Unable to write snapshot to " << path << ": " << err << ", previous snapshot left in place");
    return false;
  }

  snapshotCount++;
  sdb_debug("Wrote snapshot with " << contents.size() << " keys to " << path);
  return true;
}

bool SnapshotManager::restore() {
  if(!fileExists(path)) {
    sdb_info("No snapshot found at " << path << ", starting with an empty store");
    return false;
  }

  std::string data;
  if(!readFile(path, data)) {
    throw PersistenceError(SSTR("unable to read snapshot " << path));
  }

  KeyValueStore::Contents contents;
  try {
    deserialize(data, store.nowMs(), contents);
  }
  catch(const PersistenceError &exc) {
    throw PersistenceError(SSTR("corrupt snapshot " << path << ": " << exc.what()));
  }

  size_t restored = contents.size();
  store.replaceContents(std::move(contents));
  sdb_event("Restored " << restored << " keys from snapshot " << path);
  return true;
}

void SnapshotManager::start() {
  if(interval.count() <= 0) {
    sdb_info("Periodic snapshots are disabled");
    return;
  }

  thread.reset(&SnapshotManager::main, this);
}

void SnapshotManager::stop() {
  thread.join();
}

void SnapshotManager::main(ThreadAssistant &assistant) {
  while(true) {
    assistant.wait_for(interval);
    if(assistant.terminationRequested()) return;

    std::string err;
    snapshot(err);
  }
}

}
