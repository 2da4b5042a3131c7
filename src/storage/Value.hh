// ----------------------------------------------------------------------
// File: Value.hh
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

#ifndef SLOTDB_STORAGE_VALUE_HH
#define SLOTDB_STORAGE_VALUE_HH

#include <deque>
#include <map>
#include <set>
#include <string>
#include <variant>
#include "Utils.hh"

namespace slotdb {

// Types of keys supported. The numeric values are part of the snapshot
// format, never reorder.
enum class KeyType : uint8_t {
  kString = 0,
  kList = 1,
  kHash = 2,
  kSet = 3
};

inline bool parseKeyType(uint8_t c, KeyType &type) {
  if(c > uint8_t(KeyType::kSet)) return false;
  type = KeyType(c);
  return true;
}

inline std::string keyTypeAsString(KeyType key) {
  switch(key) {
    case KeyType::kString: {
      return "string";
    }
    case KeyType::kList: {
      return "list";
    }
    case KeyType::kHash: {
      return "hash";
    }
    case KeyType::kSet: {
      return "set";
    }
  }

  sdb_throw("unknown KeyType: " << int(key));
}

using ListValue = std::deque<std::string>;
using HashValue = std::map<std::string, std::string>;
using SetValue = std::set<std::string>;

//------------------------------------------------------------------------------
// A value together with its expiration deadline. The variant alternatives
// must stay in the same order as KeyType.
//------------------------------------------------------------------------------
struct Entry {
  std::variant<std::string, ListValue, HashValue, SetValue> value;

  // Milliseconds since the epoch, 0 means no expiration.
  int64_t expiration = 0;

  KeyType getType() const {
    return KeyType(value.index());
  }

  bool hasExpired(int64_t nowMs) const {
    return expiration != 0 && expiration <= nowMs;
  }

  bool operator==(const Entry &rhs) const {
    return value == rhs.value && expiration == rhs.expiration;
  }
};

}

#endif
