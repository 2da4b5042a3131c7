// ----------------------------------------------------------------------
// File: KeyValueStore.cc
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

#include "storage/KeyValueStore.hh"
#include "storage/PatternMatching.hh"
#include "utils/StringUtils.hh"

using namespace slotdb;

KeyValueStore::KeyValueStore(SystemClock *cl) {
  if(cl) {
    clock = cl;
  }
  else {
    clockOwnership.reset(new SystemClock(false));
    clock = clockOwnership.get();
  }
}

const Entry* KeyValueStore::lookupForRead(std::string_view key) {
  auto it = contents.find(key);
  if(it == contents.end()) return nullptr;
  if(it->second.hasExpired(nowMs())) return nullptr;
  return &it->second;
}

KeyValueStore::Contents::iterator KeyValueStore::lookupForWrite(std::string_view key) {
  auto it = contents.find(key);
  if(it == contents.end()) return it;

  if(it->second.hasExpired(nowMs())) {
    contents.erase(it);
    return contents.end();
  }

  return it;
}

template<typename T>
Status KeyValueStore::readValue(std::string_view key, const T* &value) {
  const Entry *entry = lookupForRead(key);
  if(!entry) return Status::NotFound();

  value = std::get_if<T>(&entry->value);
  if(!value) return Status::WrongType();
  return Status::OK();
}

template<typename T>
Status KeyValueStore::writeValue(std::string_view key, bool create, Contents::iterator &it, T* &value) {
  it = lookupForWrite(key);

  if(it == contents.end()) {
    if(!create) return Status::NotFound();

    Entry entry;
    entry.value = T();
    it = contents.emplace(std::string(key), std::move(entry)).first;
  }

  value = std::get_if<T>(&it->second.value);
  if(!value) return Status::WrongType();
  return Status::OK();
}

void KeyValueStore::removeIfEmpty(Contents::iterator it) {
  bool empty = std::visit([](const auto &val) { return val.empty(); }, it->second.value);

  // Empty strings are legitimate values, only collections disappear.
  if(empty && it->second.getType() != KeyType::kString) {
    contents.erase(it);
  }
}

//------------------------------------------------------------------------------
// Strings
//------------------------------------------------------------------------------
Status KeyValueStore::get(std::string_view key, std::string &value) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const std::string *str = nullptr;
  Status st = readValue(key, str);
  if(!st.ok()) return st;

  value = *str;
  return st;
}

Status KeyValueStore::set(std::string_view key, std::string_view value) {
  bool performed;
  return set(key, value, 0, SetCondition::kAlways, performed);
}

Status KeyValueStore::set(std::string_view key, std::string_view value, int64_t expiration, SetCondition cond, bool &performed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  performed = false;

  auto it = lookupForWrite(key);
  bool exists = (it != contents.end());

  if(cond == SetCondition::kIfNotExists && exists) return Status::OK();
  if(cond == SetCondition::kIfExists && !exists) return Status::OK();

  if(!exists) {
    it = contents.emplace(std::string(key), Entry()).first;
  }

  it->second.value = std::string(value);
  it->second.expiration = expiration;
  performed = true;
  return Status::OK();
}

Status KeyValueStore::append(std::string_view key, std::string_view value, int64_t &length) {
  std::unique_lock<std::shared_mutex> lock(mtx);

  Contents::iterator it;
  std::string *str = nullptr;
  Status st = writeValue(key, true, it, str);
  if(!st.ok()) return st;

  str->append(value);
  length = str->size();
  return st;
}

Status KeyValueStore::strlen(std::string_view key, int64_t &length) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  length = 0;

  const std::string *str = nullptr;
  Status st = readValue(key, str);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  length = str->size();
  return st;
}

//------------------------------------------------------------------------------
// Generic
//------------------------------------------------------------------------------
Status KeyValueStore::del(const ReqIterator &start, const ReqIterator &end, int64_t &removed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  removed = 0;

  for(auto it = start; it != end; it++) {
    auto entry = lookupForWrite(*it);
    if(entry != contents.end()) {
      contents.erase(entry);
      removed++;
    }
  }

  return Status::OK();
}

Status KeyValueStore::exists(const ReqIterator &start, const ReqIterator &end, int64_t &count) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  count = 0;

  for(auto it = start; it != end; it++) {
    if(lookupForRead(*it)) count++;
  }

  return Status::OK();
}

Status KeyValueStore::getType(std::string_view key, std::string &keyType) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const Entry *entry = lookupForRead(key);
  if(!entry) {
    keyType = "none";
  }
  else {
    keyType = keyTypeAsString(entry->getType());
  }

  return Status::OK();
}

Status KeyValueStore::keys(const std::string &pattern, std::vector<std::string> &result) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  result.clear();

  std::string prefix = extractPatternPrefix(pattern);
  int64_t now = nowMs();

  for(auto it = contents.lower_bound(prefix); it != contents.end(); it++) {
    if(!StringUtils::startsWith(it->first, prefix)) break;
    if(it->second.hasExpired(now)) continue;

    if(StringUtils::globMatch(pattern, it->first)) {
      result.emplace_back(it->first);
    }
  }

  return Status::OK();
}

Status KeyValueStore::expireAt(std::string_view key, int64_t deadlineMs, bool &applied) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  applied = false;

  auto it = lookupForWrite(key);
  if(it == contents.end()) return Status::OK();

  applied = true;

  if(deadlineMs <= nowMs()) {
    contents.erase(it);
    return Status::OK();
  }

  it->second.expiration = deadlineMs;
  return Status::OK();
}

Status KeyValueStore::pttl(std::string_view key, int64_t &ttl) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const Entry *entry = lookupForRead(key);
  if(!entry) {
    ttl = -2;
  }
  else if(entry->expiration == 0) {
    ttl = -1;
  }
  else {
    ttl = entry->expiration - nowMs();
  }

  return Status::OK();
}

Status KeyValueStore::persist(std::string_view key, bool &removed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  removed = false;

  auto it = lookupForWrite(key);
  if(it == contents.end()) return Status::OK();

  removed = (it->second.expiration != 0);
  it->second.expiration = 0;
  return Status::OK();
}

Status KeyValueStore::flushall() {
  std::unique_lock<std::shared_mutex> lock(mtx);
  contents.clear();
  return Status::OK();
}

size_t KeyValueStore::size() {
  std::shared_lock<std::shared_mutex> lock(mtx);

  int64_t now = nowMs();
  size_t count = 0;
  for(auto it = contents.begin(); it != contents.end(); it++) {
    if(!it->second.hasExpired(now)) count++;
  }

  return count;
}

//------------------------------------------------------------------------------
// Lists
//------------------------------------------------------------------------------
Status KeyValueStore::push(std::string_view key, const ReqIterator &start, const ReqIterator &end, bool front, int64_t &length) {
  std::unique_lock<std::shared_mutex> lock(mtx);

  Contents::iterator it;
  ListValue *list = nullptr;
  Status st = writeValue(key, true, it, list);
  if(!st.ok()) return st;

  for(auto item = start; item != end; item++) {
    if(front) {
      list->emplace_front(*item);
    }
    else {
      list->emplace_back(*item);
    }
  }

  length = list->size();
  removeIfEmpty(it);
  return st;
}

Status KeyValueStore::lpush(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &length) {
  return push(key, start, end, true, length);
}

Status KeyValueStore::rpush(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &length) {
  return push(key, start, end, false, length);
}

Status KeyValueStore::pop(std::string_view key, bool front, std::string &item) {
  std::unique_lock<std::shared_mutex> lock(mtx);

  Contents::iterator it;
  ListValue *list = nullptr;
  Status st = writeValue(key, false, it, list);
  if(!st.ok()) return st;

  if(front) {
    item = std::move(list->front());
    list->pop_front();
  }
  else {
    item = std::move(list->back());
    list->pop_back();
  }

  removeIfEmpty(it);
  return st;
}

Status KeyValueStore::lpop(std::string_view key, std::string &item) {
  return pop(key, true, item);
}

Status KeyValueStore::rpop(std::string_view key, std::string &item) {
  return pop(key, false, item);
}

Status KeyValueStore::llen(std::string_view key, size_t &len) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  len = 0;

  const ListValue *list = nullptr;
  Status st = readValue(key, list);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  len = list->size();
  return st;
}

Status KeyValueStore::lrange(std::string_view key, int64_t start, int64_t stop, std::vector<std::string> &items) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  items.clear();

  const ListValue *list = nullptr;
  Status st = readValue(key, list);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  int64_t size = list->size();
  if(start < 0) start += size;
  if(stop < 0) stop += size;
  if(start < 0) start = 0;
  if(stop >= size) stop = size - 1;

  for(int64_t i = start; i <= stop; i++) {
    items.emplace_back((*list)[i]);
  }

  return Status::OK();
}

Status KeyValueStore::lindex(std::string_view key, int64_t index, std::string &item) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const ListValue *list = nullptr;
  Status st = readValue(key, list);
  if(!st.ok()) return st;

  int64_t size = list->size();
  if(index < 0) index += size;
  if(index < 0 || index >= size) return Status::NotFound();

  item = (*list)[index];
  return st;
}

Status KeyValueStore::lset(std::string_view key, int64_t index, std::string_view value) {
  std::unique_lock<std::shared_mutex> lock(mtx);

  Contents::iterator it;
  ListValue *list = nullptr;
  Status st = writeValue(key, false, it, list);
  if(st.IsNotFound()) return Status::NotFound("no such key");
  if(!st.ok()) return st;

  int64_t size = list->size();
  if(index < 0) index += size;
  if(index < 0 || index >= size) return Status::OutOfRange("index out of range");

  (*list)[index] = std::string(value);
  return st;
}

Status KeyValueStore::linsert(std::string_view key, bool before, std::string_view pivot, std::string_view value, int64_t &length) {
  std::unique_lock<std::shared_mutex> lock(mtx);

  Contents::iterator it;
  ListValue *list = nullptr;
  Status st = writeValue(key, false, it, list);
  if(st.IsNotFound()) {
    length = 0;
    return Status::OK();
  }

  if(!st.ok()) return st;

  for(auto item = list->begin(); item != list->end(); item++) {
    if(*item == pivot) {
      if(!before) item++;
      list->emplace(item, value);
      length = list->size();
      return st;
    }
  }

  length = -1;
  return st;
}

Status KeyValueStore::lrem(std::string_view key, int64_t count, std::string_view value, int64_t &removed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  removed = 0;

  Contents::iterator it;
  ListValue *list = nullptr;
  Status st = writeValue(key, false, it, list);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  // unsigned, so that INT64_MIN has a magnitude
  uint64_t limit = (count < 0) ? uint64_t(0) - uint64_t(count) : uint64_t(count);

  if(count >= 0) {
    for(auto item = list->begin(); item != list->end(); ) {
      if(*item == value && (limit == 0 || uint64_t(removed) < limit)) {
        item = list->erase(item);
        removed++;
      }
      else {
        item++;
      }
    }
  }
  else {
    for(int64_t i = list->size() - 1; i >= 0 && uint64_t(removed) < limit; i--) {
      if((*list)[i] == value) {
        list->erase(list->begin() + i);
        removed++;
      }
    }
  }

  removeIfEmpty(it);
  return st;
}

//------------------------------------------------------------------------------
// Hashes
//------------------------------------------------------------------------------
Status KeyValueStore::hset(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &created) {
  if((end - start) == 0 || (end - start) % 2 != 0) {
    return Status::InvalidArgument("field/value pairs expected");
  }

  std::unique_lock<std::shared_mutex> lock(mtx);
  created = 0;

  Contents::iterator it;
  HashValue *hash = nullptr;
  Status st = writeValue(key, true, it, hash);
  if(!st.ok()) return st;

  for(auto item = start; item != end; item += 2) {
    auto result = hash->insert_or_assign(*item, *(item+1));
    if(result.second) created++;
  }

  return st;
}

Status KeyValueStore::hget(std::string_view key, std::string_view field, std::string &value) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const HashValue *hash = nullptr;
  Status st = readValue(key, hash);
  if(!st.ok()) return st;

  auto it = hash->find(std::string(field));
  if(it == hash->end()) return Status::NotFound();

  value = it->second;
  return st;
}

Status KeyValueStore::hdel(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &removed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  removed = 0;

  Contents::iterator it;
  HashValue *hash = nullptr;
  Status st = writeValue(key, false, it, hash);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  for(auto field = start; field != end; field++) {
    removed += hash->erase(*field);
  }

  removeIfEmpty(it);
  return st;
}

Status KeyValueStore::hexists(std::string_view key, std::string_view field) {
  std::string tmp;
  return hget(key, field, tmp);
}

Status KeyValueStore::hlen(std::string_view key, size_t &len) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  len = 0;

  const HashValue *hash = nullptr;
  Status st = readValue(key, hash);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  len = hash->size();
  return st;
}

Status KeyValueStore::hgetall(std::string_view key, std::vector<std::string> &res) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  res.clear();

  const HashValue *hash = nullptr;
  Status st = readValue(key, hash);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  for(auto it = hash->begin(); it != hash->end(); it++) {
    res.emplace_back(it->first);
    res.emplace_back(it->second);
  }

  return st;
}

Status KeyValueStore::hkeys(std::string_view key, std::vector<std::string> &keys) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  keys.clear();

  const HashValue *hash = nullptr;
  Status st = readValue(key, hash);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  for(auto it = hash->begin(); it != hash->end(); it++) {
    keys.emplace_back(it->first);
  }

  return st;
}

Status KeyValueStore::hvals(std::string_view key, std::vector<std::string> &vals) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  vals.clear();

  const HashValue *hash = nullptr;
  Status st = readValue(key, hash);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  for(auto it = hash->begin(); it != hash->end(); it++) {
    vals.emplace_back(it->second);
  }

  return st;
}

//------------------------------------------------------------------------------
// Sets
//------------------------------------------------------------------------------
Status KeyValueStore::sadd(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &added) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  added = 0;

  Contents::iterator it;
  SetValue *set = nullptr;
  Status st = writeValue(key, true, it, set);
  if(!st.ok()) return st;

  for(auto item = start; item != end; item++) {
    if(set->insert(*item).second) added++;
  }

  removeIfEmpty(it);
  return st;
}

Status KeyValueStore::srem(std::string_view key, const ReqIterator &start, const ReqIterator &end, int64_t &removed) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  removed = 0;

  Contents::iterator it;
  SetValue *set = nullptr;
  Status st = writeValue(key, false, it, set);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  for(auto item = start; item != end; item++) {
    removed += set->erase(*item);
  }

  removeIfEmpty(it);
  return st;
}

Status KeyValueStore::smembers(std::string_view key, std::vector<std::string> &members) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  members.clear();

  const SetValue *set = nullptr;
  Status st = readValue(key, set);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  members.assign(set->begin(), set->end());
  return st;
}

Status KeyValueStore::sismember(std::string_view key, std::string_view element) {
  std::shared_lock<std::shared_mutex> lock(mtx);

  const SetValue *set = nullptr;
  Status st = readValue(key, set);
  if(!st.ok()) return st;

  if(set->find(std::string(element)) == set->end()) return Status::NotFound();
  return st;
}

Status KeyValueStore::scard(std::string_view key, size_t &count) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  count = 0;

  const SetValue *set = nullptr;
  Status st = readValue(key, set);
  if(st.IsNotFound()) return Status::OK();
  if(!st.ok()) return st;

  count = set->size();
  return st;
}

//------------------------------------------------------------------------------
// Snapshot support
//------------------------------------------------------------------------------
void KeyValueStore::copyContents(Contents &out) {
  std::shared_lock<std::shared_mutex> lock(mtx);
  out.clear();

  int64_t now = nowMs();
  for(auto it = contents.begin(); it != contents.end(); it++) {
    if(!it->second.hasExpired(now)) {
      out.emplace_hint(out.end(), it->first, it->second);
    }
  }
}

void KeyValueStore::replaceContents(Contents &&newContents) {
  std::unique_lock<std::shared_mutex> lock(mtx);
  contents = std::move(newContents);
}
