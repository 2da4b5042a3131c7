// ----------------------------------------------------------------------
// File: Configuration.cc
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

#include <algorithm>

#include "config/ConfigurationReader.hh"
#include "Configuration.hh"
#include "utils/Macros.hh"
#include "utils/FileUtils.hh"
#include "utils/ParseUtils.hh"
#include "utils/StringUtils.hh"
#include "Utils.hh"

using namespace slotdb;

bool Configuration::fromFile(const std::string &filename, int port, Configuration &out) {
  sdb_log("Reading configuration file from " << filename);

  std::string contents;
  if(!readFile(filename, contents)) {
    sdb_error("Could not read configuration file: " << filename);
    return false;
  }

  return Configuration::fromString(contents, port, out);
}

static bool fetchSingle(ConfigurationReader &reader, std::string &dest) {
  if(reader.lastWordOnLine()) {
    return false;
  }

  reader.advanceWord();

  if(reader.eof()) {
    return false;
  }

  dest = reader.getCurrentWord();

  if(dest.empty()) {
    return false;
  }

  return true;
}

static bool fetchInteger(ConfigurationReader &reader, int64_t min, int64_t &dest) {
  std::string buffer;
  if(!fetchSingle(reader, buffer)) return false;

  int64_t value;
  if(!ParseUtils::parseInteger(buffer, value) || value < min) {
    sdb_log("Cannot convert to an integer >= " << min << ": " << quotes(buffer));
    return false;
  }

  dest = value;
  return true;
}

static bool fetchShard(ConfigurationReader &reader, std::vector<ShardInfo> &shards) {
  ShardInfo shard;
  std::string err;

  if(!SlotMap::parseShard(reader.getRestOfLine(), shard, err)) {
    sdb_log("Cannot parse shard definition: " << err);
    return false;
  }

  shards.emplace_back(std::move(shard));
  return true;
}

bool Configuration::fromReader(ConfigurationReader &reader, int port, Configuration &out) {
  out = Configuration();
  out.myself.port = port;

  while(!reader.eof()) {
    std::string current = reader.getCurrentWord();
    bool isMine = StringUtils::startsWith(current, "redis.");

    if(!isMine) {
      reader.advanceLine();
      continue;
    }

    current = std::string(current.begin()+6, current.end());

    bool success = false;
    std::string buffer;
    int64_t number;

    if(current == "myself") {
      success = fetchSingle(reader, out.myself.hostname);
    }
    else if(current == "shard") {
      success = fetchShard(reader, out.shards);
    }
    else if(current == "snapshot-dir") {
      success = fetchSingle(reader, out.snapshotDir);
    }
    else if(current == "snapshot-interval") {
      success = fetchInteger(reader, 0, out.snapshotInterval);
    }
    else if(current == "idle-timeout") {
      success = fetchInteger(reader, 0, out.idleTimeout);
    }
    else if(current == "password") {
      success = fetchSingle(reader, out.password);
    }
    else if(current == "password-file") {
      success = fetchSingle(reader, out.passwordFilePath);
    }
    else if(current == "notify-prefix") {
      success = fetchSingle(reader, out.notifyPrefix);
    }
    else if(current == "threads") {
      success = fetchInteger(reader, 1, number);
      out.threads = number;
    }
    else if(current == "max-pending-bytes") {
      success = fetchInteger(reader, 1, number);
      out.maxPendingBytes = number;
    }
    else if(current == "trace") {
      success = fetchSingle(reader, buffer) && ParseUtils::parseTraceLevel(buffer, out.trace);
    }
    else {
      sdb_warn("Error when parsing configuration - unknown option " << quotes(current));
      return false;
    }

    if(!success) {
      sdb_warn("Error when parsing configuration option " << quotes("redis." << current));
      return false;
    }

    reader.advanceLine();
  }

  return out.isValid();
}

bool Configuration::fromString(const std::string &str, int port, Configuration &out) {
  ConfigurationReader reader(str);
  return Configuration::fromReader(reader, port, out);
}

bool Configuration::isValid() {
  if(myself.port <= 0 || myself.port > 65535) {
    sdb_misconfig("invalid port: " << myself.port);
    return false;
  }

  if(snapshotDir.empty()) {
    sdb_misconfig("redis.snapshot-dir must be specified.");
    return false;
  }

  if(snapshotDir.size() > 1 && snapshotDir[snapshotDir.size()-1] == '/') {
    sdb_misconfig("redis.snapshot-dir cannot contain trailing slashes");
    return false;
  }

  if(!passwordFilePath.empty() && !password.empty()) {
    sdb_misconfig("Cannot both specify redis.password-file and redis.password, choose one or the other");
    return false;
  }

  slotMap = SlotMap(shards);

  std::string err;
  if(!slotMap.validate(err)) {
    sdb_misconfig(err);
    return false;
  }

  const ShardInfo *mine = slotMap.getShardForNode(myself);
  if(!mine) {
    sdb_misconfig("this node (" << myself.toString() << ") is not part of any shard");
    return false;
  }

  myShard = *mine;
  role = (myShard.primary() == myself) ? NodeRole::kPrimary : NodeRole::kReplica;
  return true;
}

std::string Configuration::extractPasswordOrDie() const {
  sdb_assert(passwordFilePath.empty() || password.empty());

  if(!password.empty()) {
    return password;
  }

  if(passwordFilePath.empty()) {
    return "";
  }

  std::string contents;
  if(!readPasswordFile(passwordFilePath, contents)) {
    sdb_throw("Could not read password file: " << passwordFilePath);
  }

  return contents;
}
