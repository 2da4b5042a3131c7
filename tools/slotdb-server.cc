// ----------------------------------------------------------------------
// File: slotdb-server.cc
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

#include "utils/Macros.hh"
#include "utils/FileUtils.hh"
#include "utils/InFlightTracker.hh"
#include "storage/SnapshotManager.hh"
#include "netio/AsioPoller.hh"
#include "Configuration.hh"
#include "SlotDBNode.hh"
#include "EventFD.hh"
#include "Link.hh"
#include "Utils.hh"

#include <CLI/CLI.hpp>
#include <csignal>

namespace slotdb {

InFlightTracker inFlightTracker;
EventFD shutdownFD;

static void handle_sigint(int sig) {
  inFlightTracker.setAcceptingRequests(false);
  shutdownFD.notify();
}

//------------------------------------------------------------------------------
// With no configuration file, the node serves every slot on its own and keeps
// snapshots in the working directory.
//------------------------------------------------------------------------------
static std::string singleNodeConfiguration(int port) {
  std::ostringstream ss;
  ss << "redis.myself localhost" << std::endl;
  ss << "redis.shard 0 " << kSlotCount - 1 << " localhost:" << port << std::endl;
  ss << "redis.snapshot-dir ." << std::endl;
  return ss.str();
}

int runServer(int port, const std::string &optConfiguration) {
  //----------------------------------------------------------------------------
  // Read configuration file, check validity..
  //----------------------------------------------------------------------------
  Configuration configuration;
  bool success;

  if(optConfiguration.empty()) {
    sdb_info("No configuration file given, running as the only node of a single-shard cluster");
    success = Configuration::fromString(singleNodeConfiguration(port), port, configuration);
  }
  else {
    success = Configuration::fromFile(optConfiguration, port, configuration);
  }

  if(!success) return 1;

  setTraceLevel(configuration.getTraceLevel());
  Link::setMaxPendingBytes(configuration.getMaxPendingBytes());

  //----------------------------------------------------------------------------
  // Let's get this party started
  //----------------------------------------------------------------------------
  std::unique_ptr<SlotDBNode> node(new SlotDBNode(configuration));

  try {
    node->start();
  }
  catch(const PersistenceError &exc) {
    sdb_critical("Unable to load snapshot, refusing to start: " << exc.what());
    return 2;
  }

  std::unique_ptr<AsioPoller> poller;

  try {
    poller.reset(new AsioPoller(port, configuration.getThreads(), node.get(), configuration.getIdleTimeout()));
  }
  catch(const FatalException &exc) {
    sdb_critical("Unable to start listening: " << exc.what());
    node->shutdown();
    return 3;
  }

  signal(SIGINT, handle_sigint);
  signal(SIGTERM, handle_sigint);
  signal(SIGPIPE, SIG_IGN);

  while(inFlightTracker.isAcceptingRequests()) {
    shutdownFD.wait();
  }

  //----------------------------------------------------------------------------
  // Time to shut down
  //----------------------------------------------------------------------------
  sdb_event("Received request to shut down. Stopping all connections and taking a final snapshot..");

  poller.reset();
  node->shutdown();
  node.reset();

  sdb_event("SHUTTING DOWN");
  return 0;
}

}

struct FileExistenceValidator : public CLI::Validator {
  FileExistenceValidator() : Validator("PATH") {
    func_ = [](const std::string &path) {

      if(!slotdb::fileExists(path)) {
        return SSTR("Path '" << path << "' does not exist, or is not a file.");
      }

      return std::string();
    };
  }
};

int main(int argc, char** argv) {
  //----------------------------------------------------------------------------
  // Setup variables
  //----------------------------------------------------------------------------
  CLI::App app("SlotDB is a sharded, replicated in-memory datastore speaking the redis protocol. slotdb-server is the main server executable.");
  FileExistenceValidator fileExistenceValidator;

  int port = 0;
  std::string optConfiguration;

  //----------------------------------------------------------------------------
  // Setup options
  //----------------------------------------------------------------------------
  app.add_option("port", port, "Port to listen on, also identifies this node within the cluster")
    ->required()
    ->check(CLI::Range(1, 65535));

  app.add_option("--configuration", optConfiguration, "Path to configuration file")
    ->check(fileExistenceValidator);

  //----------------------------------------------------------------------------
  // Parse..
  //----------------------------------------------------------------------------
  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  //----------------------------------------------------------------------------
  // Run server.
  //----------------------------------------------------------------------------
  try {
    return slotdb::runServer(port, optConfiguration);
  }
  catch(const slotdb::FatalException &exc) {
    sdb_critical("Fatal error: " << exc.what());
    return 1;
  }
}
