// ----------------------------------------------------------------------
// File: Macros.hh
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

#ifndef SLOTDB_MACROS_HH
#define SLOTDB_MACROS_HH

#include <atomic>
#include <mutex>
#include <chrono>
#include <iostream>
#include <sstream>

namespace slotdb {

class FatalException : public std::exception {
public:
  FatalException(const std::string &m) : msg(m) {}
  virtual ~FatalException() {}

  virtual const char* what() const noexcept {
    return msg.c_str();
  }

private:
  std::string msg;
};

enum class TraceLevel {
  off = 0,
  error = 1,
  warning = 2,
  info = 3,
  debug = 4
};

// Messages above this level are dropped. Events, criticals and
// misconfigurations are always printed.
extern std::atomic<TraceLevel> traceLevel;
void setTraceLevel(TraceLevel level);

// Returns a stacktrace if 'stacktrace-on-error' is enabled, empty otherwise.
std::string errorStacktrace(bool crash);

#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName&) = delete;   \
  void operator=(const TypeName&) = delete

#define SSTR(message) static_cast<std::ostringstream&>(std::ostringstream().flush() << message).str()
#define quotes(message) SSTR("'" << message << "'")

extern std::mutex logMutex;
#define TIME_NOW std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count()
#define ___log(message) { std::lock_guard<std::mutex> logLock(slotdb::logMutex); \
  std::cerr << "[" << TIME_NOW << "] " << message << std::endl; }

#define sdb_log(message) ___log(message)
#define sdb_event(message) ___log("EVENT: " << message)
#define sdb_critical(message) ___log("CRITICAL: " << message << slotdb::errorStacktrace(false))
#define sdb_misconfig(message) ___log("MISCONFIGURATION: " << message)

#define ___traced(level) (slotdb::traceLevel.load() >= slotdb::TraceLevel::level)

#define sdb_warn(message) if(___traced(warning)) { ___log("WARNING: " << message); }
#define sdb_error(message) if(___traced(error)) { ___log("ERROR: " << message); }
#define sdb_info(message) if(___traced(info)) { ___log("INFO: " << message); }
#define sdb_debug(message) if(___traced(debug)) { ___log("DEBUG: " << message); }

// a serious error has occured signifying a bug in the program logic
#define sdb_throw(message) throw slotdb::FatalException(SSTR(message << slotdb::errorStacktrace(true)))
#define sdb_assert(condition) if(!((condition))) throw slotdb::FatalException(SSTR("assertion violation, condition is not true: " << #condition << slotdb::errorStacktrace(true)))

}

#endif
