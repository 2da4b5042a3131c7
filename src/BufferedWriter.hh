// ----------------------------------------------------------------------
// File: BufferedWriter.hh
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

#ifndef SLOTDB_BUFFERED_WRITER_HH
#define SLOTDB_BUFFERED_WRITER_HH

#include <mutex>
#include <cstring>
#include <string>
#include "Link.hh"

namespace slotdb {

#define OUTPUT_BUFFER_SIZE (16*1024)

//------------------------------------------------------------------------------
// Coalesces small replies into larger writes. Pipelined requests would
// otherwise cause one syscall per reply.
//------------------------------------------------------------------------------
class BufferedWriter {
public:
  BufferedWriter(Link *l) : link(l) {}

  ~BufferedWriter() {
    flush();
  }

  void setActive(bool newval) {
    std::lock_guard<std::recursive_mutex> lock(mtx);
    active = newval;
    if(!active) flushNoLock();
  }

  LinkStatus flush() {
    std::lock_guard<std::recursive_mutex> lock(mtx);
    return flushNoLock();
  }

  LinkStatus send(std::string &&raw) {
    std::lock_guard<std::recursive_mutex> lock(mtx);
    if(!active) return link->Send(raw);

    if(raw.size() >= OUTPUT_BUFFER_SIZE) {
      LinkStatus rc = flushNoLock();
      if(rc < 0) return rc;
      return link->Send(raw);
    }

    if(bufferedBytes + raw.size() > OUTPUT_BUFFER_SIZE) {
      LinkStatus rc = flushNoLock();
      if(rc < 0) return rc;
    }

    memcpy(buffer + bufferedBytes, raw.c_str(), raw.size());
    bufferedBytes += raw.size();
    return raw.size();
  }

private:
  LinkStatus flushNoLock() {
    if(bufferedBytes == 0) return 1;
    LinkStatus rc = link->Send(buffer, bufferedBytes);
    bufferedBytes = 0;
    return rc;
  }

  Link *link;

  bool active = true;
  char buffer[OUTPUT_BUFFER_SIZE];
  size_t bufferedBytes = 0;

  std::recursive_mutex mtx;
};

}

#endif
