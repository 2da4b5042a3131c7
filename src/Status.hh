// ----------------------------------------------------------------------
// File: Status.hh
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

#ifndef SLOTDB_STATUS_HH
#define SLOTDB_STATUS_HH

#include "utils/Macros.hh"
#include <string_view>

namespace slotdb {

//------------------------------------------------------------------------------
// Status object for operations which may fail
//------------------------------------------------------------------------------
class Status {
public:
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kWrongType = 2,
    kInvalidArgument = 3,
    kOutOfRange = 4,
    kIOError = 5
  };

  //----------------------------------------------------------------------------
  // Default constructor - status is OK, no error message.
  //----------------------------------------------------------------------------
  Status() : errcode(kOk) {}

  //----------------------------------------------------------------------------
  // Constructor with an error
  //----------------------------------------------------------------------------
  Status(int err, std::string_view msg) : errcode(err), errorMessage(msg) {}

  static Status OK() {
    return Status();
  }

  static Status NotFound(std::string_view msg = "") {
    return Status(kNotFound, msg);
  }

  static Status WrongType() {
    return Status(kWrongType, "WRONGTYPE Operation against a key holding the wrong kind of value");
  }

  static Status InvalidArgument(std::string_view msg) {
    return Status(kInvalidArgument, msg);
  }

  static Status OutOfRange(std::string_view msg) {
    return Status(kOutOfRange, msg);
  }

  static Status IOError(std::string_view msg) {
    return Status(kIOError, msg);
  }

  bool ok() const {
    return (errcode == kOk);
  }

  bool IsNotFound() const {
    return errcode == kNotFound;
  }

  bool IsWrongType() const {
    return errcode == kWrongType;
  }

  //----------------------------------------------------------------------------
  // Throw FatalException if not ok
  //----------------------------------------------------------------------------
  void assertOk() const {
    if(!ok()) {
      sdb_throw("Failure (" << errcode << "): " << errorMessage);
    }
  }

  int getErrc() const {
    return errcode;
  }

  std::string getMsg() const {
    return errorMessage;
  }

  std::string ToString() const {
    if(ok()) return "OK";
    return errorMessage;
  }

private:
  int errcode;
  std::string errorMessage;
};

}

#endif
