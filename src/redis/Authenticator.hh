// ----------------------------------------------------------------------
// File: Authenticator.hh
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

#ifndef SLOTDB_AUTHENTICATOR_HH
#define SLOTDB_AUTHENTICATOR_HH

#include <string>
#include <string_view>

namespace slotdb {

//------------------------------------------------------------------------------
// Shared-password authentication. Only the digest of the secret is kept
// around, and candidates are compared in constant time.
//------------------------------------------------------------------------------
class Authenticator {
public:
  enum class ValidationStatus {
    kOk,
    kNoPasswordSet,
    kInvalidPassword
  };

  Authenticator(std::string_view secret);
  ~Authenticator() {}

  bool isEnabled() const {
    return enabled;
  }

  ValidationStatus validate(std::string_view candidate) const;

  static std::string sha256(std::string_view data);

private:
  bool enabled;
  std::string secretDigest;
};

}

#endif
