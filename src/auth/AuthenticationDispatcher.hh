// ----------------------------------------------------------------------
// File: AuthenticationDispatcher.hh
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

#ifndef SLOTDB_AUTHENTICATION_DISPATCHER_HH
#define SLOTDB_AUTHENTICATION_DISPATCHER_HH

#include "Dispatcher.hh"
#include "redis/Authenticator.hh"

namespace slotdb {

class AuthenticationDispatcher {
public:
  AuthenticationDispatcher(std::string_view secret);
  LinkStatus dispatch(Connection *conn, RedisRequest &req);
  RedisEncodedResponse dispatch(const RedisRequest &req, bool &authorized);

  //----------------------------------------------------------------------------
  // Check a password out of band, ie as part of the replication handshake.
  //----------------------------------------------------------------------------
  bool validate(std::string_view password) const;

  bool isEnabled() const {
    return authenticator.isEnabled();
  }

private:
  Authenticator authenticator;
};

}

#endif
