// ----------------------------------------------------------------------
// File: AuthenticationDispatcher.cc
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
#include "auth/AuthenticationDispatcher.hh"
#include "Formatter.hh"
using namespace slotdb;

AuthenticationDispatcher::AuthenticationDispatcher(std::string_view secret)
: authenticator(secret) {
}

bool AuthenticationDispatcher::validate(std::string_view password) const {
  if(!authenticator.isEnabled()) return true;
  return authenticator.validate(password) == Authenticator::ValidationStatus::kOk;
}

RedisEncodedResponse AuthenticationDispatcher::dispatch(const RedisRequest &req, bool &authorized) {
  switch(req.getCommand()) {
    case RedisCommand::AUTH: {
      // AUTH <password>, or AUTH <username> <password> - the username is
      // accepted for client compatibility, but not checked.
      if(req.size() != 2u && req.size() != 3u) return Formatter::errArgs(req[0]);

      Authenticator::ValidationStatus status = authenticator.validate(req[req.size()-1]);

      if(status == Authenticator::ValidationStatus::kNoPasswordSet) {
        return Formatter::err("Client sent AUTH, but no password is set");
      }

      if(status == Authenticator::ValidationStatus::kInvalidPassword) {
        sdb_warn("A password attempt was made with an invalid password");
        return Formatter::rawError("WRONGPASS invalid username-password pair");
      }

      sdb_assert(status == Authenticator::ValidationStatus::kOk);
      authorized = true;
      return Formatter::ok();
    }
    default: {
      sdb_throw("internal dispatching error for command " << req.toPrintableString());
    }
  }
}

LinkStatus AuthenticationDispatcher::dispatch(Connection *conn, RedisRequest &req) {
  return conn->raw(dispatch(req, conn->authorized));
}
