// ----------------------------------------------------------------------
// File: auth.cc
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

#include "utils/FileUtils.hh"
#include "utils/Macros.hh"
#include "auth/AuthenticationDispatcher.hh"
#include "redis/Authenticator.hh"
#include "Formatter.hh"
#include "test-utils.hh"
#include <gtest/gtest.h>

using namespace slotdb;

TEST(FilePermissionChecking, BasicSanity) {
  ASSERT_FALSE(areFilePermissionsSecure(0700));
  ASSERT_FALSE(areFilePermissionsSecure(0777));
  ASSERT_FALSE(areFilePermissionsSecure(0477));
  ASSERT_FALSE(areFilePermissionsSecure(0401));
  ASSERT_FALSE(areFilePermissionsSecure(0444));
  ASSERT_FALSE(areFilePermissionsSecure(0440));
  ASSERT_FALSE(areFilePermissionsSecure(0500));

  ASSERT_TRUE(areFilePermissionsSecure(0400));
}

TEST(ReadPasswordFile, BasicSanity) {
  std::string path = SSTR(commonState.testdir << "/auth-f1");
  ASSERT_EQ(system(SSTR("rm -f " << path).c_str()), 0);

  std::string contents;
  ASSERT_FALSE(readPasswordFile(path, contents));
  ASSERT_FALSE(readFile(path, contents));

  ASSERT_EQ(system(SSTR("printf 'pickles\\n\\n   ' > " << path).c_str()), 0);
  ASSERT_EQ(system(SSTR("chmod 777 " << path).c_str()), 0);
  ASSERT_FALSE(readPasswordFile(path, contents));
  ASSERT_EQ(system(SSTR("chmod 744 " << path).c_str()), 0);
  ASSERT_FALSE(readPasswordFile(path, contents));
  ASSERT_EQ(system(SSTR("chmod 400 " << path).c_str()), 0);
  ASSERT_TRUE(readPasswordFile(path, contents));
  ASSERT_EQ(contents, "pickles");

  ASSERT_EQ(system(SSTR("rm -f " << path).c_str()), 0);
}

TEST(Authenticator, Validate) {
  Authenticator disabled("");
  ASSERT_FALSE(disabled.isEnabled());
  ASSERT_EQ(disabled.validate("anything"), Authenticator::ValidationStatus::kNoPasswordSet);

  Authenticator authenticator("hunter2");
  ASSERT_TRUE(authenticator.isEnabled());
  ASSERT_EQ(authenticator.validate("hunter2"), Authenticator::ValidationStatus::kOk);
  ASSERT_EQ(authenticator.validate("hunter3"), Authenticator::ValidationStatus::kInvalidPassword);
  ASSERT_EQ(authenticator.validate(""), Authenticator::ValidationStatus::kInvalidPassword);
  ASSERT_EQ(authenticator.validate("hunter2 "), Authenticator::ValidationStatus::kInvalidPassword);
}

TEST(Authenticator, Sha256) {
  ASSERT_EQ(Authenticator::sha256("").size(), 32u);
  ASSERT_EQ(Authenticator::sha256("abc"), Authenticator::sha256("abc"));
  ASSERT_NE(Authenticator::sha256("abc"), Authenticator::sha256("abd"));
}

TEST(AuthenticationDispatcher, NoPassword) {
  AuthenticationDispatcher dispatcher("");
  ASSERT_FALSE(dispatcher.isEnabled());
  ASSERT_TRUE(dispatcher.validate("whatever"));

  bool authorized = false;
  ASSERT_EQ(Formatter::errArgs("AUTH").val, dispatcher.dispatch(make_req("AUTH"), authorized).val);
  ASSERT_FALSE(authorized);

  ASSERT_EQ(Formatter::err("Client sent AUTH, but no password is set").val, dispatcher.dispatch(make_req("AUTH", "test"), authorized).val);
  ASSERT_FALSE(authorized);
}

TEST(AuthenticationDispatcher, AuthBasicSanity) {
  AuthenticationDispatcher dispatcher("hunter2");
  ASSERT_TRUE(dispatcher.isEnabled());

  bool authorized = false;
  ASSERT_EQ(Formatter::errArgs("AUTH").val, dispatcher.dispatch(make_req("AUTH"), authorized).val);
  ASSERT_FALSE(authorized);

  ASSERT_EQ(Formatter::errArgs("AUTH").val, dispatcher.dispatch(make_req("AUTH", "a", "b", "c"), authorized).val);
  ASSERT_FALSE(authorized);

  ASSERT_EQ("-WRONGPASS invalid username-password pair\r\n", dispatcher.dispatch(make_req("AUTH", "hunter3"), authorized).val);
  ASSERT_FALSE(authorized);

  ASSERT_EQ(Formatter::ok().val, dispatcher.dispatch(make_req("AUTH", "hunter2"), authorized).val);
  ASSERT_TRUE(authorized);

  ASSERT_TRUE(dispatcher.validate("hunter2"));
  ASSERT_FALSE(dispatcher.validate("hunter22"));
}

TEST(AuthenticationDispatcher, UsernameIsIgnored) {
  AuthenticationDispatcher dispatcher("hunter2");

  bool authorized = false;
  ASSERT_EQ(Formatter::ok().val, dispatcher.dispatch(make_req("AUTH", "default", "hunter2"), authorized).val);
  ASSERT_TRUE(authorized);
}
