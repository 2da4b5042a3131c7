// ----------------------------------------------------------------------
// File: FileUtils.cc
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
#include "Utils.hh"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <string.h>

namespace slotdb {

std::string pathJoin(std::string_view part1, std::string_view part2) {
  if(part1.empty()) return SSTR("/" << part2);
  if(part2.empty()) return SSTR(part1);
  if(part1[part1.size()-1] == '/') return SSTR(part1 << part2);
  return SSTR(part1 << "/" << part2);
}

bool mkpath(const std::string &path, mode_t mode, std::string &err) {
  std::string withSlash = path;
  if(withSlash.empty() || withSlash.back() != '/') withSlash.push_back('/');

  size_t pos = 0;
  while( (pos = withSlash.find("/", pos+1)) != std::string::npos) {
    std::string chunk = withSlash.substr(0, pos);

    struct stat sb;
    if(stat(chunk.c_str(), &sb) != 0) {
      sdb_info("Creating directory: " << chunk);
      if(mkdir(chunk.c_str(), mode) < 0 && errno != EEXIST) {
        int localerrno = errno;
        err = SSTR("cannot create directory " << chunk << ": " << strerror(localerrno));
        return false;
      }
    }
  }

  return true;
}

bool directoryExists(const std::string &path, std::string &err) {
  struct stat sb;

  if(stat(path.c_str(), &sb) != 0) {
    err = SSTR("Cannot stat " << path);
    return false;
  }

  if(!S_ISDIR(sb.st_mode)) {
    err = SSTR(path << " is not a directory");
    return false;
  }

  return true;
}

bool fileExists(const std::string &path) {
  struct stat sb;
  if(stat(path.c_str(), &sb) != 0) return false;
  return S_ISREG(sb.st_mode);
}

bool readFile(FILE *f, std::string &contents) {
  bool retvalue = true;
  std::ostringstream ss;

  const int BUFFER_SIZE = 1024 * 64;
  char buffer[BUFFER_SIZE];

  while(true) {
    size_t bytesRead = fread(buffer, 1, BUFFER_SIZE, f);

    if(bytesRead > 0) {
      ss.write(buffer, bytesRead);
    }

    // end of file
    if(bytesRead != BUFFER_SIZE) {
      retvalue = feof(f);
      break;
    }
  }

  contents = ss.str();
  return retvalue;
}

bool readFile(const std::string &path, std::string &contents) {
  FILE *in = fopen(path.c_str(), "rb");
  if(!in) {
    return false;
  }

  bool retvalue = readFile(in, contents);
  fclose(in);
  return retvalue;
}

bool readPasswordFile(const std::string &path, std::string &contents) {
  FILE *in = fopen(path.c_str(), "rb");
  if(!in) {
    sdb_warn("Could not open " << path);
    return false;
  }

  struct stat sb;
  if(fstat(fileno(in), &sb) != 0) {
    fclose(in);
    sdb_warn("Could not fstat " << path << " after opening");
    return false;
  }

  if(!areFilePermissionsSecure(sb.st_mode)) {
    sdb_warn("Refusing to read " << path << ", bad file permissions, should be 0400.");
    fclose(in);
    return false;
  }

  bool retvalue = readFile(in, contents);
  fclose(in);

  if(retvalue) {
    // A single line is the common case, drop the trailing newline.
    contents.erase(contents.find_last_not_of(" \t\n\r\f\v") + 1);
  }

  return retvalue;
}

bool areFilePermissionsSecure(mode_t mode) {
  if ((mode & 0077) != 0) {
    // Should disallow access to other users/groups
    return false;
  }

  if ((mode & 0700) != 0400) {
    // Just read access for user
    return false;
  }

  return true;
}

bool writeFileAtomically(const std::string &path, std::string_view contents, std::string &err) {
  std::string tmpPath = SSTR(path << ".tmp");

  int fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd < 0) {
    err = SSTR("Unable to open " << tmpPath << " for writing: " << strerror(errno));
    return false;
  }

  size_t written = 0;
  while(written < contents.size()) {
    ssize_t rc = write(fd, contents.data() + written, contents.size() - written);
    if(rc < 0) {
      if(errno == EINTR) continue;
      err = SSTR("Error while writing to " << tmpPath << ": " << strerror(errno));
      close(fd);
      unlink(tmpPath.c_str());
      return false;
    }

    written += rc;
  }

  if(fsync(fd) != 0) {
    err = SSTR("fsync failed on " << tmpPath << ": " << strerror(errno));
    close(fd);
    unlink(tmpPath.c_str());
    return false;
  }

  close(fd);

  if(rename(tmpPath.c_str(), path.c_str()) != 0) {
    err = SSTR("Could not rename " << tmpPath << " to " << path << ": " << strerror(errno));
    unlink(tmpPath.c_str());
    return false;
  }

  return true;
}

}
