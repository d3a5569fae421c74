// Copyright 2026 Google Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Requires libjson-c and libjson-c-dev
#include <dirent.h>
#include <errno.h>
#include <json.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <syslog.h>
#include <unistd.h>

#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#if defined(__clang__) || __GNUC__ > 4 || \
    (__GNUC__ == 4 &&                     \
     (__GNUC_MINOR__ > 9 || (__GNUC_MINOR__ == 9 && __GNUC_PATCHLEVEL__ > 0)))
#include <regex>
#define Regex std
#else
#include <boost/regex.hpp>
#define Regex boost
#endif

#include "include/compat.h"
#include "include/pamedit_utils.h"

using std::string;

// Regex for validating service names.
static const char kServiceNameRegex[] = "^[a-zA-Z0-9_][a-zA-Z0-9._+-]{0,254}$";

namespace pamedit_utils {

// SysLog wraps syslog operations.
class SysLog {
 private:
  // app is the application name or the application prefix.
  const char *app;

  void Log(int priority, const char *fmt, va_list args);
 public:
  void Error(const char *fmt, va_list args);
  void Warning(const char *fmt, va_list args);
  void Info(const char *fmt, va_list args);

  // Closes the file descriptor being used to write to sys logger.
  void Close();

  // Creates a SysLog instance specifying the ident. Entries look like:
  // <<ident>>[pid]: <<app>>: <<Message>>
  SysLog(const char *ident, const char *app);
};

static SysLog *logger = NULL;

// ----------------- SysLog -------------------------
SysLog::SysLog(const char *ident, const char *app) {
  openlog(ident, LOG_PID|LOG_PERROR, PAMEDIT_SYSLOG_FACILITY);
  this->app = app;
}

void SysLog::Log(int priority, const char *fmt, va_list args) {
  std::stringstream new_fmt;
  new_fmt << this->app << ": " << fmt;
  vsyslog(priority, new_fmt.str().c_str(), args);
}

void SysLog::Error(const char *fmt, va_list args) {
  Log(LOG_ERR, fmt, args);
}

void SysLog::Warning(const char *fmt, va_list args) {
  Log(LOG_WARNING, fmt, args);
}

void SysLog::Info(const char *fmt, va_list args) {
  Log(LOG_INFO, fmt, args);
}

void SysLog::Close() {
  closelog();
}

void SetupSysLog(const char *ident, const char *app) {
  if (ident != NULL && logger == NULL) {
    logger = new SysLog(ident, app);
  }
}

void SysLogErr(const char *fmt, ...) {
  if (logger != NULL) {
    va_list args;
    va_start(args, fmt);
    logger->Error(fmt, args);
    va_end(args);
  }
}

void SysLogWarn(const char *fmt, ...) {
  if (logger != NULL) {
    va_list args;
    va_start(args, fmt);
    logger->Warning(fmt, args);
    va_end(args);
  }
}

void SysLogInfo(const char *fmt, ...) {
  if (logger != NULL) {
    va_list args;
    va_start(args, fmt);
    logger->Info(fmt, args);
    va_end(args);
  }
}

void CloseSysLog() {
  if (logger != NULL) {
    logger->Close();
    delete logger;
    logger = NULL;
  }
}

// ----------------- Files -----------------

const char *FileName(const char *file_path) {
  int res_start = 0;
  for (int i = 0; file_path[i] != '\0'; i++) {
    if (file_path[i] == '/') {
      res_start = i;
    }
  }

  if (res_start > 0) {
    return file_path + res_start + 1;
  }

  return file_path;
}

bool FileExists(const string& path) {
  struct stat buff;
  return !stat(path.c_str(), &buff);
}

bool PathExists(const string& path) {
  struct stat buff;
  return !lstat(path.c_str(), &buff);
}

bool IsDirectory(const string& path) {
  struct stat buff;
  if (stat(path.c_str(), &buff) != 0) {
    return false;
  }
  return S_ISDIR(buff.st_mode);
}

string RealPath(const string& path) {
  char resolved[PATH_MAX];
  if (realpath(path.c_str(), resolved) != NULL) {
    return string(resolved);
  }

  string trimmed = path;
  while (trimmed.length() > 1 && trimmed[trimmed.length() - 1] == '/') {
    trimmed.erase(trimmed.length() - 1);
  }
  return trimmed;
}

bool ReadFile(const string& path, string* content) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  *content = buffer.str();
  return true;
}

bool WriteFile(const string& path, const string& content) {
  std::ofstream out(path.c_str(),
                    std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return false;
  }
  out << content;
  out.close();
  return !out.fail();
}

bool CopyFile(const string& from, const string& to) {
  string content;
  if (!ReadFile(from, &content)) {
    SysLogErr("Failed to read %s: %s", from.c_str(), strerror(errno));
    return false;
  }
  if (!WriteFile(to, content)) {
    SysLogErr("Failed to write %s: %s", to.c_str(), strerror(errno));
    return false;
  }

  struct stat st;
  if (stat(from.c_str(), &st) != 0 || chmod(to.c_str(), st.st_mode & 07777) != 0) {
    SysLogErr("Failed to set permissions on %s: %s", to.c_str(), strerror(errno));
    return false;
  }
  return true;
}

bool CopyFileAttributes(const string& reference, const string& path) {
  struct stat st;
  if (stat(reference.c_str(), &st) != 0) {
    return false;
  }
  if (chmod(path.c_str(), st.st_mode & 07777) != 0) {
    return false;
  }
  if (geteuid() == 0 && chown(path.c_str(), st.st_uid, st.st_gid) != 0) {
    return false;
  }
  return true;
}

bool ListRegularFiles(const string& dir, std::vector<string>* names) {
  DIR *d = opendir(dir.c_str());
  if (d == NULL) {
    return false;
  }

  struct dirent *entry;
  while ((entry = readdir(d)) != NULL) {
    if (entry->d_name[0] == '.') {
      continue;
    }
    string name(entry->d_name);
    struct stat st;
    // d_type is unreliable on some filesystems, so stat every entry.
    if (stat((dir + "/" + name).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      continue;
    }
    names->push_back(name);
  }
  closedir(d);

  std::sort(names->begin(), names->end());
  return true;
}

bool ValidateServiceName(const string& name) {
  Regex::regex r(kServiceNameRegex);
  return Regex::regex_match(name, r);
}

// ----------------- JSON -----------------

string StringsToJson(const std::vector<string>& values) {
  json_object* array = json_object_new_array();
  for (size_t i = 0; i < values.size(); i++) {
    json_object_array_add(array, json_object_new_string(values[i].c_str()));
  }
  string result = json_object_to_json_string_ext(array, JSON_C_TO_STRING_PRETTY);
  json_object_put(array);
  return result;
}

}  // namespace pamedit_utils
