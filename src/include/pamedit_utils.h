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

#ifndef PAMEDIT_UTILS_H_
#define PAMEDIT_UTILS_H_

#include <string>
#include <vector>

using std::string;

namespace pamedit_utils {

// Opens syslog with the given ident. Every message is prefixed with app, and
// also echoed to stderr. Log calls made before SetupSysLog are dropped.
void SetupSysLog(const char *ident, const char *app);

// printf-style loggers at LOG_ERR, LOG_WARNING and LOG_INFO.
void SysLogErr(const char *fmt, ...);
void SysLogWarn(const char *fmt, ...);
void SysLogInfo(const char *fmt, ...);

void CloseSysLog();

// Returns the last path component of file_path.
const char *FileName(const char *file_path);

bool FileExists(const string& path);

// Like FileExists, but a symlink counts even when its target is missing.
bool PathExists(const string& path);

bool IsDirectory(const string& path);

// Returns the canonical absolute path of path, or path itself (with trailing
// slashes removed) if it cannot be resolved.
string RealPath(const string& path);

// Reads the whole file into content.
bool ReadFile(const string& path, string* content);

// Writes content to path, creating or truncating it.
bool WriteFile(const string& path, const string& content);

// Copies the bytes of from into to, giving to the permission bits of from.
bool CopyFile(const string& from, const string& to);

// Gives path the mode and owner recorded for reference. Ownership changes are
// best effort since only root may chown.
bool CopyFileAttributes(const string& reference, const string& path);

// Fills names with the regular, non-hidden files of dir, sorted by name.
bool ListRegularFiles(const string& dir, std::vector<string>* names);

// Service names are plain file names: no slashes, no leading dot.
bool ValidateServiceName(const string& name);

// Renders a list of strings as a pretty-printed JSON array.
string StringsToJson(const std::vector<string>& values);

}  // namespace pamedit_utils

#endif  // PAMEDIT_UTILS_H_
