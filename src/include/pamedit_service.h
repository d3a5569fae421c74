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

#ifndef PAMEDIT_SERVICE_H_
#define PAMEDIT_SERVICE_H_

#include <ostream>
#include <string>
#include <vector>

#include "pamedit_rules.h"

using std::string;

namespace pamedit_service {

enum EditStatus {
  kOk = 0,
  kIoError,
  kInvalidArgument,
  kPermissionDenied,
  kNotFound,
  kNoMatch,
};

const char *StatusName(EditStatus status);

// Process exit code for a status: 0 on success, non-zero otherwise.
int ExitCodeFor(EditStatus status);

enum Action {
  kList,
  kShow,
  kAdd,
  kRemove,
  kBackup,
  kRestore,
};

bool ParseAction(const string& name, Action* action);

// add, remove and restore write to the directory.
bool IsMutating(Action action);

enum Position {
  kEnd,
  kStart,
};

// Inputs of directory resolution. override_dir comes from --dir or the
// environment and is empty when neither is set.
struct DirOptions {
  bool is_root;
  string override_dir;
  string system_dir;
  string sandbox_dir;

  DirOptions();
};

// Picks the directory to operate on: override_dir if set, else system_dir for
// root and sandbox_dir for everybody else. Mutating actions against
// system_dir without root are refused with kPermissionDenied.
EditStatus ResolveConfigDir(const DirOptions& opts, bool mutating, string* dir);

// A loaded service file.
struct ServiceFile {
  string name;
  string path;
  std::vector<pamedit_rules::ConfigLine> lines;

  std::vector<pamedit_rules::Rule> Rules() const;
};

EditStatus LoadServiceFile(const string& dir, const string& name,
                           ServiceFile* service);

// Names of the service files of dir, backups excluded.
EditStatus ListServices(const string& dir, std::vector<string>* services);

// Picks an unused backup name for path: <path>.<YYYYMMDD-HHMMSS>.bak, with a
// numeric suffix if that already exists.
string BackupPathFor(const string& path);

// Copies the current file to a backup, then replaces it with content through a
// temporary file. The original is never touched when any step fails. When
// path is a symlink the file it points at is replaced and the link stays.
EditStatus BackupAndWrite(const string& path, const string& content,
                          string* backup_path);

// Inserts rule into the service, at the end or at the top of the stack.
EditStatus AddRule(const string& dir, const string& name,
                   const pamedit_rules::Rule& rule, Position position,
                   string* backup_path);

// Drops every rule whose module equals module. removed receives the count.
EditStatus RemoveRules(const string& dir, const string& name,
                       const string& module, int* removed,
                       string* backup_path);

// Copies the regular files of dir into backup_dir. An existing backup_dir is
// left alone. The copy is built in <backup_dir>.temp and only renamed to
// backup_dir once every file is copied.
EditStatus BackupDirectory(const string& dir, const string& backup_dir);

// Makes dir mirror backup_dir.
EditStatus RestoreDirectory(const string& dir, const string& backup_dir);

// One command line invocation.
struct Request {
  Action action;
  string service;
  string type;
  string control;
  string module;
  string args;
  Position position;
  string backup_dir;
  bool json;
  DirOptions dir_options;

  Request();
};

// Validates the request, resolves the directory and runs the action. Results
// are printed to out, errors are logged.
EditStatus Execute(const Request& request, std::ostream& out);

}  // namespace pamedit_service

#endif  // PAMEDIT_SERVICE_H_
