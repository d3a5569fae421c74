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

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <cstring>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "include/compat.h"
#include "include/pamedit_rules.h"
#include "include/pamedit_service.h"
#include "include/pamedit_utils.h"

using std::string;
using std::vector;

using pamedit_rules::ConfigLine;
using pamedit_rules::ParseRuleType;
using pamedit_rules::ParseServiceText;
using pamedit_rules::Rule;
using pamedit_rules::RulesOf;
using pamedit_rules::RulesToJson;
using pamedit_rules::SerializeLines;
using pamedit_rules::SerializeRule;
using pamedit_rules::SplitArgs;
using pamedit_rules::ValidateControl;
using pamedit_rules::ValidateModule;

using pamedit_utils::CopyFile;
using pamedit_utils::CopyFileAttributes;
using pamedit_utils::FileExists;
using pamedit_utils::IsDirectory;
using pamedit_utils::ListRegularFiles;
using pamedit_utils::PathExists;
using pamedit_utils::ReadFile;
using pamedit_utils::RealPath;
using pamedit_utils::StringsToJson;
using pamedit_utils::SysLogErr;
using pamedit_utils::SysLogInfo;
using pamedit_utils::ValidateServiceName;
using pamedit_utils::WriteFile;

namespace pamedit_service {

static const struct {
  Action action;
  const char *name;
} kActions[] = {
  {kList, "list"},
  {kShow, "show"},
  {kAdd, "add"},
  {kRemove, "remove"},
  {kBackup, "backup"},
  {kRestore, "restore"},
};

const char *StatusName(EditStatus status) {
  switch (status) {
    case kOk:
      return "ok";
    case kIoError:
      return "I/O error";
    case kInvalidArgument:
      return "invalid argument";
    case kPermissionDenied:
      return "permission denied";
    case kNotFound:
      return "not found";
    case kNoMatch:
      return "no match";
  }
  return "unknown";
}

int ExitCodeFor(EditStatus status) {
  switch (status) {
    case kOk:
      return 0;
    case kIoError:
      return 1;
    case kInvalidArgument:
      return 2;
    case kPermissionDenied:
      return 3;
    case kNotFound:
      return 4;
    case kNoMatch:
      return 5;
  }
  return 1;
}

bool ParseAction(const string& name, Action* action) {
  for (size_t i = 0; i < sizeof(kActions) / sizeof(kActions[0]); i++) {
    if (name == kActions[i].name) {
      *action = kActions[i].action;
      return true;
    }
  }
  return false;
}

bool IsMutating(Action action) {
  return action == kAdd || action == kRemove || action == kRestore;
}

static bool HasSuffix(const string& value, const string& suffix) {
  return value.length() >= suffix.length() &&
         value.compare(value.length() - suffix.length(), suffix.length(),
                       suffix) == 0;
}

static string TrimSlashes(const string& path) {
  string trimmed = path;
  while (trimmed.length() > 1 && trimmed[trimmed.length() - 1] == '/') {
    trimmed.erase(trimmed.length() - 1);
  }
  return trimmed;
}

// ----------------- Directory resolution -----------------

DirOptions::DirOptions()
    : is_root(false),
      system_dir(PAMEDIT_SYSTEM_DIR),
      sandbox_dir(PAMEDIT_SANDBOX_DIR) {}

EditStatus ResolveConfigDir(const DirOptions& opts, bool mutating,
                            string* dir) {
  string selected;
  if (!opts.override_dir.empty()) {
    selected = opts.override_dir;
  } else if (opts.is_root) {
    selected = opts.system_dir;
  } else {
    selected = opts.sandbox_dir;
  }
  selected = TrimSlashes(selected);

  if (mutating && !opts.is_root &&
      RealPath(selected) == RealPath(opts.system_dir)) {
    SysLogErr("Modifying %s requires root privileges.", selected.c_str());
    return kPermissionDenied;
  }

  *dir = selected;
  return kOk;
}

// ----------------- Service files -----------------

vector<Rule> ServiceFile::Rules() const {
  return RulesOf(lines);
}

EditStatus LoadServiceFile(const string& dir, const string& name,
                           ServiceFile* service) {
  if (!ValidateServiceName(name)) {
    SysLogErr("Invalid service name \"%s\".", name.c_str());
    return kInvalidArgument;
  }

  string path = dir + "/" + name;
  if (!FileExists(path)) {
    SysLogErr("Service %s not found in %s.", name.c_str(), dir.c_str());
    return kNotFound;
  }
  if (IsDirectory(path)) {
    SysLogErr("%s is a directory, not a service file.", path.c_str());
    return kInvalidArgument;
  }

  string text;
  if (!ReadFile(path, &text)) {
    SysLogErr("Failed to read %s: %s", path.c_str(), strerror(errno));
    return kIoError;
  }

  service->name = name;
  service->path = path;
  service->lines = ParseServiceText(text, path, NULL);
  return kOk;
}

static bool IsBackupOrTemp(const string& name) {
  return HasSuffix(name, PAMEDIT_FILE_BACKUP_SUFFIX) ||
         HasSuffix(name, PAMEDIT_TMP_SUFFIX);
}

EditStatus ListServices(const string& dir, vector<string>* services) {
  if (!IsDirectory(dir)) {
    SysLogErr("Directory %s not found.", dir.c_str());
    return kNotFound;
  }

  vector<string> names;
  if (!ListRegularFiles(dir, &names)) {
    SysLogErr("Failed to read directory %s: %s", dir.c_str(), strerror(errno));
    return kIoError;
  }
  for (size_t i = 0; i < names.size(); i++) {
    if (!IsBackupOrTemp(names[i])) {
      services->push_back(names[i]);
    }
  }
  return kOk;
}

// ----------------- Backup and write -----------------

string BackupPathFor(const string& path) {
  char stamp[32];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

  string base = path + "." + stamp;
  string candidate = base + PAMEDIT_FILE_BACKUP_SUFFIX;
  for (int i = 1; PathExists(candidate); i++) {
    std::stringstream numbered;
    numbered << base << "." << i << PAMEDIT_FILE_BACKUP_SUFFIX;
    candidate = numbered.str();
  }
  return candidate;
}

// A symlinked service is edited through its link: the new content replaces
// the file the link points at and the link itself stays.
static string ResolveLink(const string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode)) {
    return RealPath(path);
  }
  return path;
}

EditStatus BackupAndWrite(const string& path, const string& content,
                          string* backup_path) {
  string target = ResolveLink(path);
  string backup = BackupPathFor(path);
  if (!CopyFile(path, backup)) {
    SysLogErr("Failed to back up %s to %s, not modifying it.", path.c_str(),
              backup.c_str());
    unlink(backup.c_str());
    return kIoError;
  }

  string tmp_path = target + PAMEDIT_TMP_SUFFIX;
  if (!WriteFile(tmp_path, content)) {
    SysLogErr("Failed to write %s: %s", tmp_path.c_str(), strerror(errno));
    unlink(tmp_path.c_str());
    return kIoError;
  }
  if (!CopyFileAttributes(target, tmp_path)) {
    SysLogErr("Failed to copy owner and permissions of %s to %s: %s",
              target.c_str(), tmp_path.c_str(), strerror(errno));
    unlink(tmp_path.c_str());
    return kIoError;
  }
  if (rename(tmp_path.c_str(), target.c_str()) != 0) {
    SysLogErr("Error moving %s to %s: %s", tmp_path.c_str(), target.c_str(),
              strerror(errno));
    unlink(tmp_path.c_str());
    return kIoError;
  }

  SysLogInfo("Updated %s, previous content saved in %s.", target.c_str(),
             backup.c_str());
  if (backup_path != NULL) {
    *backup_path = backup;
  }
  return kOk;
}

// ----------------- Edits -----------------

// Rules and @include directives make up the stack; comments above them stay
// on top when a rule is inserted at the start.
static bool IsStackLine(const ConfigLine& line) {
  if (line.is_rule) {
    return true;
  }
  size_t first = line.text.find_first_not_of(" \t");
  return first != string::npos && line.text[first] == '@';
}

EditStatus AddRule(const string& dir, const string& name, const Rule& rule,
                   Position position, string* backup_path) {
  ServiceFile service;
  EditStatus status = LoadServiceFile(dir, name, &service);
  if (status != kOk) {
    return status;
  }

  ConfigLine line;
  line.is_rule = true;
  line.rule = rule;

  vector<ConfigLine>::iterator where = service.lines.end();
  if (position == kStart) {
    for (where = service.lines.begin(); where != service.lines.end(); ++where) {
      if (IsStackLine(*where)) {
        break;
      }
    }
  }
  service.lines.insert(where, line);

  return BackupAndWrite(service.path, SerializeLines(service.lines),
                        backup_path);
}

EditStatus RemoveRules(const string& dir, const string& name,
                       const string& module, int* removed,
                       string* backup_path) {
  ServiceFile service;
  EditStatus status = LoadServiceFile(dir, name, &service);
  if (status != kOk) {
    return status;
  }

  vector<ConfigLine> kept;
  int count = 0;
  for (size_t i = 0; i < service.lines.size(); i++) {
    const ConfigLine& line = service.lines[i];
    if (line.is_rule && line.rule.module == module) {
      count++;
      continue;
    }
    kept.push_back(line);
  }

  if (removed != NULL) {
    *removed = count;
  }
  if (count == 0) {
    SysLogErr("No rules found with module %s in %s.", module.c_str(),
              name.c_str());
    return kNoMatch;
  }

  return BackupAndWrite(service.path, SerializeLines(kept), backup_path);
}

// ----------------- Whole directory backup -----------------

static bool RemoveStagingDirectory(const string& staging) {
  vector<string> names;
  if (ListRegularFiles(staging, &names)) {
    for (size_t i = 0; i < names.size(); i++) {
      unlink((staging + "/" + names[i]).c_str());
    }
  }
  if (rmdir(staging.c_str()) != 0) {
    SysLogErr("Failed to remove %s: %s", staging.c_str(), strerror(errno));
    return false;
  }
  return true;
}

EditStatus BackupDirectory(const string& dir, const string& backup_dir) {
  if (!IsDirectory(dir)) {
    SysLogErr("Directory %s not found.", dir.c_str());
    return kNotFound;
  }
  if (PathExists(backup_dir)) {
    SysLogInfo("Backup already exists at %s, leaving it alone.",
               backup_dir.c_str());
    return kOk;
  }

  vector<string> names;
  if (!ListRegularFiles(dir, &names)) {
    SysLogErr("Failed to read directory %s: %s", dir.c_str(), strerror(errno));
    return kIoError;
  }

  // The copy is assembled beside the backup and renamed into place when
  // complete, so an existing backup is never a partial one.
  string staging = backup_dir + PAMEDIT_TMP_SUFFIX;
  if (PathExists(staging) && !RemoveStagingDirectory(staging)) {
    return kIoError;
  }
  struct stat st;
  if (stat(dir.c_str(), &st) != 0 ||
      mkdir(staging.c_str(), st.st_mode & 07777) != 0) {
    SysLogErr("Failed to create %s: %s", staging.c_str(), strerror(errno));
    return kIoError;
  }
  for (size_t i = 0; i < names.size(); i++) {
    if (!CopyFile(dir + "/" + names[i], staging + "/" + names[i])) {
      RemoveStagingDirectory(staging);
      return kIoError;
    }
  }
  if (rename(staging.c_str(), backup_dir.c_str()) != 0) {
    SysLogErr("Error moving %s to %s: %s", staging.c_str(), backup_dir.c_str(),
              strerror(errno));
    RemoveStagingDirectory(staging);
    return kIoError;
  }

  SysLogInfo("Backup of %s created at %s.", dir.c_str(), backup_dir.c_str());
  return kOk;
}

EditStatus RestoreDirectory(const string& dir, const string& backup_dir) {
  if (!IsDirectory(backup_dir)) {
    SysLogErr("No backup found at %s.", backup_dir.c_str());
    return kNotFound;
  }
  if (!IsDirectory(dir)) {
    struct stat st;
    if (stat(backup_dir.c_str(), &st) != 0 ||
        mkdir(dir.c_str(), st.st_mode & 07777) != 0) {
      SysLogErr("Failed to create %s: %s", dir.c_str(), strerror(errno));
      return kIoError;
    }
  }

  vector<string> saved;
  if (!ListRegularFiles(backup_dir, &saved)) {
    SysLogErr("Failed to read directory %s: %s", backup_dir.c_str(),
              strerror(errno));
    return kIoError;
  }
  for (size_t i = 0; i < saved.size(); i++) {
    string target = ResolveLink(dir + "/" + saved[i]);
    string tmp_path = target + PAMEDIT_TMP_SUFFIX;
    if (!CopyFile(backup_dir + "/" + saved[i], tmp_path)) {
      unlink(tmp_path.c_str());
      return kIoError;
    }
    if (rename(tmp_path.c_str(), target.c_str()) != 0) {
      SysLogErr("Error moving %s to %s: %s", tmp_path.c_str(), target.c_str(),
                strerror(errno));
      unlink(tmp_path.c_str());
      return kIoError;
    }
  }

  // Service files added since the backup go away. Per-file backups stay.
  std::set<string> keep(saved.begin(), saved.end());
  vector<string> current;
  if (!ListRegularFiles(dir, &current)) {
    SysLogErr("Failed to read directory %s: %s", dir.c_str(), strerror(errno));
    return kIoError;
  }
  for (size_t i = 0; i < current.size(); i++) {
    if (keep.count(current[i]) || IsBackupOrTemp(current[i])) {
      continue;
    }
    string extra = dir + "/" + current[i];
    if (unlink(extra.c_str()) != 0) {
      SysLogErr("Failed to remove %s: %s", extra.c_str(), strerror(errno));
      return kIoError;
    }
  }

  SysLogInfo("Restored %s from %s.", dir.c_str(), backup_dir.c_str());
  return kOk;
}

// ----------------- Requests -----------------

Request::Request() : action(kList), position(kEnd), json(false) {}

// Checks the fields each action needs and builds the rule for add.
static EditStatus ValidateRequest(const Request& request, Rule* rule) {
  switch (request.action) {
    case kShow:
      if (request.service.empty()) {
        SysLogErr("--service is required for show action");
        return kInvalidArgument;
      }
      break;
    case kAdd:
      if (request.service.empty() || request.type.empty() ||
          request.control.empty() || request.module.empty()) {
        SysLogErr("--service, --type, --control, and --module are required "
                  "for add action");
        return kInvalidArgument;
      }
      break;
    case kRemove:
      if (request.service.empty() || request.module.empty()) {
        SysLogErr("--service and --module are required for remove action");
        return kInvalidArgument;
      }
      break;
    case kList:
    case kBackup:
    case kRestore:
      return kOk;
  }

  if (!ValidateServiceName(request.service)) {
    SysLogErr("Invalid service name \"%s\".", request.service.c_str());
    return kInvalidArgument;
  }
  if (request.action == kShow) {
    return kOk;
  }
  if (!ValidateModule(request.module)) {
    SysLogErr("Invalid module \"%s\".", request.module.c_str());
    return kInvalidArgument;
  }
  if (request.action == kRemove) {
    return kOk;
  }

  string type_name = request.type;
  rule->silent = false;
  if (type_name[0] == '-') {
    rule->silent = true;
    type_name.erase(0, 1);
  }
  if (!ParseRuleType(type_name, &rule->type)) {
    SysLogErr("Unknown rule type \"%s\", expected auth, account, password or "
              "session.", request.type.c_str());
    return kInvalidArgument;
  }
  if (!ValidateControl(request.control)) {
    SysLogErr("Unknown control flag \"%s\".", request.control.c_str());
    return kInvalidArgument;
  }
  if (!SplitArgs(request.args, &rule->args)) {
    SysLogErr("Invalid module arguments \"%s\".", request.args.c_str());
    return kInvalidArgument;
  }
  rule->control = request.control;
  rule->module = request.module;
  return kOk;
}

EditStatus Execute(const Request& request, std::ostream& out) {
  Rule rule;
  EditStatus status = ValidateRequest(request, &rule);
  if (status != kOk) {
    return status;
  }

  string dir;
  status = ResolveConfigDir(request.dir_options, IsMutating(request.action),
                            &dir);
  if (status != kOk) {
    return status;
  }

  string backup_dir = request.backup_dir.empty()
                          ? dir + PAMEDIT_DIR_BACKUP_SUFFIX
                          : TrimSlashes(request.backup_dir);
  string backup_path;

  switch (request.action) {
    case kList: {
      vector<string> services;
      status = ListServices(dir, &services);
      if (status != kOk) {
        return status;
      }
      if (request.json) {
        out << StringsToJson(services) << "\n";
        break;
      }
      out << "Available PAM services:\n";
      for (size_t i = 0; i < services.size(); i++) {
        out << "  - " << services[i] << "\n";
      }
      break;
    }
    case kShow: {
      ServiceFile service;
      status = LoadServiceFile(dir, request.service, &service);
      if (status != kOk) {
        return status;
      }
      vector<Rule> rules = service.Rules();
      if (request.json) {
        out << RulesToJson(service.name, rules) << "\n";
        break;
      }
      out << "Rules for " << service.name << ":\n";
      for (size_t i = 0; i < rules.size(); i++) {
        out << "  " << SerializeRule(rules[i]) << "\n";
      }
      break;
    }
    case kAdd:
      status = AddRule(dir, request.service, rule, request.position,
                       &backup_path);
      if (status != kOk) {
        return status;
      }
      out << "Rule added to " << request.service << " (backup: "
          << backup_path << ")\n";
      break;
    case kRemove: {
      int removed = 0;
      status = RemoveRules(dir, request.service, request.module, &removed,
                           &backup_path);
      if (status != kOk) {
        return status;
      }
      out << "Removed " << removed << " rule(s) containing module "
          << request.module << " from " << request.service << " (backup: "
          << backup_path << ")\n";
      break;
    }
    case kBackup:
      status = BackupDirectory(dir, backup_dir);
      if (status != kOk) {
        return status;
      }
      out << "Backup of " << dir << " is at " << backup_dir << "\n";
      break;
    case kRestore:
      status = RestoreDirectory(dir, backup_dir);
      if (status != kOk) {
        return status;
      }
      out << "Configuration restored from " << backup_dir << "\n";
      break;
  }
  return kOk;
}

}  // namespace pamedit_service
