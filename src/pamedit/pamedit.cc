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

#include <getopt.h>
#include <stdlib.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <string>

#include "include/compat.h"
#include "include/pamedit_service.h"
#include "include/pamedit_utils.h"

using std::cout;
using std::string;

using pamedit_service::EditStatus;
using pamedit_service::Execute;
using pamedit_service::ExitCodeFor;
using pamedit_service::ParseAction;
using pamedit_service::Request;
using pamedit_service::StatusName;
using pamedit_service::kEnd;
using pamedit_service::kInvalidArgument;
using pamedit_service::kOk;
using pamedit_service::kStart;

using pamedit_utils::CloseSysLog;
using pamedit_utils::FileName;
using pamedit_utils::SetupSysLog;
using pamedit_utils::SysLogErr;

#define SYSLOG_IDENT "pamedit"

static void Usage(const char *progname) {
  cout << "Usage: " << progname << " --action ACTION [options]\n\n"
       << "Actions:\n"
       << "  list                 list the service files\n"
       << "  show                 print the rule stack of --service\n"
       << "  add                  add a rule to --service\n"
       << "  remove               remove the rules of --service using --module\n"
       << "  backup               copy the whole directory to the backup directory\n"
       << "  restore              restore the whole directory from the backup directory\n\n"
       << "Options:\n"
       << "  --service NAME       PAM service name\n"
       << "  --type TYPE          auth, account, password or session (prefix with - for silent)\n"
       << "  --control FLAG       required, requisite, sufficient, optional, include,\n"
       << "                       substack or [value=action ...]\n"
       << "  --module PATH        PAM module name or path\n"
       << "  --args ARGS          module arguments\n"
       << "  --position POS       start or end (default end), where add puts the rule\n"
       << "  --dir DIR            directory to edit\n"
       << "  --backup-dir DIR     directory used by backup and restore\n"
       << "  --json               print list and show results as JSON\n"
       << "  -h, --help           show this help\n\n"
       << "Environment:\n"
       << " - " PAMEDIT_DIR_ENV "=\"/path/to/pam.d\"\n"
       << " - " PAMEDIT_BACKUP_DIR_ENV "=\"/path/to/pam.d.backup\"\n"
       << "Default values:\n"
       << " - Directory: " PAMEDIT_SYSTEM_DIR " as root, " PAMEDIT_SANDBOX_DIR " otherwise\n"
       << " - Backup directory: the directory name followed by " PAMEDIT_DIR_BACKUP_SUFFIX "\n\n"
       << "Exit status: 0 success, 1 I/O error, 2 invalid arguments, 3 permission\n"
       << "denied, 4 not found, 5 nothing to remove.\n";
}

enum {
  OPT_ACTION = 256,
  OPT_SERVICE,
  OPT_TYPE,
  OPT_CONTROL,
  OPT_MODULE,
  OPT_ARGS,
  OPT_POSITION,
  OPT_DIR,
  OPT_BACKUP_DIR,
  OPT_JSON,
};

static const struct option kLongOptions[] = {
  {"action", required_argument, NULL, OPT_ACTION},
  {"service", required_argument, NULL, OPT_SERVICE},
  {"type", required_argument, NULL, OPT_TYPE},
  {"control", required_argument, NULL, OPT_CONTROL},
  {"module", required_argument, NULL, OPT_MODULE},
  {"args", required_argument, NULL, OPT_ARGS},
  {"position", required_argument, NULL, OPT_POSITION},
  {"dir", required_argument, NULL, OPT_DIR},
  {"backup-dir", required_argument, NULL, OPT_BACKUP_DIR},
  {"json", no_argument, NULL, OPT_JSON},
  {"help", no_argument, NULL, 'h'},
  {NULL, 0, NULL, 0},
};

// Fills request from the command line. Returns false after logging the
// problem when the arguments are unusable.
static bool ParseArgs(int argc, char* argv[], Request* request,
                      bool* show_help) {
  bool have_action = false;
  int opt;

  while ((opt = getopt_long(argc, argv, "h", kLongOptions, NULL)) != -1) {
    switch (opt) {
      case OPT_ACTION:
        if (!ParseAction(optarg, &request->action)) {
          SysLogErr("Unknown action \"%s\".", optarg);
          return false;
        }
        have_action = true;
        break;
      case OPT_SERVICE:
        request->service = optarg;
        break;
      case OPT_TYPE:
        request->type = optarg;
        break;
      case OPT_CONTROL:
        request->control = optarg;
        break;
      case OPT_MODULE:
        request->module = optarg;
        break;
      case OPT_ARGS:
        request->args = optarg;
        break;
      case OPT_POSITION:
        if (strcmp(optarg, "start") == 0) {
          request->position = kStart;
        } else if (strcmp(optarg, "end") == 0) {
          request->position = kEnd;
        } else {
          SysLogErr("--position must be start or end, got \"%s\".", optarg);
          return false;
        }
        break;
      case OPT_DIR:
        request->dir_options.override_dir = optarg;
        break;
      case OPT_BACKUP_DIR:
        request->backup_dir = optarg;
        break;
      case OPT_JSON:
        request->json = true;
        break;
      case 'h':
        *show_help = true;
        return true;
      default:
        return false;
    }
  }

  if (optind < argc) {
    SysLogErr("Unexpected argument \"%s\".", argv[optind]);
    return false;
  }
  if (!have_action) {
    SysLogErr("--action is required.");
    return false;
  }
  return true;
}

int main(int argc, char* argv[]) {
  const char *progname = FileName(argv[0]);
  const char *env = NULL;
  Request request;
  bool show_help = false;

  SetupSysLog(SYSLOG_IDENT, progname);

  request.dir_options.is_root = (geteuid() == 0);
  if ((env = getenv(PAMEDIT_DIR_ENV)) != NULL) {
    request.dir_options.override_dir = env;
  }
  if ((env = getenv(PAMEDIT_BACKUP_DIR_ENV)) != NULL) {
    request.backup_dir = env;
  }

  if (!ParseArgs(argc, argv, &request, &show_help)) {
    Usage(progname);
    CloseSysLog();
    return ExitCodeFor(kInvalidArgument);
  }
  if (show_help) {
    Usage(progname);
    CloseSysLog();
    return EXIT_SUCCESS;
  }

  EditStatus status = Execute(request, cout);
  if (status != kOk) {
    SysLogErr("Failed: %s.", StatusName(status));
  }

  CloseSysLog();
  return ExitCodeFor(status);
}
