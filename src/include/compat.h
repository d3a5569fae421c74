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

#ifndef PAMEDIT_COMPAT_H_
#define PAMEDIT_COMPAT_H_ 1

// Build-time defaults. Packagers may override them with -D.

#ifndef PAMEDIT_SYSTEM_DIR
#define PAMEDIT_SYSTEM_DIR "/etc/pam.d"
#endif

// Used instead of the system directory when not running as root.
#ifndef PAMEDIT_SANDBOX_DIR
#define PAMEDIT_SANDBOX_DIR "./pam.d"
#endif

// Appended to the active directory to name the whole-directory backup.
#ifndef PAMEDIT_DIR_BACKUP_SUFFIX
#define PAMEDIT_DIR_BACKUP_SUFFIX ".backup"
#endif

#define PAMEDIT_FILE_BACKUP_SUFFIX ".bak"
#define PAMEDIT_TMP_SUFFIX ".temp"

// Environment overrides, the CLI options take precedence over both.
#define PAMEDIT_DIR_ENV "PAMEDIT_DIR"
#define PAMEDIT_BACKUP_DIR_ENV "PAMEDIT_BACKUP_DIR"

#define PAMEDIT_SYSLOG_FACILITY LOG_AUTHPRIV

#endif  // PAMEDIT_COMPAT_H_
