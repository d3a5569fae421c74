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

#ifndef PAMEDIT_RULES_H_
#define PAMEDIT_RULES_H_

#include <string>
#include <vector>

using std::string;

namespace pamedit_rules {

// PAM management groups, the first column of a rule.
enum RuleType {
  kAuth,
  kAccount,
  kPassword,
  kSession,
};

// Maps "auth", "account", "password" or "session" to a RuleType.
bool ParseRuleType(const string& name, RuleType* type);
const char *RuleTypeName(RuleType type);

// Rule is one line of a PAM service file.
struct Rule {
  RuleType type;
  // Set by a leading '-' on the type column: libpam does not log a missing
  // module for such rules.
  bool silent;
  // A keyword or the bracketed [value=action ...] form, kept verbatim.
  string control;
  string module;
  std::vector<string> args;

  Rule() : type(kAuth), silent(false) {}

  bool operator==(const Rule& other) const;
  bool operator!=(const Rule& other) const { return !(*this == other); }
};

// A line of a service file. Lines that are not rules (comments, blank lines,
// @include directives, malformed lines) are kept as text so that a rewrite
// leaves them untouched. Rules read from disk also keep their original text.
// text excludes the '\n' but keeps a '\r' of CRLF files.
struct ConfigLine {
  bool is_rule;
  Rule rule;
  string text;
  // False only for a last line that had no terminating newline.
  bool newline;

  ConfigLine() : is_rule(false), newline(true) {}
};

enum LineKind {
  kRuleLine,
  kIgnoredLine,    // blank, comment or @include
  kMalformedLine,
};

// Splits a line into whitespace separated tokens. A token starting with '['
// runs up to the matching ']' and may contain spaces; "\]" inside it is a
// literal bracket. An unescaped '#' outside brackets starts a comment.
// Returns false on an unterminated bracket.
bool TokenizeLine(const string& line, std::vector<string>* tokens);

// Parses one line. rule is only filled for kRuleLine.
LineKind ParseRuleLine(const string& line, Rule* rule);

// Parses the text of a service file into lines, in file order. Malformed lines
// are logged as warnings and kept verbatim. source names the file in log
// messages. If warnings is not NULL it receives the number of skipped lines.
std::vector<ConfigLine> ParseServiceText(const string& text,
                                         const string& source,
                                         int* warnings);

// Returns only the rules of text, in order.
std::vector<Rule> ParseRules(const string& text);

// Formats a rule as "[-]type control module args...", without a newline.
string SerializeRule(const Rule& rule);

// One newline terminated line per rule.
string SerializeRules(const std::vector<Rule>& rules);

// Rebuilds file text. Lines keep their original text and line ending when
// they have one. New rules take the CRLF ending when the file uses it.
string SerializeLines(const std::vector<ConfigLine>& lines);

std::vector<Rule> RulesOf(const std::vector<ConfigLine>& lines);

// Control flags are one of the libpam keywords or a bracketed list of
// value=action pairs.
bool ValidateControl(const string& control);

// Module paths must be a single non-empty token.
bool ValidateModule(const string& module);

// Splits an argument string the same way the parser splits a line.
bool SplitArgs(const string& args, std::vector<string>* result);

// Renders {"service": ..., "rules": [...]}, each rule an object with type,
// silent, control, module and args members.
string RulesToJson(const string& service, const std::vector<Rule>& rules);

}  // namespace pamedit_rules

#endif  // PAMEDIT_RULES_H_
