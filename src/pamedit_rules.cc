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

#include <ctype.h>
#include <json.h>
#include <strings.h>

#include <algorithm>
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

#include "include/pamedit_rules.h"
#include "include/pamedit_utils.h"

using std::string;
using std::vector;

using pamedit_utils::SysLogWarn;

// The simple control keywords understood by libpam.
static const char *kControlKeywords[] = {
  "required", "requisite", "sufficient", "optional", "include", "substack",
  NULL,
};

// [value=action ...] where action is a keyword or a jump count.
static const char kBracketControlRegex[] =
    "^\\[([ \\t]*[a-zA-Z_]+=([a-zA-Z]+|[0-9]+))+[ \\t]*\\]$";

namespace pamedit_rules {

static const struct {
  RuleType type;
  const char *name;
} kRuleTypes[] = {
  {kAuth, "auth"},
  {kAccount, "account"},
  {kPassword, "password"},
  {kSession, "session"},
};

bool ParseRuleType(const string& name, RuleType* type) {
  for (size_t i = 0; i < sizeof(kRuleTypes) / sizeof(kRuleTypes[0]); i++) {
    if (strcasecmp(name.c_str(), kRuleTypes[i].name) == 0) {
      *type = kRuleTypes[i].type;
      return true;
    }
  }
  return false;
}

const char *RuleTypeName(RuleType type) {
  for (size_t i = 0; i < sizeof(kRuleTypes) / sizeof(kRuleTypes[0]); i++) {
    if (kRuleTypes[i].type == type) {
      return kRuleTypes[i].name;
    }
  }
  return "";
}

bool Rule::operator==(const Rule& other) const {
  return type == other.type && silent == other.silent &&
         control == other.control && module == other.module &&
         args == other.args;
}

// ----------------- Parsing -----------------

bool TokenizeLine(const string& line, vector<string>* tokens) {
  size_t i = 0;
  size_t len = line.length();

  while (i < len) {
    while (i < len && isspace(static_cast<unsigned char>(line[i]))) {
      i++;
    }
    if (i >= len || line[i] == '#') {
      break;
    }

    size_t start = i;
    if (line[i] == '[') {
      // Bracketed token, ends at the first unescaped ']'.
      i++;
      while (i < len && line[i] != ']') {
        if (line[i] == '\\' && i + 1 < len && line[i + 1] == ']') {
          i++;
        }
        i++;
      }
      if (i >= len) {
        return false;
      }
      i++;
    }
    while (i < len && !isspace(static_cast<unsigned char>(line[i])) &&
           line[i] != '#') {
      i++;
    }
    tokens->push_back(line.substr(start, i - start));
  }
  return true;
}

LineKind ParseRuleLine(const string& line, Rule* rule) {
  vector<string> tokens;
  if (!TokenizeLine(line, &tokens)) {
    return kMalformedLine;
  }
  if (tokens.empty() || tokens[0][0] == '@') {
    return kIgnoredLine;
  }
  if (tokens.size() < 3) {
    return kMalformedLine;
  }

  string type_name = tokens[0];
  bool silent = false;
  if (type_name[0] == '-') {
    silent = true;
    type_name.erase(0, 1);
  }
  RuleType type;
  if (!ParseRuleType(type_name, &type)) {
    return kMalformedLine;
  }

  rule->type = type;
  rule->silent = silent;
  rule->control = tokens[1];
  rule->module = tokens[2];
  rule->args.assign(tokens.begin() + 3, tokens.end());
  return kRuleLine;
}

vector<ConfigLine> ParseServiceText(const string& text, const string& source,
                                    int* warnings) {
  vector<ConfigLine> lines;
  int skipped = 0;
  int line_number = 0;

  std::istringstream in(text);
  string raw;
  while (std::getline(in, raw)) {
    line_number++;
    ConfigLine line;
    line.text = raw;
    line.newline = !in.eof();
    if (!raw.empty() && raw[raw.length() - 1] == '\r') {
      raw.erase(raw.length() - 1);
    }

    switch (ParseRuleLine(raw, &line.rule)) {
      case kRuleLine:
        line.is_rule = true;
        break;
      case kMalformedLine:
        SysLogWarn("%s:%d: skipping malformed line \"%s\"", source.c_str(),
                   line_number, raw.c_str());
        skipped++;
        break;
      case kIgnoredLine:
        break;
    }
    lines.push_back(line);
  }

  if (warnings != NULL) {
    *warnings = skipped;
  }
  return lines;
}

vector<Rule> ParseRules(const string& text) {
  return RulesOf(ParseServiceText(text, "<text>", NULL));
}

vector<Rule> RulesOf(const vector<ConfigLine>& lines) {
  vector<Rule> rules;
  for (size_t i = 0; i < lines.size(); i++) {
    if (lines[i].is_rule) {
      rules.push_back(lines[i].rule);
    }
  }
  return rules;
}

// ----------------- Serialization -----------------

string SerializeRule(const Rule& rule) {
  std::stringstream line;
  if (rule.silent) {
    line << "-";
  }
  line << RuleTypeName(rule.type) << " " << rule.control << " " << rule.module;
  for (size_t i = 0; i < rule.args.size(); i++) {
    line << " " << rule.args[i];
  }
  return line.str();
}

string SerializeRules(const vector<Rule>& rules) {
  string text;
  for (size_t i = 0; i < rules.size(); i++) {
    text += SerializeRule(rules[i]);
    text += "\n";
  }
  return text;
}

static bool HasCarriageReturn(const ConfigLine& line) {
  return !line.text.empty() && line.text[line.text.length() - 1] == '\r';
}

string SerializeLines(const vector<ConfigLine>& lines) {
  bool crlf = false;
  for (size_t i = 0; i < lines.size() && !crlf; i++) {
    crlf = HasCarriageReturn(lines[i]);
  }

  string text;
  for (size_t i = 0; i < lines.size(); i++) {
    if (lines[i].is_rule && lines[i].text.empty()) {
      text += SerializeRule(lines[i].rule);
      if (crlf) {
        text += "\r";
      }
    } else {
      text += lines[i].text;
    }
    // A line that was last without a newline gets one once lines follow it.
    if (lines[i].newline || i + 1 < lines.size()) {
      text += "\n";
    }
  }
  return text;
}

// ----------------- Validation -----------------

bool ValidateControl(const string& control) {
  if (control.empty()) {
    return false;
  }
  if (control[0] == '[') {
    Regex::regex r(kBracketControlRegex);
    return Regex::regex_match(control, r);
  }
  for (int i = 0; kControlKeywords[i] != NULL; i++) {
    if (strcasecmp(control.c_str(), kControlKeywords[i]) == 0) {
      return true;
    }
  }
  return false;
}

bool ValidateModule(const string& module) {
  vector<string> tokens;
  if (!TokenizeLine(module, &tokens) || tokens.size() != 1) {
    return false;
  }
  return tokens[0] == module && module[0] != '[';
}

bool SplitArgs(const string& args, vector<string>* result) {
  vector<string> tokens;
  if (!TokenizeLine(args, &tokens)) {
    return false;
  }
  // A '#' outside brackets would drop the rest of the arguments on the next
  // read of the file.
  size_t kept = 0;
  for (size_t i = 0; i < tokens.size(); i++) {
    kept += std::count(tokens[i].begin(), tokens[i].end(), '#');
  }
  if (kept != static_cast<size_t>(std::count(args.begin(), args.end(), '#'))) {
    return false;
  }
  result->swap(tokens);
  return true;
}

// ----------------- JSON -----------------

string RulesToJson(const string& service, const vector<Rule>& rules) {
  json_object* root = json_object_new_object();
  json_object_object_add(root, "service",
                         json_object_new_string(service.c_str()));

  json_object* array = json_object_new_array();
  for (size_t i = 0; i < rules.size(); i++) {
    const Rule& rule = rules[i];
    json_object* obj = json_object_new_object();
    json_object_object_add(obj, "type",
                           json_object_new_string(RuleTypeName(rule.type)));
    json_object_object_add(obj, "silent", json_object_new_boolean(rule.silent));
    json_object_object_add(obj, "control",
                           json_object_new_string(rule.control.c_str()));
    json_object_object_add(obj, "module",
                           json_object_new_string(rule.module.c_str()));
    json_object* args = json_object_new_array();
    for (size_t j = 0; j < rule.args.size(); j++) {
      json_object_array_add(args, json_object_new_string(rule.args[j].c_str()));
    }
    json_object_object_add(obj, "args", args);
    json_object_array_add(array, obj);
  }
  json_object_object_add(root, "rules", array);

  string result = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PRETTY);
  json_object_put(root);
  return result;
}

}  // namespace pamedit_rules
