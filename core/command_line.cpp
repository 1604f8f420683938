/**************************************************************************/
/*                                                                        */
/*                           SCPull Version 1.x                           */
/*               Copyright (C)2022, WWIV Software Services                */
/*                                                                        */
/*    Licensed  under the  Apache License, Version  2.0 (the "License");  */
/*    you may not use this  file  except in compliance with the License.  */
/*    You may obtain a copy of the License at                             */
/*                                                                        */
/*                http://www.apache.org/licenses/LICENSE-2.0              */
/*                                                                        */
/*    Unless  required  by  applicable  law  or agreed to  in  writing,   */
/*    software  distributed  under  the  License  is  distributed on an   */
/*    "AS IS"  BASIS, WITHOUT  WARRANTIES  OR  CONDITIONS OF ANY  KIND,   */
/*    either  express  or implied.  See  the  License for  the specific   */
/*    language governing permissions and limitations under the License.   */
/*                                                                        */
/**************************************************************************/
#include "core/command_line.h"

#include "core/file.h"
#include "core/log.h"
#include "core/os.h"
#include "core/stl.h"
#include "core/strings.h"
#include "core/version.h"
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using std::clog;
using std::cout;
using std::endl;
using std::left;
using std::setw;
using std::string;
using namespace scpull::strings;
using namespace scpull::stl;
using namespace scpull::os;

namespace scpull::core {

int CommandLineValue::as_int() const noexcept {
  if (value_.empty()) {
    return 0;
  }
  return to_number<int>(value_);
}

CommandLineArgument::CommandLineArgument(std::string name, char key, std::string help_text,
                                         std::string default_value,
                                         std::string environment_variable)
  : name_(std::move(name)), key_(key), help_text_(std::move(help_text)),
    default_value_(std::move(default_value)),
    environment_variable_(std::move(environment_variable)) {
}

std::string CommandLineArgument::help_text() const { return help_text_; }

std::string CommandLineArgument::default_value() const {
  if (environment_variable_.empty()) {
    return default_value_;
  }
  const auto env = environment_variable(environment_variable_);
  return env.empty() ? default_value_ : env;
}

static std::vector<std::string> make_args(int argc, char** argv) {
  std::vector<std::string> v;
  for (auto i = 0; i < argc; i++) {
    v.emplace_back(argv[i]);
  }
  return v;
}

CommandLine::CommandLine(const std::vector<std::string>& args)
  : raw_args_(args),
    program_name_(args.empty() ? "" : std::filesystem::path(args[0]).filename().string()),
    program_path_(args.empty() ? std::filesystem::path{} : std::filesystem::path(args[0])) {
}

CommandLine::CommandLine(int argc, char** argv)
  : CommandLine(make_args(argc, argv)) {
}

bool CommandLine::Parse() {
  try {
    ParseImpl();
  } catch (const unknown_argument_error& e) {
    clog << "Unable to parse command line." << endl;
    clog << e.what() << endl;
    return false;
  }

  if (raw_args_.size() <= 1 && !no_args_allowed()) {
    clog << "No command line arguments specified." << endl;
    cout << GetHelp();
    return false;
  }

  logdir_ = sarg("logdir");
  verbose_ = iarg("v");
  return true;
}

bool CommandLine::add_argument(const CommandLineArgument& cmd) {
  // Add cmd to the list of allowable arguments, and also set
  // a default value.
  args_allowed_.emplace(cmd.name_, cmd);
  args_.erase(cmd.name_);
  args_.emplace(cmd.name_, CommandLineValue(cmd.default_value(), true));
  return true;
}

bool CommandLine::SetNewDefault(const std::string& key, const std::string& value) {
  if (contains(args_, key) && !args_.at(key).is_default()) {
    return false;
  }
  return SetCommandLineArgument(key, value, true);
}

bool CommandLine::SetCommandLineArgument(const std::string& key, const std::string& value,
                                         bool default_value) {
  if (!contains(args_allowed_, key)) {
    VLOG(1) << "No arg named: " << key;
    return false;
  }
  args_.erase(key); // "emplace" doesn't replace, so erase it first.
  if (args_allowed_.at(key).is_boolean) {
    if (value == "N" || value == "0" || value == "n" || iequals(value, "false")) {
      args_.emplace(key, CommandLineValue("false", default_value));
    } else {
      args_.emplace(key, CommandLineValue("true", default_value));
    }
  } else {
    args_.emplace(key, CommandLineValue(value, default_value));
    if (!default_value) {
      repeated_[key].push_back(value);
    }
  }
  return true;
}

bool CommandLine::contains_arg(const std::string& name) const noexcept {
  return contains(args_, name);
}

CommandLineValue CommandLine::arg(const std::string& name) const {
  if (!contains(args_, name)) {
    VLOG(1) << "Unknown argument name: " << name;
    return CommandLineValue("", true);
  }
  return args_.at(name);
}

std::vector<std::string> CommandLine::sargs(const std::string& name) const {
  if (const auto it = repeated_.find(name); it != std::end(repeated_)) {
    return it->second;
  }
  return {};
}

bool CommandLine::AddStandardArgs() {
  add_argument(BooleanCommandLineArgument("help", '?', "Displays Help", false));
  add_argument({"logdir", "Directory where log files are written.",
                File::current_directory().string(), "SCPULL_LOG_DIR"});
  add_argument(
      BooleanCommandLineArgument{"log_startup", "Should the start/stop/args be logged.", false});
  // Used by the logger.
  add_argument({"v", "verbose log", "0"});
  return true;
}

std::string CommandLine::ArgNameForKey(char key) const {
  for (const auto& [name, a] : args_allowed_) {
    if (a.key_ != 0 && key == a.key_) {
      return name;
    }
  }
  return {};
}

void CommandLine::ParseImpl() {
  for (auto i = 1; i < ssize(raw_args_); i++) {
    const string& s{raw_args_[i]};
    if (s.empty()) {
      continue;
    }
    if (s == "--") {
      // Everything after this should be positional args.
      for (++i; i < ssize(raw_args_); i++) {
        remaining_.emplace_back(raw_args_[i]);
      }
      break;
    }
    if (starts_with(s, "--")) {
      const auto eq = s.find('=');
      const auto key = s.substr(2, eq == string::npos ? string::npos : eq - 2);
      const auto value = eq == string::npos ? string{} : s.substr(eq + 1);
      if (!contains(args_allowed_, key)) {
        if (unknown_args_allowed()) {
          continue;
        }
        throw unknown_argument_error(StrCat("key=", key));
      }
      SetCommandLineArgument(key, value, false);
    } else if (s.front() == '-' && s.size() > 1) {
      const auto letter = s[1];
      const auto key = ArgNameForKey(letter);
      if (key.empty()) {
        if (unknown_args_allowed()) {
          continue;
        }
        throw unknown_argument_error(StrCat("letter=", letter));
      }
      auto value = s.substr(2);
      if (value.empty() && !args_allowed_.at(key).is_boolean) {
        // -k value
        if (i + 1 >= ssize(raw_args_)) {
          throw unknown_argument_error(StrCat("missing value for -", letter));
        }
        value = raw_args_[++i];
      }
      SetCommandLineArgument(key, value, false);
    } else {
      // Positional argument.
      remaining_.emplace_back(s);
    }
  }
}

std::string CommandLine::ToString() const {
  std::ostringstream ss;
  ss << "name: " << program_name_ << "; args: ";
  for (const auto& [key, value] : args_) {
    ss << "{" << key << ": \"" << value.as_string() << "\"}";
  }
  if (!remaining_.empty()) {
    ss << "; remaining: " << JoinStrings(remaining_, ", ");
  }
  return ss.str();
}

std::string CommandLine::GetHelp() const {
  std::ostringstream ss;
  ss << program_name_ << " [" << full_version() << "]" << endl << endl;
  ss << "Usage:" << endl;
  ss << program_name_ << " [args]";
  if (!usage_suffix_.empty()) {
    ss << " " << usage_suffix_;
  }
  ss << endl << endl;
  ss << "arguments:" << endl;
  for (const auto& [_, c] : args_allowed_) {
    if (c.key_ != 0) {
      ss << "-" << c.key_ << " ";
    } else {
      ss << "   ";
    }
    auto text = c.name_;
    if (!c.is_boolean) {
      text = StrCat(c.name_, "=value");
    }
    ss << "--" << left << setw(25) << text << " " << c.help_text() << endl;
  }
  return ss.str();
}

unknown_argument_error::unknown_argument_error(const std::string& message)
  : std::runtime_error(StrCat("unknown_argument_error: ", message)) {
}

void SetNewStringDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key) {
  if (cmdline.contains_arg(key) && cmdline.arg(key).is_default()) {
    const auto f = ini.value<std::string>(key, cmdline.sarg(key));
    cmdline.SetNewDefault(key, f);
  }
}

void SetNewBooleanDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key) {
  if (cmdline.contains_arg(key) && cmdline.arg(key).is_default()) {
    const auto f = ini.value<bool>(key, cmdline.barg(key));
    cmdline.SetNewDefault(key, f ? "Y" : "N");
  }
}

void SetNewIntDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key) {
  if (cmdline.contains_arg(key) && cmdline.arg(key).is_default()) {
    const auto f = ini.value<int>(key, cmdline.iarg(key));
    cmdline.SetNewDefault(key, std::to_string(f));
  }
}

void SetNewIntDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key,
                      const std::function<void(int)>& f) {
  if (cmdline.contains_arg(key) && cmdline.arg(key).is_default()) {
    const auto v = ini.value<int>(key, cmdline.iarg(key));
    cmdline.SetNewDefault(key, std::to_string(v));
    f(v);
  }
}

} // namespace scpull::core
