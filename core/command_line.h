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
#ifndef INCLUDED_CORE_COMMAND_LINE_H
#define INCLUDED_CORE_COMMAND_LINE_H

#include "core/inifile.h"
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * CommandLine support.
 *
 * 1) Declare the allowed arguments.
 * 2) Parse the actual commandline, reporting any errors.
 * 3) Get the values as needed.
 *
 * Example:
 * program: scpull [--recursive, -r] [--port, -p] host:path [dir]
 * CommandLine cmdline(argc, argv);
 * cmdline.add_argument(BooleanCommandLineArgument{"recursive", 'r', "Copy directories", false});
 * cmdline.add_argument({"port", 'p', "ssh port", ""});
 * if (!cmdline.Parse()) { return 2; }
 *
 * const auto port = cmdline.iarg("port");
 * const auto& positional = cmdline.remaining();
 */

namespace scpull::core {

struct unknown_argument_error : public std::runtime_error {
  explicit unknown_argument_error(const std::string& message);
};

class CommandLineValue {
public:
  CommandLineValue() noexcept
    : default_(true) {
  }

  explicit CommandLineValue(const std::string& s) noexcept
    : CommandLineValue(s, false) {
  }

  CommandLineValue(std::string value, bool default_value) noexcept
    : value_(std::move(value)), default_(default_value) {
  }

  [[nodiscard]] std::string as_string() const noexcept { return value_; }

  [[nodiscard]] int as_int() const noexcept;

  [[nodiscard]] bool as_bool() const noexcept { return value_ == "true"; }

  [[nodiscard]] bool is_default() const noexcept { return default_; }

private:
  std::string value_;
  bool default_;
};

class CommandLineArgument {
public:
  CommandLineArgument(std::string name, char key, std::string help_text,
                      std::string default_value, std::string environment_variable);

  CommandLineArgument(const std::string& name, char key, const std::string& help_text,
                      const std::string& default_value)
    : CommandLineArgument(name, key, help_text, default_value, "") {
  }

  CommandLineArgument(const std::string& name, const std::string& help_text,
                      const std::string& default_value, const std::string& environment_variable)
    : CommandLineArgument(name, 0, help_text, default_value, environment_variable) {
  }

  CommandLineArgument(const std::string& name, const std::string& help_text,
                      const std::string& default_value)
    : CommandLineArgument(name, 0, help_text, default_value, "") {
  }

  [[nodiscard]] std::string help_text() const;
  [[nodiscard]] std::string default_value() const;
  std::string name_;
  char key_{0};
  std::string help_text_;
  std::string default_value_;
  std::string environment_variable_;
  bool is_boolean{false};
};

class BooleanCommandLineArgument : public CommandLineArgument {
public:
  BooleanCommandLineArgument(const std::string& name, char key, const std::string& help_text,
                             bool default_value)
    : CommandLineArgument(name, key, help_text, default_value ? "true" : "false") {
    is_boolean = true;
  }

  BooleanCommandLineArgument(const std::string& name, const std::string& help_text,
                             bool default_value)
    : CommandLineArgument(name, 0, help_text, default_value ? "true" : "false") {
    is_boolean = true;
  }
};

/**
 * Class to parse command line arguments.
 *
 * Long arguments are --key=value, short ones are -kvalue or -k value. A
 * bare -- ends argument parsing; everything after it and every positional
 * argument ends up in remaining().
 */
class CommandLine final {
public:
  CommandLine(const std::vector<std::string>& args);
  CommandLine(int argc, char** argv);
  CommandLine() = delete;
  CommandLine(const CommandLine&) = delete;
  ~CommandLine() = default;

  bool add_argument(const CommandLineArgument& cmd);
  bool AddStandardArgs();
  bool Parse();

  [[nodiscard]] CommandLineValue arg(const std::string& name) const;
  [[nodiscard]] bool contains_arg(const std::string& name) const noexcept;
  [[nodiscard]] std::string sarg(const std::string& name) const { return arg(name).as_string(); }
  [[nodiscard]] int iarg(const std::string& name) const { return arg(name).as_int(); }
  [[nodiscard]] bool barg(const std::string& name) const { return arg(name).as_bool(); }

  /** Every value given for name on the commandline, in order. For repeatable args. */
  [[nodiscard]] std::vector<std::string> sargs(const std::string& name) const;

  [[nodiscard]] bool help_requested() const { return barg("help"); }
  [[nodiscard]] const std::vector<std::string>& remaining() const { return remaining_; }
  [[nodiscard]] std::string ToString() const;
  [[nodiscard]] std::string GetHelp() const;
  [[nodiscard]] std::string ArgNameForKey(char key) const;

  /**
   * Sets a new default value. Values supplied on the commandline take
   * precedence, this only replaces defaults (i.e. from an INI file).
   */
  bool SetNewDefault(const std::string& key, const std::string& value);

  void set_unknown_args_allowed(bool u) { unknown_args_allowed_ = u; }
  [[nodiscard]] bool unknown_args_allowed() const { return unknown_args_allowed_; }
  void set_no_args_allowed(bool no_args_allowed) { no_args_allowed_ = no_args_allowed; }
  [[nodiscard]] bool no_args_allowed() const { return no_args_allowed_; }
  /** Extra text shown after the program name on the usage line. */
  void set_usage_suffix(const std::string& s) { usage_suffix_ = s; }

  [[nodiscard]] std::string program_name() const noexcept { return program_name_; }
  [[nodiscard]] std::filesystem::path program_path() const noexcept { return program_path_; }
  [[nodiscard]] std::string logdir() const noexcept { return logdir_; }
  [[nodiscard]] int verbose() const noexcept { return verbose_; }

  /** Which arguments are allowed */
  [[nodiscard]] const std::map<const std::string, CommandLineArgument>& args_allowed() const {
    return args_allowed_;
  }

private:
  bool SetCommandLineArgument(const std::string& key, const std::string& value, bool default_value);
  void ParseImpl();

  std::vector<std::string> raw_args_;
  // Values as allowed to be specified on the commandline.
  std::map<const std::string, CommandLineArgument> args_allowed_;
  // Values as entered on the commandline.
  std::map<std::string, CommandLineValue> args_;
  std::map<std::string, std::vector<std::string>> repeated_;
  std::vector<std::string> remaining_;

  const std::string program_name_;
  const std::filesystem::path program_path_;
  std::string usage_suffix_;
  std::string logdir_;
  int verbose_{0};
  bool unknown_args_allowed_{false};
  bool no_args_allowed_{false};
};

// Utility methods for setting defaults from INI files.

/**
 * Sets a default value for the command line parameter for to be the value
 * of an INI file key of the same name and type.
 */
void SetNewStringDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key);

/**
 * Sets a default value for the command line parameter for to be the value
 * of an INI file key of the same name and type.
 */
void SetNewBooleanDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key);

/**
 * Sets a default value for the command line parameter for to be the value
 * of an INI file key of the same name and type.
 */
void SetNewIntDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key);

/**
 * As SetNewIntDefault, also invokes function f with the resulting value.
 */
void SetNewIntDefault(CommandLine& cmdline, const IniFile& ini, const std::string& key,
                      const std::function<void(int)>& f);

} // namespace scpull::core

#endif
