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
#include "core/channel_exceptions.h"
#include "core/command_line.h"
#include "core/datetime.h"
#include "core/file.h"
#include "core/inifile.h"
#include "core/log.h"
#include "core/scope_exit.h"
#include "core/strings.h"
#include "scp/pull.h"
#include "scp/scp_command.h"
#include "scp/scp_exceptions.h"
#include "scp/ssh_remote_exec.h"
#include "fmt/format.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>

using namespace std::chrono;
using namespace scpull::core;
using namespace scpull::scp;
using namespace scpull::strings;

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

static void RegisterScpullCommands(CommandLine& cmdline) {
  cmdline.add_argument(
      BooleanCommandLineArgument("recursive", 'r', "Copy whole directories", false));
  cmdline.add_argument({"ssh", "Local ssh client to run", "ssh"});
  cmdline.add_argument({"port", 'p', "Port to connect to on the remote host", "0"});
  cmdline.add_argument({"identity", 'i', "Identity (private key) file for ssh", ""});
  cmdline.add_argument({"ssh_option", 'o', "Option passed to ssh as -o (repeatable)", ""});
  cmdline.add_argument({"scp", "scp program on the remote host", "scp"});
  cmdline.add_argument({"timeout", "Seconds to wait for the remote side", "60"});
  cmdline.add_argument(BooleanCommandLineArgument("quiet", 'q', "Do not show progress", false));
  cmdline.add_argument({"config", "INI file with an [scpull] section of defaults", "scpull.ini",
                        "SCPULL_CONFIG"});
  cmdline.set_usage_suffix("[user@]host:path [local_dir]");
}

static void LoadDefaults(CommandLine& cmdline) {
  const IniFile ini(cmdline.sarg("config"), {"scpull"});
  if (!ini.IsOpen()) {
    VLOG(1) << "No config file: " << cmdline.sarg("config");
    return;
  }
  VLOG(1) << "Using config file: " << ini.path().string();
  SetNewBooleanDefault(cmdline, ini, "recursive");
  SetNewStringDefault(cmdline, ini, "ssh");
  SetNewIntDefault(cmdline, ini, "port");
  SetNewStringDefault(cmdline, ini, "identity");
  SetNewStringDefault(cmdline, ini, "scp");
  SetNewIntDefault(cmdline, ini, "timeout");
  SetNewBooleanDefault(cmdline, ini, "quiet");
}

// Where the receiver writes.  Without recursion it names the file itself, so
// an existing local directory gets the remote file's name appended.
static std::filesystem::path Destination(const std::string& local, const std::string& remote_path,
                                         bool recursive) {
  const auto dest = File::absolute(local);
  if (recursive || !File::is_directory(dest)) {
    return dest;
  }
  auto name = std::filesystem::path(remote_path).filename();
  if (name.empty() || name == "." || name == "..") {
    return dest;
  }
  return dest / name;
}

static ScpEvents ProgressPrinter(std::map<std::string, int64_t>& sizes) {
  ScpEvents e;
  e.download = [&sizes](const std::string& path, int64_t size) { sizes[path] = size; };
  e.mkdir = [](const std::string& path) { fmt::print("{}/\n", path); };
  e.done = [&sizes](const std::string& path) {
    fmt::print("{}  {} bytes\n", path, sizes[path]);
    sizes.erase(path);
  };
  return e;
}

static int Main(const CommandLine& cmdline) {
  const auto& args = cmdline.remaining();
  if (args.empty() || args.size() > 2) {
    std::cout << cmdline.GetHelp() << std::endl;
    return EXIT_USAGE;
  }
  const auto location = ParseRemoteLocation(args.front());
  if (!location) {
    LOG(ERROR) << "Expected [user@]host:path, got: " << args.front();
    return EXIT_USAGE;
  }
  const auto recursive = cmdline.barg("recursive");
  const auto local = args.size() > 1 ? args.at(1) : std::string(".");

  SshOptions ssh;
  ssh.program = cmdline.sarg("ssh");
  ssh.destination = location->destination;
  ssh.port = cmdline.iarg("port");
  ssh.identity_file = cmdline.sarg("identity");
  ssh.options = cmdline.sargs("ssh_option");
  ssh.show_stderr = cmdline.verbose() > 0;
  SshRemoteExec exec(ssh);

  PullOptions options;
  options.remote_path = location->path;
  options.destination = Destination(local, location->path, recursive);
  options.recursive = recursive;
  options.scp_program = cmdline.sarg("scp");
  options.timeout = seconds(std::max(1, cmdline.iarg("timeout")));

  if (recursive && !File::mkdirs(options.destination)) {
    LOG(ERROR) << "Unable to create directory: " << options.destination.string();
    return EXIT_FAILED;
  }

  Pull pull(exec, options);
  std::map<std::string, int64_t> sizes;
  if (!cmdline.barg("quiet")) {
    pull.add_observer(ProgressPrinter(sizes));
  }
  const auto start = steady_clock::now();
  try {
    pull.Start();
  } catch (const path_error& e) {
    LOG(ERROR) << "PATH ERROR: [scpull]: " << e.what();
    return EXIT_FAILED;
  } catch (const scp_error& e) {
    LOG(ERROR) << "ERROR: [scpull]: " << e.what();
    return EXIT_FAILED;
  } catch (const channel_error& e) {
    LOG(ERROR) << "CHANNEL ERROR: [scpull]: " << e.what();
    return EXIT_FAILED;
  }
  const auto& stats = pull.stats();
  LOG(INFO) << "Received " << stats.files << " files, " << stats.directories
            << " directories and " << stats.bytes << " bytes in "
            << scpull::core::to_string(duration_cast<duration<double>>(steady_clock::now() - start));
  return EXIT_OK;
}

int main(int argc, char** argv) {
  LoggerConfig config;
  Logger::Init(argc, argv, config);
  auto at_exit = finally(Logger::ExitLogger);

  CommandLine cmdline(argc, argv);
  cmdline.AddStandardArgs();
  RegisterScpullCommands(cmdline);
  if (!cmdline.Parse()) {
    return EXIT_USAGE;
  }
  if (cmdline.help_requested()) {
    std::cout << cmdline.GetHelp() << std::endl;
    return EXIT_OK;
  }
  LoadDefaults(cmdline);
  try {
    return Main(cmdline);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Caught uncaught exception: " << e.what();
    return EXIT_FAILED;
  }
}
