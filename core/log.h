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
#ifndef INCLUDED_CORE_LOG_H
#define INCLUDED_CORE_LOG_H

#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>

typedef std::basic_ostream<char>&(ENDL_TYPE)(std::basic_ostream<char>&);

#if defined(_DEBUG) || !defined(NDEBUG)
#define SCPULL_CORE_LOG_DEBUG
#endif

#define LOG(LEVEL) LOG_##LEVEL
#define VLOG(LEVEL) LOG_VERBOSE(LEVEL)

#define LOG_IGNORED(x) scpull::core::NullLogger()
#define LOG_STARTUP scpull::core::Logger(scpull::core::LoggerLevel::start, 0)
#define LOG_INFO scpull::core::Logger(scpull::core::LoggerLevel::info, 0)
#define LOG_WARNING scpull::core::Logger(scpull::core::LoggerLevel::warning, 0)
#define LOG_ERROR scpull::core::Logger(scpull::core::LoggerLevel::error, 0)
#define LOG_FATAL scpull::core::Logger(scpull::core::LoggerLevel::fatal, 0)
#define LOG_VERBOSE(verbosity) scpull::core::Logger(scpull::core::LoggerLevel::verbose, verbosity)

#define CHECK(x) LOG_IF(!(x), FATAL)
#define CHECK_LE(x, y) LOG_IF(!((x) <= (y)), FATAL)
#define CHECK_EQ(x, y) LOG_IF(!((x) == (y)), FATAL)
#define CHECK_NE(x, y) LOG_IF(!((x) != (y)), FATAL)
#define CHECK_GE(x, y) LOG_IF(!((x) >= (y)), FATAL)
#define CHECK_GT(x, y) LOG_IF(!((x) > (y)), FATAL)
#ifdef SCPULL_CORE_LOG_DEBUG
#define DCHECK_LE(x, y) CHECK_LE(x, y)
#define DCHECK_EQ(x, y) CHECK_EQ(x, y)
#define DCHECK_NE(x, y) CHECK_NE(x, y)
#define DCHECK_GE(x, y) CHECK_GE(x, y)
#define DCHECK_GT(x, y) CHECK_GT(x, y)
#define DLOG(LEVEL) LOG_##LEVEL
#else
#define DCHECK_LE(x, y) LOG_IGNORED(x)
#define DCHECK_EQ(x, y) LOG_IGNORED(x)
#define DCHECK_NE(x, y) LOG_IGNORED(x)
#define DCHECK_GE(x, y) LOG_IGNORED(x)
#define DCHECK_GT(x, y) LOG_IGNORED(x)
#define DLOG(LEVEL) LOG_IGNORED(LEVEL)
#endif

#define CHECK_NOTNULL(x) CHECK(x != nullptr)
#define LOG_IF(condition, LEVEL)                                                                   \
  if (condition)                                                                                   \
  LOG(LEVEL)

#define VLOG_IS_ON(level) scpull::core::Logger::vlog_is_on(level)

namespace scpull::core {

enum class LoggerLevel { ignored, start, debug, verbose, info, warning, error, fatal };

class Appender {
public:
  Appender() = default;
  virtual ~Appender() = default;
  virtual bool append(const std::string& message) = 0;
};

struct logger_level_hash {
  std::size_t operator()(LoggerLevel l) const noexcept { return static_cast<std::size_t>(l); }
};

typedef std::unordered_map<LoggerLevel, std::unordered_set<std::shared_ptr<Appender>>,
                           logger_level_hash>
    log_to_map_t;
typedef std::function<std::string()> timestamp_fn;

class LoggerConfig {
public:
  LoggerConfig();
  explicit LoggerConfig(timestamp_fn t);
  void add_appender(LoggerLevel level, std::shared_ptr<Appender> appender);
  void reset();

  bool log_startup{false};
  std::string exit_filename;
  std::string log_filename;
  int cmdline_verbosity{0};
  bool register_file_destinations{true};
  bool register_console_destinations{true};
  log_to_map_t log_to;
  timestamp_fn timestamp_fn_;
};

class NullLogger {
public:
  NullLogger() = default;
  void operator&(std::ostream&) {}
  template <class T> NullLogger& operator<<(const T&) { return *this; }
  inline NullLogger& operator<<(ENDL_TYPE*) { return *this; }
};

/**
 * Logger class for scpull.
 * Usage:
 *
 * Once near your main() method, invoke Logger::Init(argc, argv) to initialize
 * the logger. This will initialize the logger filename to be your
 * executable's name with .log appended. You should also invoke ExitLogger
 * when exiting your binary,
 *
 * Example:
 *
 *   Logger::Init(argc, argv);
 *   auto at_exit = finally(Logger::ExitLogger);
 *
 * In code, just use "LOG(INFO) << messages" and it will end up in the information logs.
 */
class Logger {
public:
  Logger() : Logger(LoggerLevel::info, 0) {}
  explicit Logger(LoggerLevel level) : Logger(level, 0) {}
  Logger(LoggerLevel level, int verbosity) noexcept;
  ~Logger() noexcept;

  /** Initializes the Loggers.  Must be invoked once per binary. */
  static void Init(int argc, char** argv, LoggerConfig& config);
  static void Init(int argc, char** argv);
  static void ExitLogger();
  static bool vlog_is_on(int level);
  static LoggerConfig& config() noexcept { return config_; }
  static void set_cmdline_verbosity(int cmdline_verbosity);

  template <class T> Logger& operator<<(const T& msg) {
    ss_ << msg;
    return *this;
  }
  inline Logger& operator<<(ENDL_TYPE* m) {
    ss_ << m;
    return *this;
  }

private:
  static void StartupLog(int argc, char* argv[]);
  [[nodiscard]] std::string FormatLogMessage(LoggerLevel level, int verbosity,
                                             const std::string& msg) const noexcept;
  static LoggerConfig config_;
  LoggerLevel level_;
  int verbosity_;
  std::ostringstream ss_;
};

} // namespace scpull::core

#endif
