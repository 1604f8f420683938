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
#include "core/log.h"
#include "gtest/gtest.h"
#include <memory>
#include <string>
#include <vector>

using namespace scpull::core;

class TestAppender : public Appender {
public:
  TestAppender() : Appender() {}
  bool append(const std::string& message) override {
    log_lines.push_back(message);
    return true;
  }

  std::vector<std::string> log_lines;
};

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Clear all of the loggers
    saved_ = Logger::config();
    info = std::make_shared<TestAppender>();
    warning = std::make_shared<TestAppender>();
    verbose = std::make_shared<TestAppender>();
    Logger::config().log_to.clear();
    Logger::config().add_appender(LoggerLevel::info, info);
    Logger::config().add_appender(LoggerLevel::warning, warning);
    Logger::config().add_appender(LoggerLevel::verbose, verbose);

    timestamp.assign("2022-01-01 21:12:00,530 ");
    Logger::config().timestamp_fn_ = [this]() { return timestamp; };
  }

  void TearDown() override { Logger::config() = saved_; }

  std::shared_ptr<TestAppender> info;
  std::shared_ptr<TestAppender> warning;
  std::shared_ptr<TestAppender> verbose;
  std::string timestamp;

private:
  LoggerConfig saved_;
};

TEST_F(LogTest, Smoke) {
  LOG(INFO) << "Hello World!";
  ASSERT_EQ(1u, info->log_lines.size());
  EXPECT_EQ("2022-01-01 21:12:00,530 INFO  Hello World!", info->log_lines.front());
  EXPECT_TRUE(warning->log_lines.empty());
}

TEST_F(LogTest, Warning) {
  LOG(WARNING) << "disk " << 99 << "% full";
  ASSERT_EQ(1u, warning->log_lines.size());
  EXPECT_EQ("2022-01-01 21:12:00,530 WARN  disk 99% full", warning->log_lines.front());
  EXPECT_TRUE(info->log_lines.empty());
}

TEST_F(LogTest, Verbose_Off) {
  Logger::set_cmdline_verbosity(0);
  VLOG(1) << "not shown";
  EXPECT_TRUE(verbose->log_lines.empty());
}

TEST_F(LogTest, Verbose_On) {
  Logger::set_cmdline_verbosity(2);
  VLOG(1) << "one";
  VLOG(2) << "two";
  VLOG(3) << "three";
  ASSERT_EQ(2u, verbose->log_lines.size());
  EXPECT_EQ("2022-01-01 21:12:00,530 VER-1 one", verbose->log_lines.at(0));
  EXPECT_EQ("2022-01-01 21:12:00,530 VER-2 two", verbose->log_lines.at(1));
}

TEST_F(LogTest, LogIf) {
  LOG_IF(false, INFO) << "skipped";
  LOG_IF(true, INFO) << "logged";
  ASSERT_EQ(1u, info->log_lines.size());
  EXPECT_EQ("2022-01-01 21:12:00,530 INFO  logged", info->log_lines.front());
}
