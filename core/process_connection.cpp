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
#include "core/process_connection.h"

#include "core/channel_exceptions.h"
#include "core/log.h"
#include "core/os.h"
#include "core/stl.h"
#include "core/strings.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using namespace std::chrono;
using namespace scpull::strings;

namespace scpull::core {

static constexpr int READ_SIZE = 16 * 1024;
static constexpr auto REAP_WAIT = seconds(5);

static void close_fd(int& fd) {
  if (fd != -1) {
    ::close(fd);
    fd = -1;
  }
}

// static
std::unique_ptr<ProcessConnection> ProcessConnection::Spawn(const std::vector<std::string>& argv,
                                                            StderrMode stderr_mode) {
  if (argv.empty() || argv.front().empty()) {
    throw spawn_error("", "no program specified");
  }
  VLOG(1) << "Exec: '" << JoinStrings(argv, " ") << "'";

  // A peer closing its stdin must surface as EPIPE from write, not a signal.
  signal(SIGPIPE, SIG_IGN);

  int to_child[2];
  int from_child[2];
  if (pipe2(to_child, O_CLOEXEC) != 0) {
    throw spawn_error(argv.front(), StrCat("pipe failed: ", strerror(errno)));
  }
  if (pipe2(from_child, O_CLOEXEC) != 0) {
    const auto e = errno;
    ::close(to_child[0]);
    ::close(to_child[1]);
    throw spawn_error(argv.front(), StrCat("pipe failed: ", strerror(e)));
  }

  // Build argv before forking, only async-signal-safe calls are allowed in the child.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    cargv.push_back(const_cast<char*>(a.c_str()));
  }
  cargv.push_back(nullptr);

  const auto pid = fork();
  if (pid == -1) {
    const auto e = errno;
    LOG(ERROR) << "Fork Failed: errno: '" << e << "'";
    for (auto fd : {to_child[0], to_child[1], from_child[0], from_child[1]}) {
      ::close(fd);
    }
    throw spawn_error(argv.front(), StrCat("fork failed: ", strerror(e)));
  }
  if (pid == 0) {
    // In the child
    dup2(to_child[0], STDIN_FILENO);
    dup2(from_child[1], STDOUT_FILENO);
    if (stderr_mode == StderrMode::discard) {
      const auto devnull = open("/dev/null", O_WRONLY);
      if (devnull != -1) {
        dup2(devnull, STDERR_FILENO);
      }
    }
    execvp(cargv[0], cargv.data());
    _exit(127);
  }

  // In the parent now.
  VLOG(1) << "In parent, pid " << pid;
  ::close(to_child[0]);
  ::close(from_child[1]);
  return std::unique_ptr<ProcessConnection>(
      new ProcessConnection(pid, from_child[0], to_child[1]));
}

ProcessConnection::ProcessConnection(pid_t pid, int read_fd, int write_fd)
  : pid_(pid), read_fd_(read_fd), write_fd_(write_fd) {
}

ProcessConnection::~ProcessConnection() {
  if (open_) {
    close();
  }
}

bool ProcessConnection::fill(steady_clock::time_point deadline) {
  if (eof_ || read_fd_ == -1) {
    return false;
  }
  for (;;) {
    const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) {
      throw timeout_error("timeout waiting for data from the remote command");
    }
    pollfd pfd{read_fd_, POLLIN, 0};
    const auto ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw channel_error(StrCat("poll failed: ", strerror(errno)));
    }
    if (ret == 0) {
      continue;
    }
    char data[READ_SIZE];
    const auto num_read = read(read_fd_, data, sizeof(data));
    if (num_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw channel_error(StrCat("read failed: ", strerror(errno)));
    }
    if (num_read == 0) {
      VLOG(2) << "End of stream from pid " << pid_;
      eof_ = true;
      return false;
    }
    buffer_.append(data, static_cast<std::string::size_type>(num_read));
    return true;
  }
}

std::string ProcessConnection::receive_upto(int size, duration<double> d) {
  if (size <= 0) {
    return {};
  }
  const auto deadline = steady_clock::now() + duration_cast<steady_clock::duration>(d);
  if (buffer_.empty() && !fill(deadline)) {
    return {};
  }
  const auto n = std::min<std::string::size_type>(buffer_.size(), size);
  auto s = buffer_.substr(0, n);
  buffer_.erase(0, n);
  return s;
}

std::string ProcessConnection::read_line(int max_size, duration<double> d) {
  const auto deadline = steady_clock::now() + duration_cast<steady_clock::duration>(d);
  const auto max = static_cast<std::string::size_type>(max_size);
  std::string::size_type searched = 0;
  for (;;) {
    if (const auto nl = buffer_.find('\n', searched); nl != std::string::npos && nl < max) {
      auto s = buffer_.substr(0, nl + 1);
      buffer_.erase(0, nl + 1);
      return s;
    }
    if (buffer_.size() >= max) {
      auto s = buffer_.substr(0, max);
      buffer_.erase(0, max);
      return s;
    }
    searched = buffer_.size();
    if (!fill(deadline)) {
      // Partial line at end of stream.
      auto s = buffer_;
      buffer_.clear();
      return s;
    }
  }
}

int ProcessConnection::send(const void* data, int size, duration<double>) {
  if (write_fd_ == -1) {
    throw channel_closed_error("send: channel not open");
  }
  const auto* p = static_cast<const char*>(data);
  auto total = 0;
  while (total < size) {
    const auto w = write(write_fd_, p + total, static_cast<size_t>(size - total));
    if (w < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE) {
        throw channel_closed_error("send: remote command closed its input");
      }
      throw channel_error(StrCat("write failed: ", strerror(errno)));
    }
    total += static_cast<int>(w);
  }
  return total;
}

int ProcessConnection::send(const std::string& s, duration<double> d) {
  return send(s.data(), stl::size_int(s), d);
}

void ProcessConnection::reap(bool block) {
  if (exit_code_) {
    return;
  }
  for (;;) {
    int status_code = 0;
    const auto wp = waitpid(pid_, &status_code, block ? 0 : WNOHANG);
    if (wp == -1) {
      if (errno == EINTR) {
        continue;
      }
      LOG(ERROR) << "waitpid failed for pid " << pid_ << ": " << strerror(errno);
      exit_code_ = -1;
      return;
    }
    if (wp == 0) {
      return;
    }
    if (WIFEXITED(status_code)) {
      exit_code_ = WEXITSTATUS(status_code);
      VLOG(1) << "child exited with code: " << *exit_code_;
    } else if (WIFSIGNALED(status_code)) {
      exit_code_ = 128 + WTERMSIG(status_code);
      VLOG(1) << "child caught signal: " << WTERMSIG(status_code);
    } else {
      LOG(INFO) << "Raw status_code: " << status_code;
      exit_code_ = -1;
    }
    return;
  }
}

bool ProcessConnection::close() {
  if (!open_) {
    return false;
  }
  open_ = false;
  // Closing stdin lets the child see end of input and exit.
  close_fd(write_fd_);
  close_fd(read_fd_);
  os::wait_for([this] {
    reap(false);
    return exit_code_.has_value();
  }, REAP_WAIT);
  if (!exit_code_) {
    LOG(WARNING) << "pid " << pid_ << " did not exit, sending SIGTERM";
    kill(pid_, SIGTERM);
    reap(true);
  }
  return true;
}

} // namespace scpull::core
