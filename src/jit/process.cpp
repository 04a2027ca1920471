/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/process.hpp"

#include "utilities/posix.hpp"

#include <kernjit/utilities/defer.hpp>
#include <kernjit/utilities/error.hpp>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace kernjit {
namespace jit {

namespace {

constexpr int READ = 0, WRITE = 1;

[[noreturn]] void child_exec(std::vector<char*> const& args, int out_fd)
{
  // only async-signal-safe calls from here on
  int const null_fd = open("/dev/null", O_RDONLY);
  if (null_fd != -1) { dup2(null_fd, STDIN_FILENO); }
  dup2(out_fd, STDOUT_FILENO);
  dup2(out_fd, STDERR_FILENO);
  execv(args[0], args.data());

  char const prefix[] = "kernjit: failed to execute ";
  auto const reason   = std::strerror(errno);
  static_cast<void>(write(STDERR_FILENO, prefix, sizeof(prefix) - 1));
  static_cast<void>(write(STDERR_FILENO, args[0], std::strlen(args[0])));
  static_cast<void>(write(STDERR_FILENO, ": ", 2));
  static_cast<void>(write(STDERR_FILENO, reason, std::strlen(reason)));
  static_cast<void>(write(STDERR_FILENO, "\n", 1));
  _exit(127);
}

}  // namespace

process_result run_process(std::vector<std::string> const& argv)
{
  KERNJIT_EXPECTS(!argv.empty(), "Cannot run an empty command");

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (auto const& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  std::array<int, 2> out_pipe{-1, -1};
  if (pipe2(out_pipe.data(), O_CLOEXEC) == -1) {
    detail::throw_posix("Failed to create pipe for child process", "pipe2");
  }

  pid_t const pid = fork();
  if (pid == -1) {
    close(out_pipe[READ]);
    close(out_pipe[WRITE]);
    detail::throw_posix("Failed to fork child process", "fork");
  }

  if (pid == 0) { child_exec(args, out_pipe[WRITE]); }

  close(out_pipe[WRITE]);

  process_result result{0, {}};
  int read_error = 0;
  {
    KERNJIT_DEFER([&] { close(out_pipe[READ]); });
    std::array<char, 4096> buffer;
    while (true) {
      auto const n = read(out_pipe[READ], buffer.data(), buffer.size());
      if (n == 0) { break; }
      if (n == -1) {
        if (errno == EINTR) { continue; }
        read_error = errno;
        break;
      }
      result.output.append(buffer.data(), static_cast<std::size_t>(n));
    }
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) { detail::throw_posix("Failed to wait for child process", "waitpid"); }
  }

  if (read_error != 0) {
    errno = read_error;
    detail::throw_posix("Failed to read output of child process", "read");
  }

  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
  } else {
    result.exit_status = -1;
  }
  return result;
}

std::string format_command(std::vector<std::string> const& argv)
{
  std::string command;
  for (auto const& arg : argv) {
    if (!command.empty()) { command += ' '; }
    if (arg.find_first_of(" \t\"'") != std::string::npos) {
      command += '\'' + arg + '\'';
    } else {
      command += arg;
    }
  }
  return command;
}

}  // namespace jit
}  // namespace kernjit
