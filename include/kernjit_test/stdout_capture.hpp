/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/error.hpp>
#include <kernjit/utilities/export.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <iostream>
#include <string>

namespace KERNJIT_EXPORT kernjit {
namespace test {

/**
 * @brief Redirects the process's stdout file descriptor into a pipe while alive.
 *
 * Captures output written through any stdout handle in the process, including from
 * dynamically loaded code. Output must stay below the pipe capacity (64 KiB on Linux).
 *
 * Example:
 * @code{.cpp}
 * kernjit::test::stdout_capture capture;
 * std::cout << "hello" << std::endl;
 * auto text = capture.release();  // "hello\n"
 * @endcode
 */
class stdout_capture {
 public:
  stdout_capture()
  {
    std::cout.flush();
    std::fflush(stdout);
    KERNJIT_EXPECTS(pipe(_pipe.data()) == 0, "Failed to create capture pipe", std::runtime_error);
    _saved = dup(STDOUT_FILENO);
    KERNJIT_EXPECTS(_saved != -1, "Failed to duplicate stdout", std::runtime_error);
    KERNJIT_EXPECTS(dup2(_pipe[1], STDOUT_FILENO) != -1,
                    "Failed to redirect stdout",
                    std::runtime_error);
    close(_pipe[1]);
    _pipe[1] = -1;
  }

  stdout_capture(stdout_capture const&)            = delete;
  stdout_capture& operator=(stdout_capture const&) = delete;

  ~stdout_capture()
  {
    if (_saved != -1) { restore(); }
    if (_pipe[0] != -1) { close(_pipe[0]); }
  }

  /**
   * @brief Restores stdout and returns everything written while it was redirected
   *
   * @return The captured text
   */
  std::string release()
  {
    restore();
    std::string captured;
    std::array<char, 4096> buffer;
    ssize_t n = 0;
    while ((n = read(_pipe[0], buffer.data(), buffer.size())) > 0) {
      captured.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return captured;
  }

 private:
  void restore()
  {
    std::cout.flush();
    std::fflush(stdout);
    // closes the last write end, so reads of the pipe end at the captured text
    dup2(_saved, STDOUT_FILENO);
    close(_saved);
    _saved = -1;
  }

  std::array<int, 2> _pipe{-1, -1};
  int _saved = -1;
};

}  // namespace test
}  // namespace KERNJIT_EXPORT kernjit
