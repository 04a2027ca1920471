/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

namespace kernjit {
namespace jit {

/**
 * @brief Outcome of a child process run to completion.
 */
struct process_result {
  int exit_status;     ///< Exit code, or 128 + signal number if the child was killed
  std::string output;  ///< Everything the child wrote to stdout and stderr, interleaved
};

/**
 * @brief Runs `argv[0]` with arguments `argv[1..]`, waits for it, and captures its output.
 *
 * `argv[0]` must be a path; no `PATH` lookup is performed. The child's stdin is `/dev/null`.
 * A program that cannot be executed yields exit status 127 with the reason in `output`.
 *
 * @throw std::runtime_error if the pipe, fork or wait fails
 *
 * @param argv Program path followed by its arguments
 * @return The exit status and captured output
 */
process_result run_process(std::vector<std::string> const& argv);

/**
 * @brief Renders `argv` as one shell-like line for logs and error messages.
 *
 * @param argv Program path followed by its arguments
 * @return The command line
 */
std::string format_command(std::vector<std::string> const& argv);

}  // namespace jit
}  // namespace kernjit
