/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/compiler.hpp"

#include "jit/process.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/utilities/error.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace kernjit {
namespace jit {

compilation compile(toolchain const& tc,
                    std::vector<std::string> const& flags,
                    std::string const& source_path,
                    std::string const& artifact_path)
{
  KERNJIT_FUNC_RANGE();

  std::vector<std::string> argv{tc.path()};
  argv.insert(argv.end(), flags.begin(), flags.end());
  argv.insert(argv.end(), {"-o", artifact_path});
  // host compilers do not know the .cu extension
  if (tc.kind() == toolchain_kind::HOST) { argv.insert(argv.end(), {"-x", "c++"}); }
  argv.push_back(source_path);

  auto const command = format_command(argv);
  KERNJIT_LOG_DEBUG("Compiling: {}", command);

  auto const start  = std::chrono::steady_clock::now();
  auto result       = run_process(argv);
  auto const end    = std::chrono::steady_clock::now();
  auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

  if (result.exit_status != 0) {
    if (result.output.empty()) {
      result.output = "compiler exited with status " + std::to_string(result.exit_status) +
                      " without diagnostics\n";
    }
    KERNJIT_LOG_ERROR("Compilation failed with exit status {} after {} ms: {}\n{}",
                      result.exit_status,
                      millis,
                      command,
                      result.output);
    throw compile_error{"JIT compilation of " + source_path + " failed with exit status " +
                          std::to_string(result.exit_status) + ": " + command,
                        command,
                        result.exit_status,
                        result.output};
  }

  KERNJIT_LOG_INFO("Compiled {} in {} ms", artifact_path, millis);
  if (!result.output.empty()) { KERNJIT_LOG_DEBUG("Compiler output:\n{}", result.output); }
  return compilation{command, result.exit_status, std::move(result.output)};
}

}  // namespace jit
}  // namespace kernjit
