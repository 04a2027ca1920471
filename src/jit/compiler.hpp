/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/toolchain.hpp>

#include <string>
#include <vector>

namespace kernjit {
namespace jit {

/**
 * @brief Record of a successful compiler run.
 */
struct compilation {
  std::string command;  ///< The full compiler invocation
  int exit_status;      ///< Always 0 for a returned compilation
  std::string output;   ///< Captured compiler output (warnings, verbose ptxas output)
};

/**
 * @brief Compiles `source_path` into the shared object `artifact_path`.
 *
 * @throw kernjit::compile_error carrying the captured output if the compiler exits with a
 * non-zero status
 *
 * @param tc The compiler
 * @param flags Flags placed before the output and input files
 * @param source_path Generated source file
 * @param artifact_path Shared object to produce
 * @return The compiler invocation and its output
 */
compilation compile(toolchain const& tc,
                    std::vector<std::string> const& flags,
                    std::string const& source_path,
                    std::string const& artifact_path);

}  // namespace jit
}  // namespace kernjit
