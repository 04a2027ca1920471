/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#include <string>
#include <vector>

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief Settings that control how kernels are compiled and cached.
 *
 * A default-constructed `jit_options` has an empty `cache_dir`; the runtime then falls back to
 * `default_cache_dir()`.
 */
struct jit_options {
  std::string cache_dir;                  ///< Cache root, `KERNJIT_CACHE_DIR`
  std::string compiler;                   ///< Compiler override, `KERNJIT_NVCC_COMPILER`
  bool disable_cache = false;             ///< Skip the memory and disk caches, `KERNJIT_DISABLE_CACHE`
  bool jit_debug     = false;             ///< Debug logging of builds, `KERNJIT_JIT_DEBUG`
  bool ptxas_verbose = false;             ///< Verbose ptxas output, `KERNJIT_PTXAS_VERBOSE`
  std::string gpu_arch;                   ///< Target architecture (e.g. `sm_90a`), `KERNJIT_GPU_ARCH`
  std::vector<std::string> extra_flags;   ///< Extra compiler flags, `KERNJIT_NVCC_FLAGS`
  std::vector<std::string> include_dirs;  ///< Extra include directories, `KERNJIT_INCLUDE_DIRS`

  /**
   * @brief Reads every option from its environment variable.
   *
   * Boolean variables are enabled by `ON` or `1`. `KERNJIT_NVCC_FLAGS` is split on whitespace
   * and `KERNJIT_INCLUDE_DIRS` on `:`. Each value read is logged at info level.
   *
   * @return The options
   */
  static jit_options from_environment();
};

/**
 * @brief Returns the cache root used when none is configured: `$HOME/.kernjit`, or
 * `kernjit` under the system temporary directory when `HOME` is unset.
 *
 * @return The default cache root
 */
std::string default_cache_dir();

}  // namespace KERNJIT_EXPORT kernjit
