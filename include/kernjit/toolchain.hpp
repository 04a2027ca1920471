/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/jit_options.hpp>
#include <kernjit/utilities/export.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief The family of a native compiler, which selects its command-line dialect.
 */
enum class toolchain_kind : int8_t {
  NVCC,  ///< The CUDA compiler driver
  HOST   ///< A host C++ compiler with a GCC-compatible command line
};

/**
 * @brief A located and identified native compiler.
 */
class toolchain {
 public:
  /**
   * @brief Constructs a toolchain description without probing the compiler
   *
   * @param path Absolute path of the compiler executable
   * @param kind Command-line dialect of the compiler
   * @param banner The line of `--version` output that identifies the compiler
   * @param version_major Major version, 0 if unknown
   * @param version_minor Minor version, 0 if unknown
   */
  toolchain(std::string path,
            toolchain_kind kind,
            std::string banner,
            int version_major = 0,
            int version_minor = 0);

  /**
   * @brief Probes the compiler at `path` by running `<path> --version`.
   *
   * Output containing "Cuda compilation tools" identifies nvcc, whose "release X.Y" is parsed;
   * anything else is treated as a host compiler.
   *
   * @throw kernjit::toolchain_not_found_error if `path` is not an executable file or
   * `--version` does not exit with status 0
   *
   * @param path Path of the compiler executable
   * @return The identified toolchain
   */
  static toolchain from_path(std::string const& path);

  /// @return Path of the compiler executable
  [[nodiscard]] std::string const& path() const noexcept { return _path; }

  /// @return Command-line dialect of the compiler
  [[nodiscard]] toolchain_kind kind() const noexcept { return _kind; }

  /// @return The version banner line
  [[nodiscard]] std::string const& banner() const noexcept { return _banner; }

  /// @return Major version, 0 if unknown
  [[nodiscard]] int version_major() const noexcept { return _version_major; }

  /// @return Minor version, 0 if unknown
  [[nodiscard]] int version_minor() const noexcept { return _version_minor; }

  /**
   * @brief Returns the identity of the compiler, which participates in every cache key.
   *
   * @return The path and banner, separated by a newline
   */
  [[nodiscard]] std::string identity() const;

  /**
   * @brief Returns the flags passed to every compilation, before the output and input files.
   *
   * For nvcc the target architecture is taken from `options.gpu_arch`, else from the compute
   * capability of the current device, and is omitted when neither is available.
   *
   * @param options The JIT options
   * @return The compiler flags
   */
  [[nodiscard]] std::vector<std::string> flags(jit_options const& options) const;

 private:
  std::string _path;
  toolchain_kind _kind;
  std::string _banner;
  int _version_major;
  int _version_minor;
};

/**
 * @brief Locates the native compiler.
 *
 * Candidates are probed in order and the first usable one wins:
 * 1. `options.compiler` (from `KERNJIT_NVCC_COMPILER`); when set, no other location is tried
 * 2. `$CUDA_HOME/bin/nvcc`, then `$CUDA_PATH/bin/nvcc`
 * 3. `nvcc` on `PATH`
 * 4. the CUDA toolkit found when libkernjit was configured, then `/usr/local/cuda/bin/nvcc`
 *    and `/opt/cuda/bin/nvcc`
 *
 * @throw kernjit::toolchain_not_found_error listing every probed location if none is usable,
 * or if the override is set but unusable
 *
 * @param options The JIT options
 * @return The discovered toolchain
 */
toolchain discover_toolchain(jit_options const& options);

}  // namespace KERNJIT_EXPORT kernjit
