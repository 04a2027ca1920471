/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/jit_options.hpp>
#include <kernjit/kernel.hpp>
#include <kernjit/signature.hpp>
#include <kernjit/toolchain.hpp>
#include <kernjit/utilities/export.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief Counters describing how build requests were satisfied.
 */
struct build_statistics {
  std::size_t memory_hits         = 0;  ///< Served from the loaded-kernel table
  std::size_t disk_hits           = 0;  ///< Served from a verified on-disk entry
  std::size_t compilations        = 0;  ///< Successful compiler runs
  std::size_t failed_compilations = 0;  ///< Compiler runs that raised `compile_error`
  std::size_t corrupt_evictions   = 0;  ///< On-disk entries evicted after failing verification
};

/**
 * @brief Owns the toolchain, the artifact cache and the loaded kernels of one JIT session.
 *
 * A runtime is safe to use from many threads. Requests for the same kernel share one build:
 * the first requester compiles while the others wait for its result. Requests from other
 * processes race benignly on the on-disk cache, where entries are installed atomically.
 *
 * Kernels returned by `build` stay usable after the runtime is destroyed.
 */
class runtime {
 public:
  /**
   * @brief Creates a runtime that discovers its toolchain on first use
   *
   * @param options The JIT options
   */
  explicit runtime(jit_options options = jit_options::from_environment());

  /**
   * @brief Creates a runtime that compiles with `tc`
   *
   * @param options The JIT options
   * @param tc The compiler to use
   */
  runtime(jit_options options, toolchain tc);

  ~runtime();

  runtime(runtime const&)            = delete;
  runtime& operator=(runtime const&) = delete;
  runtime(runtime&&)                 = delete;
  runtime& operator=(runtime&&)      = delete;

  /**
   * @brief Returns a callable kernel for `source`, compiling it only if no cached artifact
   * exists.
   *
   * The cache key covers the library version, the compiler identity, the compiler flags, the
   * name, the signature and the source. A corrupt on-disk entry is evicted and rebuilt; a failed
   * compilation is not cached.
   *
   * @throw kernjit::logic_error if `name` is empty or contains characters other than
   * `[A-Za-z0-9_]`
   * @throw kernjit::toolchain_not_found_error if no compiler can be discovered
   * @throw kernjit::compile_error if the compiler rejects `source`
   * @throw kernjit::load_error if a freshly compiled artifact cannot be loaded
   *
   * @param name Kernel name, part of the cache entry name
   * @param sig The signature `source` was generated from
   * @param source Generated source, as returned by `kernjit::generate`
   * @return The bound kernel
   */
  kernel build(std::string const& name, signature const& sig, std::string const& source);

  /**
   * @brief Returns the toolchain, discovering it on first call
   *
   * @throw kernjit::toolchain_not_found_error if no compiler can be discovered
   *
   * @return The toolchain
   */
  toolchain const& get_toolchain();

  /// @return The options the runtime was created with
  [[nodiscard]] jit_options const& options() const noexcept;

  /// @return The cache root
  [[nodiscard]] std::string const& cache_dir() const noexcept;

  /// @return A snapshot of the build counters
  [[nodiscard]] build_statistics get_statistics() const;

  /// @brief Resets every build counter to zero
  void clear_statistics();

  /// @return The number of kernels in the loaded-kernel table
  [[nodiscard]] std::size_t loaded_kernel_count() const;

 private:
  struct impl;
  std::unique_ptr<impl> _impl;
};

/**
 * @brief Creates the process-wide runtime.
 *
 * @throw kernjit::logic_error if it already exists
 *
 * @param options The JIT options
 */
void initialize(jit_options options = jit_options::from_environment());

/**
 * @brief Destroys the process-wide runtime; a later `get_runtime` creates a new one.
 */
void deinitialize();

/**
 * @brief Returns the process-wide runtime, creating it from the environment if needed
 *
 * @return The runtime
 */
runtime& get_runtime();

/**
 * @brief Builds a kernel with the process-wide runtime
 *
 * @copydetails runtime::build
 */
kernel build(std::string const& name, signature const& sig, std::string const& source);

}  // namespace KERNJIT_EXPORT kernjit
