/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit_test/file_utilities.hpp>

#include <kernjit/jit_options.hpp>
#include <kernjit/toolchain.hpp>
#include <kernjit/utilities/error.hpp>
#include <kernjit/utilities/export.hpp>

#include <cuda_runtime_api.h>
#include <gtest/gtest.h>

#include <string>

#ifndef KERNJIT_TEST_HOST_COMPILER
#define KERNJIT_TEST_HOST_COMPILER "/usr/bin/c++"
#endif

namespace KERNJIT_EXPORT kernjit {
namespace test {

/**
 * @brief Returns the compiler tests build kernels with: the discovered nvcc, or the host C++
 * compiler the tests were configured with when no nvcc is available.
 *
 * Discovery runs once per test program.
 *
 * @return The toolchain
 */
inline kernjit::toolchain const& test_toolchain()
{
  static kernjit::toolchain const tc = [] {
    try {
      return kernjit::discover_toolchain(kernjit::jit_options{});
    } catch (kernjit::toolchain_not_found_error const&) {
      return kernjit::toolchain::from_path(KERNJIT_TEST_HOST_COMPILER);
    }
  }();
  return tc;
}

/**
 * @brief Indicates whether a CUDA device is usable by this process
 */
inline bool has_cuda_device()
{
  int count = 0;
  if (cudaGetDeviceCount(&count) != cudaSuccess) {
    cudaGetLastError();
    return false;
  }
  return count > 0;
}

/**
 * @brief Base test fixture class from which all libkernjit tests should inherit.
 */
class BaseFixture : public ::testing::Test {};

/**
 * @brief Base fixture for tests that build kernels; each test gets a private cache root.
 */
class JitFixture : public BaseFixture {
  temp_directory const _tmpdir{"kernjit-test"};

 public:
  /// @return The cache root used by `options()`
  [[nodiscard]] std::string cache_root() const { return _tmpdir.path() + "jit"; }

  /// @return Options with the private cache root and everything else at defaults
  [[nodiscard]] kernjit::jit_options options() const
  {
    kernjit::jit_options opts;
    opts.cache_dir = cache_root();
    return opts;
  }
};

class TempDirTestEnvironment : public ::testing::Environment {
  temp_directory const tmpdir{"gtest"};

 public:
  /**
   * @brief Get directory path to use for temporary files
   *
   * @return std::string The temporary directory path
   */
  std::string get_temp_dir() { return tmpdir.path(); }

  /**
   * @brief Get a temporary filepath to use for the specified filename
   *
   * @param filename name of the file to be placed in temporary directory.
   * @return std::string The temporary filepath
   */
  std::string get_temp_filepath(std::string filename) { return tmpdir.path() + filename; }
};

}  // namespace test
}  // namespace KERNJIT_EXPORT kernjit
