/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit_test/base_fixture.hpp>

#include <kernjit/logger.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

namespace KERNJIT_EXPORT kernjit {
namespace test {

/**
 * @brief Returns the environment shared by all tests of a program
 */
inline TempDirTestEnvironment* temp_env()
{
  static TempDirTestEnvironment* env = static_cast<TempDirTestEnvironment*>(
    ::testing::AddGlobalTestEnvironment(new TempDirTestEnvironment));
  return env;
}

}  // namespace test
}  // namespace KERNJIT_EXPORT kernjit

/**
 * @brief Prepares the test process.
 *
 * - points `KERNJIT_CACHE_DIR` at a temporary directory unless it is already set, so the
 *   process-wide runtime never writes to the user's cache
 * - applies `GTEST_KERNJIT_LOG_LEVEL` (an spdlog level name) to the libkernjit logger
 */
inline void init_kernjit_test()
{
  auto* env = kernjit::test::temp_env();
  setenv("KERNJIT_CACHE_DIR", env->get_temp_filepath("kernjit").c_str(), 0);

  if (auto const* level = std::getenv("GTEST_KERNJIT_LOG_LEVEL"); level != nullptr) {
    kernjit::detail::logger().set_level(spdlog::level::from_str(level));
  }
}

/**
 * @brief Macro that defines main function for gtest programs that use libkernjit
 *
 * This `main` function is a wrapper around the google test generated `main`,
 * maintaining the original functionality.
 */
#define KERNJIT_TEST_PROGRAM_MAIN()         \
  int main(int argc, char** argv)           \
  {                                         \
    ::testing::InitGoogleTest(&argc, argv); \
    init_kernjit_test();                    \
    return RUN_ALL_TESTS();                 \
  }
