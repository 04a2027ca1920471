/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/logger.hpp>

#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>

namespace kernjit {
namespace detail {

/**
 * @brief Returns the value of the environment variable, or a default value if the variable is not
 * present.
 */
template <typename T>
T getenv_or(std::string_view env_var_name, T default_val)
{
  std::string const name{env_var_name};
  auto const env_val = std::getenv(name.c_str());
  if (env_val != nullptr) {
    KERNJIT_LOG_INFO("Environment variable {} read as {}", name, env_val);
  } else {
    std::stringstream ss;
    ss << default_val;
    KERNJIT_LOG_INFO("Environment variable {} is not set, using default value {}", name, ss.str());
  }

  if (env_val == nullptr) { return default_val; }

  std::stringstream sstream(env_val);
  T converted_val;
  sstream >> converted_val;
  return converted_val;
}

/**
 * @brief Specialization for strings, which keeps embedded whitespace.
 */
template <>
inline std::string getenv_or<std::string>(std::string_view env_var_name, std::string default_val)
{
  std::string const name{env_var_name};
  auto const env_val = std::getenv(name.c_str());
  if (env_val == nullptr) {
    KERNJIT_LOG_INFO(
      "Environment variable {} is not set, using default value {}", name, default_val);
    return default_val;
  }
  KERNJIT_LOG_INFO("Environment variable {} read as {}", name, env_val);
  return std::string{env_val};
}

/**
 * @brief Reads a boolean environment variable; `ON` and `1` enable it.
 */
inline bool getenv_flag(std::string_view env_var_name, bool default_val = false)
{
  auto const value = getenv_or<std::string>(env_var_name, default_val ? "ON" : "OFF");
  return value == "ON" || value == "1";
}

}  // namespace detail
}  // namespace kernjit
