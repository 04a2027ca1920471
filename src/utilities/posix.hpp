/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/error.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace kernjit {
namespace detail {

/**
 * @brief Throws `std::runtime_error` describing the failure of a POSIX call, using the
 * current value of `errno`.
 *
 * @param message What was being attempted
 * @param syscall_name The failing call
 */
[[noreturn]] inline void throw_posix(std::string const& message, std::string const& syscall_name)
{
  auto const error_code = errno;
  auto const error_str  = message + ". `" + syscall_name + "` failed with " +
                         std::to_string(error_code) + " (" + std::strerror(error_code) + ")";
  KERNJIT_FAIL(error_str, std::runtime_error);
}

}  // namespace detail
}  // namespace kernjit
