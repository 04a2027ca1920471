/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#include <cuda_runtime_api.h>

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace KERNJIT_EXPORT kernjit {
/**
 * @addtogroup utility_error
 * @{
 * @file
 */

/**
 * @brief Exception thrown when logical precondition is violated.
 *
 * This exception should not be thrown directly and is instead thrown by the
 * KERNJIT_EXPECTS macro.
 */
struct logic_error : public std::logic_error {
  /**
   * @brief Constructs a logic_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  logic_error(char const* const message) : std::logic_error(message) {}

  /**
   * @brief Construct a new logic error object with error message
   *
   * @param message Message to be associated with the exception
   */
  logic_error(std::string const& message) : std::logic_error(message) {}
};

/**
 * @brief Exception thrown when a CUDA error is encountered.
 *
 */
struct cuda_error : public std::runtime_error {
  /**
   * @brief Construct a new cuda error object with error message and code.
   *
   * @param message Error message
   * @param error CUDA error code
   */
  cuda_error(std::string const& message, cudaError_t const& error)
    : std::runtime_error(message), _cudaError(error)
  {
  }

 public:
  /**
   * @brief Returns the CUDA error code associated with the exception.
   *
   * @return CUDA error code
   */
  [[nodiscard]] cudaError_t error_code() const { return _cudaError; }

 protected:
  cudaError_t _cudaError;  //!< CUDA error code
};

/**
 * @brief Exception thrown when a kernel argument cannot be classified into one of the
 * supported parameter kinds.
 *
 * Raised while a `kernjit::signature` is constructed, before any code is generated.
 */
struct argument_type_error : public std::invalid_argument {
  /**
   * @brief Constructs an argument_type_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  argument_type_error(char const* const message) : std::invalid_argument(message) {}

  /**
   * @brief Construct a new argument_type_error object with error message
   *
   * @param message Message to be associated with the exception
   */
  argument_type_error(std::string const& message) : std::invalid_argument(message) {}
};

/**
 * @brief Exception thrown when no usable native compiler can be discovered.
 */
struct toolchain_not_found_error : public std::runtime_error {
  /**
   * @brief Constructs a toolchain_not_found_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  toolchain_not_found_error(char const* const message) : std::runtime_error(message) {}

  /**
   * @brief Construct a new toolchain_not_found_error object with error message
   *
   * @param message Message to be associated with the exception
   */
  toolchain_not_found_error(std::string const& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when the native toolchain exits with a non-zero status.
 *
 * Carries the output captured from the compiler so callers can report it.
 */
struct compile_error : public std::runtime_error {
  /**
   * @brief Construct a new compile_error
   *
   * @param message Error message
   * @param command The compiler invocation, as a single shell-like line
   * @param exit_status The exit status reported by the compiler process
   * @param diagnostics Everything the compiler wrote to stdout and stderr
   */
  compile_error(std::string const& message,
                std::string command,
                int exit_status,
                std::string diagnostics)
    : std::runtime_error(message + "\n" + diagnostics),
      _command(std::move(command)),
      _exit_status(exit_status),
      _diagnostics(std::move(diagnostics))
  {
  }

  /**
   * @brief Returns the compiler invocation that failed
   *
   * @return The command line
   */
  [[nodiscard]] std::string const& command() const { return _command; }

  /**
   * @brief Returns the exit status of the compiler process
   *
   * @return The exit status
   */
  [[nodiscard]] int exit_status() const { return _exit_status; }

  /**
   * @brief Returns the diagnostic output captured from the compiler
   *
   * @return The captured output
   */
  [[nodiscard]] std::string const& diagnostics() const { return _diagnostics; }

 private:
  std::string _command;
  int _exit_status;
  std::string _diagnostics;
};

/**
 * @brief Exception thrown when an on-disk cache entry fails its integrity check.
 *
 * Never escapes `kernjit::runtime::build`; the entry is evicted and rebuilt instead.
 */
struct cache_corruption_error : public std::runtime_error {
  /**
   * @brief Constructs a cache_corruption_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  cache_corruption_error(char const* const message) : std::runtime_error(message) {}

  /**
   * @brief Construct a new cache_corruption_error object with error message
   *
   * @param message Message to be associated with the exception
   */
  cache_corruption_error(std::string const& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a compiled artifact cannot be loaded or lacks an expected
 * exported symbol.
 */
struct load_error : public std::runtime_error {
  /**
   * @brief Constructs a load_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  load_error(char const* const message) : std::runtime_error(message) {}

  /**
   * @brief Construct a new load_error object with error message
   *
   * @param message Message to be associated with the exception
   */
  load_error(std::string const& message) : std::runtime_error(message) {}
};

/**
 * @brief Exception thrown when a kernel is invoked with the wrong number or kinds of
 * arguments.
 *
 * Always raised before the native entry point is called.
 */
struct invocation_arity_error : public std::invalid_argument {
  /**
   * @brief Constructs an invocation_arity_error with the error message.
   *
   * @param message Message to be associated with the exception
   */
  invocation_arity_error(char const* const message) : std::invalid_argument(message) {}

  /**
   * @brief Construct a new invocation_arity_error object with error message
   *
   * @param message Message to be associated with the exception
   */
  invocation_arity_error(std::string const& message) : std::invalid_argument(message) {}
};
/** @} */

}  // namespace KERNJIT_EXPORT kernjit

#define STRINGIFY_DETAIL(x)  #x                   ///< Stringify a macro argument
#define KERNJIT_STRINGIFY(x) STRINGIFY_DETAIL(x)  ///< Stringify a macro argument

/**
 * @addtogroup utility_error
 * @{
 */

/**
 * @brief Macro for checking (pre-)conditions that throws an exception when
 * a condition is violated.
 *
 * Defaults to throwing `kernjit::logic_error`, but a custom exception may also be
 * specified.
 *
 * Example usage:
 * ```
 * // throws kernjit::logic_error
 * KERNJIT_EXPECTS(p != nullptr, "Unexpected null pointer");
 *
 * // throws std::runtime_error
 * KERNJIT_EXPECTS(p != nullptr, "Unexpected nullptr", std::runtime_error);
 * ```
 * @param ... This macro accepts either two or three arguments:
 *   - The first argument must be an expression that evaluates to true or
 *     false, and is the condition being checked.
 *   - The second argument is a string used to construct the `what` of
 *     the exception.
 *   - When given, the third argument is the exception to be thrown. When not
 *     specified, defaults to `kernjit::logic_error`.
 * @throw `_exception_type` if the condition evaluates to 0 (false).
 */
#define KERNJIT_EXPECTS(...)                                                   \
  GET_KERNJIT_EXPECTS_MACRO(__VA_ARGS__, KERNJIT_EXPECTS_3, KERNJIT_EXPECTS_2) \
  (__VA_ARGS__)

/// @cond

#define GET_KERNJIT_EXPECTS_MACRO(_1, _2, _3, NAME, ...) NAME

#define KERNJIT_EXPECTS_3(_condition, _reason, _exception_type)                           \
  do {                                                                                    \
    static_assert(std::is_base_of_v<std::exception, _exception_type>);                    \
    (_condition) ? static_cast<void>(0)                                                   \
                 : throw _exception_type /*NOLINT(bugprone-macro-parentheses)*/           \
      {std::string{"KERNJIT failure at: " __FILE__ ":" KERNJIT_STRINGIFY(__LINE__) ": "} + \
       (_reason)};                                                                        \
  } while (0)

#define KERNJIT_EXPECTS_2(_condition, _reason) \
  KERNJIT_EXPECTS_3(_condition, _reason, kernjit::logic_error)

/// @endcond

/**
 * @brief Indicates that an erroneous code path has been taken.
 *
 * Example usage:
 * ```c++
 * // Throws `kernjit::logic_error`
 * KERNJIT_FAIL("Unsupported code path");
 *
 * // Throws `std::runtime_error`
 * KERNJIT_FAIL("Unsupported code path", std::runtime_error);
 * ```
 *
 * @param ... This macro accepts either one or two arguments:
 *   - The first argument is a string used to construct the `what` of
 *     the exception.
 *   - When given, the second argument is the exception to be thrown. When not
 *     specified, defaults to `kernjit::logic_error`.
 * @throw `_exception_type` if the condition evaluates to 0 (false).
 */
#define KERNJIT_FAIL(...)                                             \
  GET_KERNJIT_FAIL_MACRO(__VA_ARGS__, KERNJIT_FAIL_2, KERNJIT_FAIL_1) \
  (__VA_ARGS__)

/// @cond

#define GET_KERNJIT_FAIL_MACRO(_1, _2, NAME, ...) NAME

#define KERNJIT_FAIL_2(_what, _exception_type)                                           \
  /*NOLINTNEXTLINE(bugprone-macro-parentheses)*/                                         \
  throw _exception_type                                                                  \
  {                                                                                      \
    std::string{"KERNJIT failure at: " __FILE__ ":" KERNJIT_STRINGIFY(__LINE__) ": "} + \
      (_what)                                                                            \
  }

#define KERNJIT_FAIL_1(_what) KERNJIT_FAIL_2(_what, kernjit::logic_error)

/// @endcond

namespace kernjit {
namespace detail {
// @cond
inline void throw_cuda_error(cudaError_t error, char const* file, unsigned int line)
{
  // Calls cudaGetLastError to clear the error status.
  cudaGetLastError();
  auto const msg = std::string{"CUDA error encountered at: " + std::string{file} + ":" +
                               std::to_string(line) + ": " + std::to_string(error) + " " +
                               cudaGetErrorName(error) + " " + cudaGetErrorString(error)};
  throw cuda_error{msg, error};
}
// @endcond
}  // namespace detail
}  // namespace kernjit

/**
 * @brief Error checking macro for CUDA runtime API functions.
 *
 * Invokes a CUDA runtime API function call, if the call does not return
 * cudaSuccess, invokes cudaGetLastError() to clear the error and throws an
 * exception detailing the CUDA error that occurred
 */
#define KERNJIT_CUDA_TRY(call)                                                                    \
  do {                                                                                            \
    cudaError_t const status = (call);                                                            \
    if (cudaSuccess != status) { kernjit::detail::throw_cuda_error(status, __FILE__, __LINE__); } \
  } while (0);
/** @} */
