/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace KERNJIT_EXPORT kernjit {

namespace detail {
/**
 * @brief Returns the global logger.
 *
 * This is a global instance of a spdlog logger. It can be used to configure logging behavior in
 * libkernjit.
 *
 * Examples:
 * @code{.cpp}
 * // Turn off logging at runtime
 * kernjit::detail::logger().set_level(spdlog::level::off);
 * // Add a stdout sink to the logger
 * kernjit::detail::logger().sinks().push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
 * // Replace the default sink
 * kernjit::detail::logger().sinks() = {std::make_shared<spdlog::sinks::stderr_sink_mt>()};
 * @endcode
 *
 * Note: Changes to the sinks are not thread safe and should only be done during global
 * initialization.
 *
 * @return spdlog::logger& The logger.
 */
spdlog::logger& logger();
}  // namespace detail

/**
 * @brief Returns the default sink for the global logger.
 *
 * If the environment variable `KERNJIT_DEBUG_LOG_FILE` is defined, the default sink is a sink to
 * that file. Otherwise, the default is to dump to stderr.
 *
 * @return spdlog::sink_ptr The sink to use
 */
spdlog::sink_ptr default_logger_sink();

/**
 * @brief Returns the default log pattern for the global logger.
 *
 * @return std::string The default log pattern.
 */
std::string default_logger_pattern();

}  // namespace KERNJIT_EXPORT kernjit

// Log messages that require computation should only be used at level TRACE and DEBUG
#define KERNJIT_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(&kernjit::detail::logger(), __VA_ARGS__)
#define KERNJIT_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(&kernjit::detail::logger(), __VA_ARGS__)
#define KERNJIT_LOG_INFO(...)     SPDLOG_LOGGER_INFO(&kernjit::detail::logger(), __VA_ARGS__)
#define KERNJIT_LOG_WARN(...)     SPDLOG_LOGGER_WARN(&kernjit::detail::logger(), __VA_ARGS__)
#define KERNJIT_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(&kernjit::detail::logger(), __VA_ARGS__)
#define KERNJIT_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(&kernjit::detail::logger(), __VA_ARGS__)
