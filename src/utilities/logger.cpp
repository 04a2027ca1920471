/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit/logger.hpp>
#include <kernjit/utilities/export.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace KERNJIT_EXPORT kernjit {

spdlog::sink_ptr default_logger_sink()
{
  auto* filename = std::getenv("KERNJIT_DEBUG_LOG_FILE");
  if (filename != nullptr) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
  }
  return std::make_shared<spdlog::sinks::stderr_sink_mt>();
}

std::string default_logger_pattern() { return "[%6t][%H:%M:%S:%f][%-6l] %v"; }

namespace detail {

spdlog::logger& logger()
{
  static spdlog::logger logger_ = [] {
    spdlog::logger logger_{"KERNJIT", {default_logger_sink()}};
    logger_.set_pattern(default_logger_pattern());
    logger_.set_level(spdlog::level::warn);
    return logger_;
  }();
  return logger_;
}

}  // namespace detail
}  // namespace KERNJIT_EXPORT kernjit
