/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utilities/getenv_or.hpp"

#include <kernjit/jit_options.hpp>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace kernjit {

namespace {

std::vector<std::string> split_whitespace(std::string const& text)
{
  std::vector<std::string> tokens;
  std::istringstream stream{text};
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::vector<std::string> split_paths(std::string const& text)
{
  std::vector<std::string> paths;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find(':', start);
    if (end == std::string::npos) { end = text.size(); }
    if (end > start) { paths.push_back(text.substr(start, end - start)); }
    start = end + 1;
  }
  return paths;
}

}  // namespace

std::string default_cache_dir()
{
  if (auto const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return std::string{home} + "/.kernjit";
  }
  auto const* tmp = std::getenv("TMPDIR");
  return std::string{(tmp != nullptr && *tmp != '\0') ? tmp : "/tmp"} + "/kernjit";
}

jit_options jit_options::from_environment()
{
  jit_options options;
  options.cache_dir     = detail::getenv_or<std::string>("KERNJIT_CACHE_DIR", default_cache_dir());
  options.compiler      = detail::getenv_or<std::string>("KERNJIT_NVCC_COMPILER", "");
  options.disable_cache = detail::getenv_flag("KERNJIT_DISABLE_CACHE");
  options.jit_debug     = detail::getenv_flag("KERNJIT_JIT_DEBUG");
  options.ptxas_verbose = detail::getenv_flag("KERNJIT_PTXAS_VERBOSE");
  options.gpu_arch      = detail::getenv_or<std::string>("KERNJIT_GPU_ARCH", "");
  options.extra_flags = split_whitespace(detail::getenv_or<std::string>("KERNJIT_NVCC_FLAGS", ""));
  options.include_dirs = split_paths(detail::getenv_or<std::string>("KERNJIT_INCLUDE_DIRS", ""));
  return options;
}

}  // namespace kernjit
