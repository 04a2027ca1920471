/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/process.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/toolchain.hpp>
#include <kernjit/utilities/error.hpp>

#include <cuda_runtime_api.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#ifndef KERNJIT_CUDA_TOOLKIT_BIN_DIR
#define KERNJIT_CUDA_TOOLKIT_BIN_DIR ""
#endif

#ifndef KERNJIT_CUDA_INCLUDE_DIR
#define KERNJIT_CUDA_INCLUDE_DIR ""
#endif

namespace kernjit {

namespace {

constexpr char const* nvcc_marker = "Cuda compilation tools";

constexpr char const cuda_toolkit_bin_dir[] = KERNJIT_CUDA_TOOLKIT_BIN_DIR;
constexpr char const cuda_include_dir[]     = KERNJIT_CUDA_INCLUDE_DIR;

// fp8 element types need at least this nvcc release
constexpr int min_nvcc_major = 12;
constexpr int min_nvcc_minor = 3;

bool is_executable_file(std::string const& path)
{
  struct stat info {};
  if (stat(path.c_str(), &info) != 0) { return false; }
  return S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string find_on_path(std::string const& program)
{
  auto const* path_env = std::getenv("PATH");
  if (path_env == nullptr) { return {}; }
  std::istringstream dirs{path_env};
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) { continue; }
    auto candidate = dir + "/" + program;
    if (is_executable_file(candidate)) { return candidate; }
  }
  return {};
}

std::string getenv_string(char const* name)
{
  auto const* value = std::getenv(name);
  return value == nullptr ? std::string{} : std::string{value};
}

// "sm_90a", "compute_90a" and "90a" all name architecture "90a"
std::string normalize_arch(std::string const& arch)
{
  auto const underscore = arch.find('_');
  return underscore == std::string::npos ? arch : arch.substr(underscore + 1);
}

void warn_if_outdated(toolchain const& tc)
{
  if (tc.kind() != toolchain_kind::NVCC) { return; }
  if (tc.version_major() < min_nvcc_major ||
      (tc.version_major() == min_nvcc_major && tc.version_minor() < min_nvcc_minor)) {
    KERNJIT_LOG_WARN("nvcc {}.{} at {} is older than {}.{}; fp8 kernels will not compile",
                     tc.version_major(),
                     tc.version_minor(),
                     tc.path(),
                     min_nvcc_major,
                     min_nvcc_minor);
  }
}

std::string current_device_arch()
{
  int device = 0;
  int major  = 0;
  int minor  = 0;
  if (cudaGetDevice(&device) != cudaSuccess ||
      cudaDeviceGetAttribute(&major, cudaDevAttrComputeCapabilityMajor, device) != cudaSuccess ||
      cudaDeviceGetAttribute(&minor, cudaDevAttrComputeCapabilityMinor, device) != cudaSuccess) {
    // clear the sticky error state left by the failed query
    cudaGetLastError();
    KERNJIT_LOG_INFO("No CUDA device available, compiling without an explicit architecture");
    return {};
  }
  return std::to_string(major * 10 + minor);
}

}  // namespace

toolchain::toolchain(
  std::string path, toolchain_kind kind, std::string banner, int version_major, int version_minor)
  : _path{std::move(path)},
    _kind{kind},
    _banner{std::move(banner)},
    _version_major{version_major},
    _version_minor{version_minor}
{
}

toolchain toolchain::from_path(std::string const& path)
{
  KERNJIT_FUNC_RANGE();

  KERNJIT_EXPECTS(
    is_executable_file(path), path + " is not an executable file", toolchain_not_found_error);

  auto const result = jit::run_process({path, "--version"});
  KERNJIT_EXPECTS(result.exit_status == 0,
                  path + " --version exited with status " + std::to_string(result.exit_status),
                  toolchain_not_found_error);

  auto const is_nvcc = result.output.find(nvcc_marker) != std::string::npos;
  std::istringstream lines{result.output};
  std::string line;
  std::string first_line;
  while (std::getline(lines, line)) {
    if (first_line.empty() && !line.empty()) { first_line = line; }
    if (!is_nvcc || line.find("release ") == std::string::npos) { continue; }

    // "Cuda compilation tools, release 12.4, V12.4.131"
    auto const version = line.substr(line.find("release ") + 8);
    int major          = 0;
    int minor          = 0;
    std::istringstream parts{version};
    char dot = 0;
    parts >> major >> dot >> minor;
    return toolchain{path, toolchain_kind::NVCC, line, major, minor};
  }
  return toolchain{path, toolchain_kind::HOST, first_line};
}

std::string toolchain::identity() const { return _path + "\n" + _banner; }

std::vector<std::string> toolchain::flags(jit_options const& options) const
{
  std::vector<std::string> result;
  if (_kind == toolchain_kind::NVCC) {
    result = {"-std=c++17", "-shared", "-O3", "--expt-relaxed-constexpr", "--expt-extended-lambda"};
    auto const arch =
      options.gpu_arch.empty() ? current_device_arch() : normalize_arch(options.gpu_arch);
    if (!arch.empty()) {
      result.push_back("-gencode=arch=compute_" + arch + ",code=sm_" + arch);
    }
    if (options.ptxas_verbose) { result.emplace_back("--ptxas-options=--verbose"); }
    result.insert(result.end(), {"-Xcompiler", "-fPIC", "-Xcompiler", "-Wno-abi"});
  } else {
    result = {"-std=c++17", "-shared", "-fPIC", "-O2"};
    if (cuda_include_dir[0] != '\0') { result.emplace_back(std::string{"-I"} + cuda_include_dir); }
  }
  for (auto const& dir : options.include_dirs) {
    result.push_back("-I" + dir);
  }
  result.insert(result.end(), options.extra_flags.begin(), options.extra_flags.end());
  return result;
}

toolchain discover_toolchain(jit_options const& options)
{
  KERNJIT_FUNC_RANGE();

  if (!options.compiler.empty()) {
    auto path = options.compiler.find('/') == std::string::npos ? find_on_path(options.compiler)
                                                                 : options.compiler;
    KERNJIT_EXPECTS(!path.empty(),
                    "KERNJIT_NVCC_COMPILER names " + options.compiler + ", which is not on PATH",
                    toolchain_not_found_error);
    auto tc = toolchain::from_path(path);
    warn_if_outdated(tc);
    KERNJIT_LOG_INFO("Using compiler override {} ({})", tc.path(), tc.banner());
    return tc;
  }

  std::vector<std::string> candidates;
  for (auto const* var : {"CUDA_HOME", "CUDA_PATH"}) {
    auto const root = getenv_string(var);
    if (!root.empty()) { candidates.push_back(root + "/bin/nvcc"); }
  }
  if (auto on_path = find_on_path("nvcc"); !on_path.empty()) { candidates.push_back(on_path); }
  if (cuda_toolkit_bin_dir[0] != '\0') {
    candidates.push_back(std::string{cuda_toolkit_bin_dir} + "/nvcc");
  }
  candidates.emplace_back("/usr/local/cuda/bin/nvcc");
  candidates.emplace_back("/opt/cuda/bin/nvcc");

  std::string probed;
  for (auto const& candidate : candidates) {
    probed += "\n  " + candidate;
    if (!is_executable_file(candidate)) { continue; }
    try {
      auto tc = toolchain::from_path(candidate);
      if (tc.kind() != toolchain_kind::NVCC) {
        KERNJIT_LOG_WARN("{} does not identify as nvcc, skipping", candidate);
        continue;
      }
      warn_if_outdated(tc);
      KERNJIT_LOG_INFO("Discovered nvcc {} ({})", tc.path(), tc.banner());
      return tc;
    } catch (toolchain_not_found_error const& e) {
      KERNJIT_LOG_WARN("Skipping unusable compiler candidate: {}", e.what());
    }
  }

  KERNJIT_FAIL("No usable CUDA compiler found; probed:" + probed +
                 "\nSet KERNJIT_NVCC_COMPILER or CUDA_HOME to select one",
               toolchain_not_found_error);
}

}  // namespace kernjit
