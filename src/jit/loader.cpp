/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/loader.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/utilities/error.hpp>

#include <dlfcn.h>
#include <sys/stat.h>

#include <memory>
#include <string>
#include <utility>

namespace kernjit {
namespace jit {

namespace {

std::string last_dl_error()
{
  auto const* error = dlerror();
  return error == nullptr ? std::string{"unknown error"} : std::string{error};
}

}  // namespace

shared_library::shared_library(std::string path, void* handle)
  : _path{std::move(path)}, _handle{handle}
{
}

shared_library::shared_library(shared_library&& other) noexcept
  : _path{std::move(other._path)}, _handle{other._handle}
{
  other._handle = nullptr;
}

shared_library::~shared_library()
{
  if (_handle != nullptr && dlclose(_handle) != 0) {
    KERNJIT_LOG_WARN("Failed to unload {}: {}", _path, last_dl_error());
  }
}

shared_library shared_library::open(std::string const& path)
{
  KERNJIT_FUNC_RANGE();

  struct stat info {};
  KERNJIT_EXPECTS(stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode),
                  "JIT artifact not found: " + path,
                  load_error);

  auto* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  KERNJIT_EXPECTS(
    handle != nullptr, "Failed to load JIT artifact " + path + ": " + last_dl_error(), load_error);
  return shared_library{path, handle};
}

void* shared_library::symbol(char const* name) const
{
  KERNJIT_EXPECTS(_handle != nullptr, "JIT artifact " + _path + " is not loaded", load_error);
  // clear any stale error so a null symbol value can be told apart from a missing one
  dlerror();
  auto* address = dlsym(_handle, name);
  KERNJIT_EXPECTS(address != nullptr,
                  "JIT artifact " + _path + " does not export `" + name + "`: " + last_dl_error(),
                  load_error);
  return address;
}

shared_library load(std::string const& path)
{
  auto library = shared_library::open(path);
  static_cast<void>(library.symbol(entry_symbol));
  static_cast<void>(library.symbol(packed_entry_symbol));
  return library;
}

kernel bind(shared_library library, signature sig, std::string name, std::string key)
{
  return kernel{std::make_shared<detail::loaded_kernel const>(
    std::move(library), std::move(sig), std::move(name), std::move(key))};
}

}  // namespace jit

namespace detail {

loaded_kernel::loaded_kernel(jit::shared_library library,
                             signature sig,
                             std::string name,
                             std::string key)
  : _library{std::move(library)},
    _signature{std::move(sig)},
    _name{std::move(name)},
    _key{std::move(key)},
    _entry{reinterpret_cast<packed_entry_fn>(_library.symbol(jit::packed_entry_symbol))}
{
}

}  // namespace detail
}  // namespace kernjit
