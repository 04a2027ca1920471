/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/kernel.hpp>
#include <kernjit/signature.hpp>

#include <memory>
#include <string>

namespace kernjit {
namespace jit {

/// Name of the typed entry point exported by every artifact
constexpr char const* entry_symbol = "launch";
/// Name of the packed-argument adapter exported by every artifact
constexpr char const* packed_entry_symbol = "launch_packed";

/**
 * @brief Owning handle to a dynamically loaded shared object.
 */
class shared_library {
 public:
  /**
   * @brief Loads the shared object at `path` with all symbols resolved immediately.
   *
   * @throw kernjit::load_error if the file is missing or cannot be loaded
   *
   * @param path Path of the shared object
   * @return The loaded library
   */
  static shared_library open(std::string const& path);

  ~shared_library();

  shared_library(shared_library const&)            = delete;
  shared_library& operator=(shared_library const&) = delete;
  shared_library(shared_library&& other) noexcept;
  shared_library& operator=(shared_library&&) = delete;

  /**
   * @brief Looks up an exported symbol
   *
   * @throw kernjit::load_error if the symbol is not exported
   *
   * @param name Symbol name
   * @return The symbol address
   */
  [[nodiscard]] void* symbol(char const* name) const;

  /// @return Path the library was loaded from
  [[nodiscard]] std::string const& path() const noexcept { return _path; }

 private:
  shared_library(std::string path, void* handle);

  std::string _path;
  void* _handle;
};

/**
 * @brief Loads the artifact at `path`.
 *
 * @throw kernjit::load_error if the artifact is missing, unloadable, or does not export both
 * `launch` and `launch_packed`
 *
 * @param path Path of the compiled artifact
 * @return The loaded library
 */
shared_library load(std::string const& path);

/**
 * @brief Binds a loaded artifact to the signature it was generated from.
 *
 * @param library The loaded artifact
 * @param sig The signature of the artifact's entry point
 * @param name The kernel name
 * @param key The cache key of the artifact
 * @return The callable kernel
 */
kernel bind(shared_library library, signature sig, std::string name, std::string key);

}  // namespace jit

namespace detail {

/**
 * @brief A loaded artifact paired with its marshalling metadata.
 */
class loaded_kernel {
 public:
  using packed_entry_fn = int (*)(void**);

  loaded_kernel(jit::shared_library library, signature sig, std::string name, std::string key);

  [[nodiscard]] signature const& get_signature() const noexcept { return _signature; }
  [[nodiscard]] std::string const& name() const noexcept { return _name; }
  [[nodiscard]] std::string const& key() const noexcept { return _key; }
  [[nodiscard]] std::string const& artifact_path() const noexcept { return _library.path(); }
  [[nodiscard]] packed_entry_fn entry() const noexcept { return _entry; }

 private:
  jit::shared_library _library;
  signature _signature;
  std::string _name;
  std::string _key;
  packed_entry_fn _entry;
};

}  // namespace detail
}  // namespace kernjit
