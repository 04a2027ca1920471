/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace kernjit {
namespace jit {

/// File names inside a cache entry
constexpr char const* source_file_name    = "kernel.cu";
constexpr char const* signature_file_name = "kernel.args";
constexpr char const* artifact_file_name  = "kernel.so";
constexpr char const* metadata_file_name  = "kernel.meta";

/**
 * @brief Record of how an artifact was produced, stored beside it as `kernel.meta`.
 */
struct artifact_metadata {
  std::string command;        ///< Compiler invocation
  int exit_status = 0;        ///< Compiler exit status
  std::size_t artifact_size = 0;  ///< Size of `kernel.so` in bytes
  std::string output;         ///< Captured compiler output

  /// @return The sidecar text
  [[nodiscard]] std::string serialize() const;

  /**
   * @brief Parses sidecar text
   *
   * @throw kernjit::cache_corruption_error if the text is malformed
   *
   * @param text The sidecar text
   * @return The metadata
   */
  static artifact_metadata parse(std::string const& text);
};

/**
 * @brief A private directory in which one artifact is produced before installation.
 *
 * The directory is removed on destruction unless it was installed.
 */
class staging_directory {
 public:
  explicit staging_directory(std::string path);
  ~staging_directory();

  staging_directory(staging_directory const&)            = delete;
  staging_directory& operator=(staging_directory const&) = delete;
  staging_directory(staging_directory&& other) noexcept;
  staging_directory& operator=(staging_directory&&) = delete;

  /// @return Path of the directory
  [[nodiscard]] std::string const& path() const noexcept { return _path; }

  /// @return Path of `name` inside the directory
  [[nodiscard]] std::string file(char const* name) const { return _path + "/" + name; }

  /// @brief Gives up ownership; the directory is no longer removed on destruction
  void release() noexcept { _path.clear(); }

 private:
  std::string _path;
};

/**
 * @brief Content-keyed on-disk store of compiled artifacts.
 *
 * Layout under the root:
 * - `cache/kernel.<name>.<key>/` one installed entry per key
 * - `tmp/` staging directories and evicted entries awaiting removal
 * - `failed/kernel.<name>.<key>.meta` metadata of the last failed compilation per key
 *
 * Entries are only ever created by renaming a complete staging directory onto the entry path,
 * so a reader never observes a partially written entry. Directories are created lazily on the
 * first staging request.
 */
class artifact_cache {
 public:
  explicit artifact_cache(std::string root);

  /// @return The cache root
  [[nodiscard]] std::string const& root() const noexcept { return _root; }

  /**
   * @brief Returns the entry directory for a key
   *
   * @param name Kernel name
   * @param key Cache key
   * @return `<root>/cache/kernel.<name>.<key>`
   */
  [[nodiscard]] std::string entry_path(std::string const& name, std::string const& key) const;

  /**
   * @brief Looks up and verifies an installed entry.
   *
   * @throw kernjit::cache_corruption_error if the entry exists but a file is missing, the
   * artifact is empty or its size disagrees with the metadata, or the stored source differs
   * from `source`
   *
   * @param name Kernel name
   * @param key Cache key
   * @param source The source the artifact must have been compiled from
   * @return Path of the verified artifact, or nothing if no entry exists
   */
  [[nodiscard]] std::optional<std::string> lookup(std::string const& name,
                                                  std::string const& key,
                                                  std::string const& source) const;

  /**
   * @brief Creates a fresh staging directory `<root>/tmp/kernel.<name>.XXXXXX`
   *
   * @param name Kernel name
   * @return The staging directory
   */
  [[nodiscard]] staging_directory stage(std::string const& name) const;

  /**
   * @brief Atomically installs a staging directory as the entry for a key.
   *
   * If another thread or process installed the entry first, the staging directory is discarded
   * and the existing entry is kept.
   *
   * @param staging The complete staging directory
   * @param name Kernel name
   * @param key Cache key
   * @return Path of the installed artifact
   */
  std::string install(staging_directory&& staging,
                      std::string const& name,
                      std::string const& key) const;

  /**
   * @brief Removes the entry for a key, if present.
   *
   * The entry is first renamed aside so that concurrent readers see either the whole entry
   * or no entry.
   *
   * @param name Kernel name
   * @param key Cache key
   */
  void evict(std::string const& name, std::string const& key) const;

  /**
   * @brief Returns where the metadata of the last failed compilation for a key is kept
   *
   * @param name Kernel name
   * @param key Cache key
   * @return `<root>/failed/kernel.<name>.<key>.meta`
   */
  [[nodiscard]] std::string failure_path(std::string const& name, std::string const& key) const;

  /**
   * @brief Atomically records the metadata of a failed compilation, replacing any earlier record.
   *
   * A failure record is never an entry: lookups ignore it and the next request compiles again.
   *
   * @param name Kernel name
   * @param key Cache key
   * @param meta The compiler invocation, its exit status and its captured output
   */
  void record_failure(std::string const& name,
                      std::string const& key,
                      artifact_metadata const& meta) const;

  /**
   * @brief Removes the failure record for a key, if any
   *
   * @param name Kernel name
   * @param key Cache key
   */
  void clear_failure(std::string const& name, std::string const& key) const;

 private:
  void ensure_directories() const;

  std::string _root;
};

/**
 * @brief Writes `content` to a new file at `path`.
 *
 * @throw std::runtime_error on failure
 */
void write_file(std::string const& path, std::string const& content);

/**
 * @brief Reads the whole file at `path`.
 *
 * @throw std::runtime_error on failure
 */
std::string read_file(std::string const& path);

}  // namespace jit
}  // namespace kernjit
