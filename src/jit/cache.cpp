/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/cache.hpp"

#include "utilities/posix.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/utilities/error.hpp>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace kernjit {
namespace jit {

namespace {

constexpr char const* command_field       = "command: ";
constexpr char const* exit_status_field   = "exit_status: ";
constexpr char const* artifact_size_field = "artifact_size: ";
constexpr char const* output_field        = "output:";

bool starts_with(std::string const& text, char const* prefix)
{
  return text.rfind(prefix, 0) == 0;
}

std::string field_value(std::string const& line, char const* prefix)
{
  return line.substr(std::char_traits<char>::length(prefix));
}

void make_directory(std::string const& path)
{
  if (mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) == -1) {
    if (errno != EEXIST) {
      detail::throw_posix("Failed to create JIT cache directory " + path, "mkdir");
    }
  }
}

std::string make_temp_directory(std::string const& pattern)
{
  std::vector<char> path(pattern.begin(), pattern.end());
  path.push_back('\0');
  if (mkdtemp(path.data()) == nullptr) {
    detail::throw_posix("Failed to create JIT staging directory " + pattern, "mkdtemp");
  }
  return std::string{path.data()};
}

void remove_tree(std::string const& path)
{
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) { KERNJIT_LOG_WARN("Failed to remove {}: {}", path, ec.message()); }
}

bool is_regular_file(std::string const& path, std::uintmax_t& size)
{
  struct stat info {};
  if (stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) { return false; }
  size = static_cast<std::uintmax_t>(info.st_size);
  return true;
}

}  // namespace

void write_file(std::string const& path, std::string const& content)
{
  std::ofstream file{path, std::ios::binary | std::ios::trunc};
  KERNJIT_EXPECTS(file.is_open(), "Failed to open " + path + " for writing", std::runtime_error);
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  KERNJIT_EXPECTS(!file.fail(), "Failed to write " + path, std::runtime_error);
}

std::string read_file(std::string const& path)
{
  std::ifstream file{path, std::ios::binary};
  KERNJIT_EXPECTS(file.is_open(), "Failed to open " + path + " for reading", std::runtime_error);
  return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

std::string artifact_metadata::serialize() const
{
  std::string text;
  text += command_field + command + "\n";
  text += exit_status_field + std::to_string(exit_status) + "\n";
  text += artifact_size_field + std::to_string(artifact_size) + "\n";
  text += output_field;
  text += "\n";
  text += output;
  return text;
}

artifact_metadata artifact_metadata::parse(std::string const& text)
{
  artifact_metadata meta;
  bool has_size = false;
  std::istringstream lines{text};
  std::string line;
  while (std::getline(lines, line)) {
    if (starts_with(line, command_field)) {
      meta.command = field_value(line, command_field);
    } else if (starts_with(line, exit_status_field)) {
      meta.exit_status = std::atoi(field_value(line, exit_status_field).c_str());
    } else if (starts_with(line, artifact_size_field)) {
      auto const value = field_value(line, artifact_size_field);
      KERNJIT_EXPECTS(!value.empty() && value.find_first_not_of("0123456789") == std::string::npos,
                      "Malformed artifact size in JIT cache metadata: " + value,
                      cache_corruption_error);
      try {
        meta.artifact_size = std::stoull(value);
      } catch (std::out_of_range const&) {
        KERNJIT_FAIL("Artifact size out of range in JIT cache metadata: " + value,
                     cache_corruption_error);
      }
      has_size = true;
    } else if (line == output_field) {
      meta.output.assign(std::istreambuf_iterator<char>{lines}, std::istreambuf_iterator<char>{});
      break;
    }
  }
  KERNJIT_EXPECTS(has_size, "JIT cache metadata lacks the artifact size", cache_corruption_error);
  return meta;
}

staging_directory::staging_directory(std::string path) : _path{std::move(path)} {}

staging_directory::staging_directory(staging_directory&& other) noexcept
  : _path{std::move(other._path)}
{
  other._path.clear();
}

staging_directory::~staging_directory()
{
  if (!_path.empty()) { remove_tree(_path); }
}

artifact_cache::artifact_cache(std::string root) : _root{std::move(root)} {}

std::string artifact_cache::entry_path(std::string const& name, std::string const& key) const
{
  return _root + "/cache/kernel." + name + "." + key;
}

void artifact_cache::ensure_directories() const
{
  std::error_code ec;
  std::filesystem::create_directories(_root, ec);
  KERNJIT_EXPECTS(
    !ec, "Failed to create JIT cache root " + _root + ": " + ec.message(), std::runtime_error);
  make_directory(_root + "/cache");
  make_directory(_root + "/tmp");
}

std::optional<std::string> artifact_cache::lookup(std::string const& name,
                                                  std::string const& key,
                                                  std::string const& source) const
{
  KERNJIT_FUNC_RANGE();

  auto const entry = entry_path(name, key);
  struct stat info {};
  if (stat(entry.c_str(), &info) != 0) {
    if (errno == ENOENT) { return std::nullopt; }
    detail::throw_posix("Failed to inspect JIT cache entry " + entry, "stat");
  }
  KERNJIT_EXPECTS(
    S_ISDIR(info.st_mode), "JIT cache entry is not a directory: " + entry, cache_corruption_error);

  auto const artifact = entry + "/" + artifact_file_name;
  std::uintmax_t artifact_size = 0;
  std::uintmax_t ignored_size  = 0;
  for (auto const* file : {source_file_name, signature_file_name, metadata_file_name}) {
    KERNJIT_EXPECTS(is_regular_file(entry + "/" + file, ignored_size),
                    "JIT cache entry " + entry + " lacks " + file,
                    cache_corruption_error);
  }
  KERNJIT_EXPECTS(is_regular_file(artifact, artifact_size),
                  "JIT cache entry " + entry + " lacks " + artifact_file_name,
                  cache_corruption_error);
  KERNJIT_EXPECTS(
    artifact_size > 0, "JIT cache artifact is empty: " + artifact, cache_corruption_error);

  auto const meta = artifact_metadata::parse(read_file(entry + "/" + metadata_file_name));
  KERNJIT_EXPECTS(meta.artifact_size == artifact_size,
                  "JIT cache artifact " + artifact + " has " + std::to_string(artifact_size) +
                    " bytes, expected " + std::to_string(meta.artifact_size),
                  cache_corruption_error);
  KERNJIT_EXPECTS(read_file(entry + "/" + source_file_name) == source,
                  "JIT cache entry " + entry + " was built from different source",
                  cache_corruption_error);

  return artifact;
}

staging_directory artifact_cache::stage(std::string const& name) const
{
  ensure_directories();
  return staging_directory{make_temp_directory(_root + "/tmp/kernel." + name + ".XXXXXX")};
}

std::string artifact_cache::install(staging_directory&& staging,
                                    std::string const& name,
                                    std::string const& key) const
{
  KERNJIT_FUNC_RANGE();

  staging_directory owned{std::move(staging)};
  auto const entry = entry_path(name, key);

  // rename is atomic, even if another process is performing the same operation
  if (rename(owned.path().c_str(), entry.c_str()) == -1) {
    auto const error_code = errno;
    if (error_code == EEXIST || error_code == ENOTEMPTY) {
      // another thread or process installed the entry first; ours is discarded with `owned`
      KERNJIT_LOG_DEBUG("JIT cache entry {} was installed concurrently", entry);
      return entry + "/" + artifact_file_name;
    }
    detail::throw_posix("Failed to move JIT staging directory to " + entry, "rename");
  }
  owned.release();
  return entry + "/" + artifact_file_name;
}

void artifact_cache::evict(std::string const& name, std::string const& key) const
{
  KERNJIT_FUNC_RANGE();

  ensure_directories();
  auto const entry = entry_path(name, key);
  // renaming onto an empty directory replaces it atomically
  auto const graveyard = make_temp_directory(_root + "/tmp/evicted." + name + ".XXXXXX");
  if (rename(entry.c_str(), graveyard.c_str()) == -1) {
    auto const error_code = errno;
    remove_tree(graveyard);
    // already evicted by someone else
    if (error_code == ENOENT) { return; }
    if (error_code == EISDIR || error_code == ENOTDIR) {
      // the entry path holds a plain file
      if (unlink(entry.c_str()) == -1 && errno != ENOENT) {
        detail::throw_posix("Failed to evict JIT cache entry " + entry, "unlink");
      }
      return;
    }
    detail::throw_posix("Failed to evict JIT cache entry " + entry, "rename");
  }
  remove_tree(graveyard);
}

std::string artifact_cache::failure_path(std::string const& name, std::string const& key) const
{
  return _root + "/failed/kernel." + name + "." + key + ".meta";
}

void artifact_cache::record_failure(std::string const& name,
                                    std::string const& key,
                                    artifact_metadata const& meta) const
{
  ensure_directories();
  make_directory(_root + "/failed");

  staging_directory staging{make_temp_directory(_root + "/tmp/failed." + name + ".XXXXXX")};
  auto const staged = staging.file(metadata_file_name);
  write_file(staged, meta.serialize());

  auto const record = failure_path(name, key);
  // rename replaces an existing record atomically
  if (rename(staged.c_str(), record.c_str()) == -1) {
    detail::throw_posix("Failed to record JIT compilation failure at " + record, "rename");
  }
}

void artifact_cache::clear_failure(std::string const& name, std::string const& key) const
{
  auto const record = failure_path(name, key);
  if (unlink(record.c_str()) == -1 && errno != ENOENT) {
    detail::throw_posix("Failed to remove JIT compilation failure record " + record, "unlink");
  }
}

}  // namespace jit
}  // namespace kernjit
