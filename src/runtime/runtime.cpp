/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/cache.hpp"
#include "jit/compiler.hpp"
#include "jit/loader.hpp"
#include "jit/sha256.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/runtime.hpp>
#include <kernjit/utilities/error.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef KERNJIT_VERSION
#define KERNJIT_VERSION "unknown"
#endif

namespace kernjit {

namespace {

bool is_valid_build_name(std::string const& name)
{
  return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
  });
}

std::string compute_key(toolchain const& tc,
                        std::vector<std::string> const& flags,
                        std::string const& name,
                        signature const& sig,
                        std::string const& source)
{
  jit::sha256_context ctx;
  auto add = [&](std::string_view part) {
    ctx.update(part);
    ctx.update(std::string_view{"\0", 1});
  };
  add(KERNJIT_VERSION);
  add(tc.identity());
  add(std::to_string(flags.size()));
  for (auto const& flag : flags) {
    add(flag);
  }
  add(name);
  add(sig.describe());
  add(source);
  return ctx.finalize().to_hex();
}

}  // namespace

struct runtime::impl {
  explicit impl(jit_options opts)
    : options{std::move(opts)},
      cache{options.cache_dir.empty() ? default_cache_dir() : options.cache_dir}
  {
    if (options.jit_debug && detail::logger().level() > spdlog::level::debug) {
      detail::logger().set_level(spdlog::level::debug);
    }
  }

  void discover()
  {
    std::call_once(discovered, [&] {
      if (!tc.has_value()) { tc = discover_toolchain(options); }
      flags = tc->flags(options);
      KERNJIT_LOG_INFO("JIT compiler {} with cache at {}", tc->path(), cache.root());
    });
  }

  // compiles into `staging`, leaving all four entry files there
  void compile_into(jit::staging_directory const& staging,
                    std::string const& name,
                    std::string const& key,
                    signature const& sig,
                    std::string const& source)
  {
    auto const source_path   = staging.file(jit::source_file_name);
    auto const artifact_path = staging.file(jit::artifact_file_name);
    jit::write_file(source_path, source);
    jit::write_file(staging.file(jit::signature_file_name), sig.describe());

    try {
      auto result = jit::compile(*tc, flags, source_path, artifact_path);
      jit::artifact_metadata meta;
      meta.command       = std::move(result.command);
      meta.exit_status   = result.exit_status;
      meta.artifact_size = static_cast<std::size_t>(std::filesystem::file_size(artifact_path));
      meta.output        = std::move(result.output);
      jit::write_file(staging.file(jit::metadata_file_name), meta.serialize());
    } catch (compile_error const& e) {
      ++failed_compilations;
      record_failure(name, key, e);
      throw;
    }
    ++compilations;

    try {
      cache.clear_failure(name, key);
    } catch (std::runtime_error const& e) {
      KERNJIT_LOG_WARN("{}", e.what());
    }
  }

  // the compile_error reaches the caller even when its record cannot be written
  void record_failure(std::string const& name, std::string const& key, compile_error const& error)
  {
    jit::artifact_metadata meta;
    meta.command     = error.command();
    meta.exit_status = error.exit_status();
    meta.output      = error.diagnostics();
    try {
      cache.record_failure(name, key, meta);
    } catch (std::runtime_error const& e) {
      KERNJIT_LOG_WARN("{}", e.what());
    }
  }

  kernel build_uncached(std::string const& name,
                        std::string const& key,
                        signature const& sig,
                        std::string const& source)
  {
    auto staging = cache.stage(name);
    compile_into(staging, name, key, sig, source);
    // the loaded image outlives the staging directory
    return jit::bind(jit::load(staging.file(jit::artifact_file_name)), sig, name, key);
  }

  kernel build_cached(std::string const& name,
                      std::string const& key,
                      signature const& sig,
                      std::string const& source)
  {
    try {
      if (auto artifact = cache.lookup(name, key, source)) {
        try {
          auto k = jit::bind(jit::load(*artifact), sig, name, key);
          ++disk_hits;
          KERNJIT_LOG_DEBUG("JIT cache disk hit for {} ({})", name, key);
          return k;
        } catch (load_error const& e) {
          throw cache_corruption_error{e.what()};
        }
      }
    } catch (cache_corruption_error const& e) {
      KERNJIT_LOG_WARN(
        "Evicting corrupt JIT cache entry {}: {}", cache.entry_path(name, key), e.what());
      cache.evict(name, key);
      ++corrupt_evictions;
    }

    KERNJIT_LOG_DEBUG("JIT cache miss for {} ({})", name, key);
    auto staging = cache.stage(name);
    compile_into(staging, name, key, sig, source);
    auto const artifact = cache.install(std::move(staging), name, key);
    return jit::bind(jit::load(artifact), sig, name, key);
  }

  kernel build(std::string const& name, signature const& sig, std::string const& source)
  {
    KERNJIT_FUNC_RANGE();

    KERNJIT_EXPECTS(is_valid_build_name(name),
                    "Invalid kernel name '" + name + "': expected [A-Za-z0-9_]+");
    discover();
    auto const key = compute_key(*tc, flags, name, sig, source);

    if (options.jit_debug) {
      KERNJIT_LOG_DEBUG("Generated source for {} ({}):\n{}", name, key, source);
    }

    if (options.disable_cache) { return build_uncached(name, key, sig, source); }

    std::promise<kernel> promise;
    std::shared_future<kernel> future;
    bool owner = false;
    {
      std::lock_guard<std::mutex> guard{table_mutex};
      auto it = table.find(key);
      if (it != table.end()) {
        ++memory_hits;
        future = it->second;
      } else {
        future = promise.get_future().share();
        table.emplace(key, future);
        owner = true;
      }
    }

    // another request owns the build; wait for it and rethrow its failure
    if (!owner) {
      KERNJIT_LOG_DEBUG("JIT cache memory hit for {} ({})", name, key);
      return future.get();
    }

    try {
      auto k = build_cached(name, key, sig, source);
      promise.set_value(k);
      return k;
    } catch (...) {
      {
        std::lock_guard<std::mutex> guard{table_mutex};
        table.erase(key);
      }
      promise.set_exception(std::current_exception());
      throw;
    }
  }

  jit_options options;
  jit::artifact_cache cache;
  std::optional<toolchain> tc;
  std::vector<std::string> flags;
  std::once_flag discovered;

  mutable std::mutex table_mutex;
  std::unordered_map<std::string, std::shared_future<kernel>> table;

  std::atomic<std::size_t> memory_hits{0};
  std::atomic<std::size_t> disk_hits{0};
  std::atomic<std::size_t> compilations{0};
  std::atomic<std::size_t> failed_compilations{0};
  std::atomic<std::size_t> corrupt_evictions{0};
};

runtime::runtime(jit_options options) : _impl{std::make_unique<impl>(std::move(options))} {}

runtime::runtime(jit_options options, toolchain tc)
  : _impl{std::make_unique<impl>(std::move(options))}
{
  _impl->tc = std::move(tc);
}

runtime::~runtime() = default;

kernel runtime::build(std::string const& name, signature const& sig, std::string const& source)
{
  return _impl->build(name, sig, source);
}

toolchain const& runtime::get_toolchain()
{
  _impl->discover();
  return *_impl->tc;
}

jit_options const& runtime::options() const noexcept { return _impl->options; }

std::string const& runtime::cache_dir() const noexcept { return _impl->cache.root(); }

build_statistics runtime::get_statistics() const
{
  build_statistics stats;
  stats.memory_hits         = _impl->memory_hits.load();
  stats.disk_hits           = _impl->disk_hits.load();
  stats.compilations        = _impl->compilations.load();
  stats.failed_compilations = _impl->failed_compilations.load();
  stats.corrupt_evictions   = _impl->corrupt_evictions.load();
  return stats;
}

void runtime::clear_statistics()
{
  _impl->memory_hits         = 0;
  _impl->disk_hits           = 0;
  _impl->compilations        = 0;
  _impl->failed_compilations = 0;
  _impl->corrupt_evictions   = 0;
}

std::size_t runtime::loaded_kernel_count() const
{
  std::lock_guard<std::mutex> guard{_impl->table_mutex};
  return _impl->table.size();
}

namespace {

std::mutex& global_runtime_mutex()
{
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<runtime>& get_runtime_ptr_ref()
{
  static std::unique_ptr<runtime> rt;
  return rt;
}

}  // namespace

void initialize(jit_options options)
{
  std::lock_guard<std::mutex> guard{global_runtime_mutex()};
  auto& rt = get_runtime_ptr_ref();
  KERNJIT_EXPECTS(rt == nullptr, "The kernjit runtime is already initialized");
  rt = std::make_unique<runtime>(std::move(options));
}

void deinitialize()
{
  std::lock_guard<std::mutex> guard{global_runtime_mutex()};
  get_runtime_ptr_ref().reset();
}

runtime& get_runtime()
{
  std::lock_guard<std::mutex> guard{global_runtime_mutex()};
  auto& rt = get_runtime_ptr_ref();
  if (rt == nullptr) { rt = std::make_unique<runtime>(); }
  return *rt;
}

kernel build(std::string const& name, signature const& sig, std::string const& source)
{
  return get_runtime().build(name, sig, source);
}

}  // namespace kernjit
