/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit_test_utilities.hpp"

#include <kernjit_test/base_fixture.hpp>
#include <kernjit_test/file_utilities.hpp>
#include <kernjit_test/stdout_capture.hpp>
#include <kernjit_test/testing_main.hpp>

#include <kernjit/codegen.hpp>
#include <kernjit/kernel.hpp>
#include <kernjit/logger.hpp>
#include <kernjit/runtime.hpp>
#include <kernjit/signature.hpp>
#include <kernjit/utilities/error.hpp>

#include <jit/loader.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_uvector.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using kernjit::arg_type;
using kernjit::type_id;

class RuntimeTest : public kernjit::test::JitFixture {
 public:
  std::unique_ptr<kernjit::runtime> make_runtime(kernjit::jit_options const& opts)
  {
    return std::make_unique<kernjit::runtime>(opts, kernjit::test::test_toolchain());
  }

  std::unique_ptr<kernjit::runtime> make_runtime() { return make_runtime(options()); }

  std::string cache_entries_dir() const { return cache_root() + "/cache"; }

  std::string staging_dir() const { return cache_root() + "/tmp"; }
};

TEST_F(RuntimeTest, BuildAndInvoke)
{
  auto rt = make_runtime();
  auto k  = rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());

  int32_t out = 0;
  EXPECT_EQ(k(&out, int32_t{5}, int64_t{2}), 5);
  EXPECT_EQ(out, 17);
  EXPECT_EQ(k.name(), "axpb");
  EXPECT_EQ(k.key().size(), 64u);
  EXPECT_EQ(k.get_signature().size(), 3u);
}

TEST_F(RuntimeTest, RepeatedBuildsCompileOnce)
{
  auto rt           = make_runtime();
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();

  std::vector<kernjit::kernel> kernels;
  for (int i = 0; i < 5; ++i) {
    kernels.push_back(rt->build("axpb", sig, source));
  }

  auto const stats = rt->get_statistics();
  EXPECT_EQ(stats.compilations, 1u);
  EXPECT_EQ(stats.memory_hits, 4u);
  EXPECT_EQ(stats.disk_hits, 0u);
  EXPECT_EQ(rt->loaded_kernel_count(), 1u);

  for (auto const& k : kernels) {
    int32_t out = 0;
    EXPECT_EQ(k(&out, int32_t{4}, int64_t{-1}), 4);
    EXPECT_EQ(out, 11);
    EXPECT_EQ(k.key(), kernels.front().key());
  }

  rt->clear_statistics();
  EXPECT_EQ(rt->get_statistics().compilations, 0u);
  EXPECT_EQ(rt->get_statistics().memory_hits, 0u);
}

TEST_F(RuntimeTest, DistinctSourcesDistinctArtifacts)
{
  auto rt     = make_runtime();
  auto const sig = kernjit::test::axpb_signature();
  auto three  = rt->build("axpb", sig, kernjit::test::axpb_source(3));
  auto four   = rt->build("axpb", sig, kernjit::test::axpb_source(4));
  EXPECT_NE(three.key(), four.key());
  EXPECT_EQ(rt->get_statistics().compilations, 2u);

  int32_t out = 0;
  three(&out, int32_t{2}, int64_t{0});
  EXPECT_EQ(out, 6);
  four(&out, int32_t{2}, int64_t{0});
  EXPECT_EQ(out, 8);

  // the name is part of the key
  auto renamed = rt->build("axpb_copy", sig, kernjit::test::axpb_source(3));
  EXPECT_NE(renamed.key(), three.key());
}

TEST_F(RuntimeTest, EntryLayout)
{
  auto rt           = make_runtime();
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();
  auto k            = rt->build("axpb", sig, source);

  auto const entry = cache_entries_dir() + "/kernel.axpb." + k.key();
  EXPECT_EQ(k.artifact_path(), entry + "/kernel.so");
  EXPECT_EQ(kernjit::test::file_contents(entry + "/kernel.cu"), source);
  EXPECT_EQ(kernjit::test::file_contents(entry + "/kernel.args"), sig.describe());
  EXPECT_GT(std::filesystem::file_size(entry + "/kernel.so"), 0u);

  auto const meta = kernjit::test::file_contents(entry + "/kernel.meta");
  EXPECT_NE(meta.find("exit_status: 0\n"), std::string::npos) << meta;
  EXPECT_NE(meta.find("artifact_size: " +
                      std::to_string(std::filesystem::file_size(entry + "/kernel.so")) + "\n"),
            std::string::npos)
    << meta;
  EXPECT_NE(meta.find("command: " + kernjit::test::test_toolchain().path()), std::string::npos)
    << meta;

  EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());
}

TEST_F(RuntimeTest, DiskCacheReusedAcrossRuntimes)
{
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();
  std::string key;
  {
    auto first = make_runtime();
    key        = first->build("axpb", sig, source).key();
    EXPECT_EQ(first->get_statistics().compilations, 1u);
  }

  auto second = make_runtime();
  auto k      = second->build("axpb", sig, source);
  EXPECT_EQ(k.key(), key);
  EXPECT_EQ(second->get_statistics().compilations, 0u);
  EXPECT_EQ(second->get_statistics().disk_hits, 1u);

  int32_t out = 0;
  EXPECT_EQ(k(&out, int32_t{1}, int64_t{1}), 1);
  EXPECT_EQ(out, 4);
}

TEST_F(RuntimeTest, KernelOutlivesRuntime)
{
  auto rt = make_runtime();
  auto k  = rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());
  rt.reset();

  int32_t out = 0;
  EXPECT_EQ(k(&out, int32_t{2}, int64_t{1}), 2);
  EXPECT_EQ(out, 7);
}

class CorruptEntryTest : public RuntimeTest {
 public:
  /// Builds the axpb kernel in a throwaway runtime and returns its entry directory
  std::string install_entry()
  {
    auto rt = make_runtime();
    auto k  = rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());
    return cache_entries_dir() + "/kernel.axpb." + k.key();
  }

  void expect_rebuilt()
  {
    auto rt = make_runtime();
    auto k  = rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());
    auto const stats = rt->get_statistics();
    EXPECT_EQ(stats.corrupt_evictions, 1u);
    EXPECT_EQ(stats.compilations, 1u);
    EXPECT_EQ(stats.disk_hits, 0u);

    int32_t out = 0;
    EXPECT_EQ(k(&out, int32_t{3}, int64_t{0}), 3);
    EXPECT_EQ(out, 9);
    EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());
  }
};

TEST_F(CorruptEntryTest, TruncatedArtifact)
{
  auto const entry = install_entry();
  kernjit::test::overwrite_file(entry + "/kernel.so", "");
  expect_rebuilt();
}

TEST_F(CorruptEntryTest, GarbageArtifactOfRecordedSize)
{
  auto const entry = install_entry();
  auto const size  = std::filesystem::file_size(entry + "/kernel.so");
  kernjit::test::overwrite_file(entry + "/kernel.so", std::string(size, 'x'));
  expect_rebuilt();
}

TEST_F(CorruptEntryTest, SourceMismatch)
{
  auto const entry = install_entry();
  kernjit::test::overwrite_file(entry + "/kernel.cu", "// tampered\n");
  expect_rebuilt();
}

TEST_F(CorruptEntryTest, MissingMetadata)
{
  auto const entry = install_entry();
  std::filesystem::remove(entry + "/kernel.meta");
  expect_rebuilt();
}

TEST_F(CorruptEntryTest, MalformedMetadata)
{
  auto const entry = install_entry();
  kernjit::test::overwrite_file(entry + "/kernel.meta", "artifact_size: lots\n");
  expect_rebuilt();
}

TEST_F(CorruptEntryTest, ArtifactSizeOutOfRange)
{
  auto const entry = install_entry();
  kernjit::test::overwrite_file(entry + "/kernel.meta",
                                "exit_status: 0\nartifact_size: 99999999999999999999999\n");
  expect_rebuilt();
}

TEST_F(RuntimeTest, CompileError)
{
  auto rt        = make_runtime();
  auto const sig = kernjit::test::axpb_signature();
  auto const source =
    kernjit::generate({}, sig, "this is not a statement in any dialect of C++;\n");

  std::string diagnostics;
  int exit_status = 0;
  try {
    rt->build("broken", sig, source);
    FAIL() << "expected compile_error";
  } catch (kernjit::compile_error const& e) {
    EXPECT_FALSE(e.diagnostics().empty());
    EXPECT_NE(e.exit_status(), 0);
    EXPECT_NE(e.command().find(kernjit::test::test_toolchain().path()), std::string::npos);
    EXPECT_NE(std::string{e.what()}.find(e.diagnostics()), std::string::npos);
    diagnostics = e.diagnostics();
    exit_status = e.exit_status();
  }

  EXPECT_TRUE(kernjit::test::list_directory(cache_entries_dir()).empty());
  EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());
  EXPECT_EQ(rt->get_statistics().failed_compilations, 1u);
  EXPECT_EQ(rt->loaded_kernel_count(), 0u);

  // the failure is recorded beside the cache, never as an entry
  auto const failed = kernjit::test::list_directory(cache_root() + "/failed");
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed.front().rfind("kernel.broken.", 0), 0u);
  EXPECT_EQ(failed.front().size(), std::string{"kernel.broken."}.size() + 64 + 5);
  auto const record = kernjit::test::file_contents(cache_root() + "/failed/" + failed.front());
  EXPECT_NE(record.find("command: " + kernjit::test::test_toolchain().path()), std::string::npos)
    << record;
  EXPECT_NE(record.find("exit_status: " + std::to_string(exit_status) + "\n"), std::string::npos)
    << record;
  EXPECT_NE(record.find("output:\n" + diagnostics), std::string::npos) << record;

  // failures are not cached
  EXPECT_THROW(rt->build("broken", sig, source), kernjit::compile_error);
  EXPECT_EQ(rt->get_statistics().failed_compilations, 2u);
  EXPECT_EQ(kernjit::test::list_directory(cache_root() + "/failed").size(), 1u);
  EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());
}

TEST_F(RuntimeTest, UnsupportedKindWritesNothing)
{
  auto rt           = make_runtime();
  auto build_string = [&] {
    auto const sig = kernjit::signature{{"out", arg_type::device_buffer(type_id::INT32)},
                                        {"name", arg_type::scalar(type_id::STRING)}};
    return rt->build("strings", sig, kernjit::generate({}, sig, ""));
  };
  EXPECT_THROW(build_string(), kernjit::argument_type_error);
  EXPECT_FALSE(std::filesystem::exists(cache_root()));
  EXPECT_EQ(rt->get_statistics().compilations, 0u);
  EXPECT_EQ(rt->get_statistics().failed_compilations, 0u);
}

TEST_F(RuntimeTest, InvalidBuildName)
{
  auto rt           = make_runtime();
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();
  EXPECT_THROW(rt->build("", sig, source), kernjit::logic_error);
  EXPECT_THROW(rt->build("has-dash", sig, source), kernjit::logic_error);
  EXPECT_THROW(rt->build("../escape", sig, source), kernjit::logic_error);
  EXPECT_FALSE(std::filesystem::exists(cache_root()));
}

TEST_F(RuntimeTest, MissingExportIsLoadError)
{
  auto rt = make_runtime();
  EXPECT_THROW(rt->build("no_adapter", {}, "extern \"C\" int launch() { return 0; }\n"),
               kernjit::load_error);
}

TEST_F(RuntimeTest, StatusReturnedUnmodified)
{
  auto rt        = make_runtime();
  auto const sig = kernjit::signature{{"code", arg_type::scalar(type_id::INT32)}};
  auto assigned  = rt->build("assigned", sig, kernjit::generate({}, sig, "__return_code = code;"));
  auto early     = rt->build("early", sig, kernjit::generate({}, sig, "return -code;"));

  EXPECT_EQ(assigned(int32_t{-7}), -7);
  EXPECT_EQ(assigned(int32_t{0}), 0);
  EXPECT_EQ(early(int32_t{42}), -42);
}

TEST_F(RuntimeTest, AbiFidelity)
{
  auto const sig = kernjit::signature{{"buf1", arg_type::device_buffer(type_id::FP8_E4M3)},
                                      {"buf2", arg_type::device_buffer(type_id::FP8_E4M3)},
                                      {"scale", arg_type::device_buffer(type_id::FLOAT32)},
                                      {"out", arg_type::device_buffer(type_id::BFLOAT16)},
                                      {"flag", arg_type::scalar(type_id::BOOL8)},
                                      {"stream", arg_type::stream()}};
  auto const body =
    "std::cout << static_cast<void const*>(buf1) << \"\\n\";\n"
    "std::cout << static_cast<void const*>(buf2) << \"\\n\";\n"
    "std::cout << static_cast<void const*>(scale) << \"\\n\";\n"
    "std::cout << static_cast<void const*>(out) << \"\\n\";\n"
    "std::cout << flag << \"\\n\";\n"
    "std::cout << static_cast<void const*>(stream) << \"\\n\";\n"
    "std::cout.flush();\n";

  auto rt = make_runtime();
  auto k  = rt->build("abi_fidelity", sig, kernjit::generate({}, sig, body));

  alignas(16) unsigned char storage[4][64] = {};
  auto* buf1   = reinterpret_cast<__nv_fp8_e4m3*>(storage[0]);
  auto* buf2   = reinterpret_cast<__nv_fp8_e4m3*>(storage[1]);
  auto* scale  = reinterpret_cast<float*>(storage[2]);
  auto* out    = reinterpret_cast<__nv_bfloat16*>(storage[3]);
  auto stream  = rmm::cuda_stream_view{reinterpret_cast<cudaStream_t>(uintptr_t{0x5a5a00})};

  std::ostringstream expected;
  expected << static_cast<void const*>(buf1) << "\n"
           << static_cast<void const*>(buf2) << "\n"
           << static_cast<void const*>(scale) << "\n"
           << static_cast<void const*>(out) << "\n"
           << 1 << "\n"
           << static_cast<void const*>(stream.value()) << "\n";

  int status = -1;
  std::string printed;
  {
    kernjit::test::stdout_capture capture;
    status  = k(buf1, buf2, scale, out, true, stream);
    printed = capture.release();
  }
  EXPECT_EQ(status, 0);
  EXPECT_EQ(printed, expected.str());
}

TEST_F(RuntimeTest, ConcurrentBuildsShareOneCompilation)
{
  auto rt           = make_runtime();
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();

  constexpr int num_threads = 8;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t] {
      try {
        auto k      = rt->build("axpb", sig, source);
        int32_t out = 0;
        if (k(&out, int32_t{t}, int64_t{1}) != t || out != t * 3 + 1) { ++failures; }
      } catch (std::exception const&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(rt->get_statistics().compilations, 1u);
  EXPECT_EQ(rt->get_statistics().memory_hits, num_threads - 1u);
}

TEST_F(RuntimeTest, ConcurrentRuntimesShareOneEntry)
{
  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();

  constexpr int num_threads = 8;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t] {
      try {
        auto rt     = make_runtime();
        auto k      = rt->build("axpb", sig, source);
        int32_t out = 0;
        if (k(&out, int32_t{t}, int64_t{0}) != t || out != t * 3) { ++failures; }
      } catch (std::exception const&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(kernjit::test::list_directory(cache_entries_dir()).size(), 1u);
  EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());
}

TEST_F(RuntimeTest, DisabledCache)
{
  auto opts          = options();
  opts.disable_cache = true;
  auto rt            = make_runtime(opts);

  auto const sig    = kernjit::test::axpb_signature();
  auto const source = kernjit::test::axpb_source();
  auto first        = rt->build("axpb", sig, source);
  auto second       = rt->build("axpb", sig, source);

  EXPECT_EQ(rt->get_statistics().compilations, 2u);
  EXPECT_EQ(rt->get_statistics().memory_hits, 0u);
  EXPECT_TRUE(kernjit::test::list_directory(cache_entries_dir()).empty());
  EXPECT_TRUE(kernjit::test::list_directory(staging_dir()).empty());

  int32_t out = 0;
  EXPECT_EQ(second(&out, int32_t{2}, int64_t{2}), 2);
  EXPECT_EQ(out, 8);
}

TEST_F(RuntimeTest, JitDebugLogsSource)
{
  auto& logger           = kernjit::detail::logger();
  auto const prev_level  = logger.level();
  auto const prev_sinks  = logger.sinks();
  std::ostringstream oss;
  logger.sinks() = {std::make_shared<spdlog::sinks::ostream_sink_mt>(oss)};

  auto opts      = options();
  opts.jit_debug = true;
  {
    auto rt = make_runtime(opts);
    rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());
  }

  logger.set_level(prev_level);
  logger.sinks() = prev_sinks;

  EXPECT_NE(oss.str().find("static constexpr int32_t FACTOR = 3;"), std::string::npos);
}

TEST_F(RuntimeTest, GlobalRuntime)
{
  auto opts     = options();
  opts.compiler = kernjit::test::test_toolchain().path();
  kernjit::initialize(opts);
  EXPECT_THROW(kernjit::initialize(opts), kernjit::logic_error);

  auto k = kernjit::build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());
  EXPECT_EQ(kernjit::get_runtime().cache_dir(), cache_root());
  EXPECT_EQ(kernjit::get_runtime().get_toolchain().path(), opts.compiler);
  EXPECT_EQ(kernjit::get_runtime().get_statistics().compilations, 1u);

  kernjit::deinitialize();

  int32_t out = 0;
  EXPECT_EQ(k(&out, int32_t{1}, int64_t{0}), 1);
  EXPECT_EQ(out, 3);
}

TEST_F(RuntimeTest, InvocationArity)
{
  auto rt = make_runtime();
  auto k  = rt->build("axpb", kernjit::test::axpb_signature(), kernjit::test::axpb_source());

  int32_t out = -1;
  int64_t wide = 0;
  // wrong count
  EXPECT_THROW(k(&out, int32_t{1}), kernjit::invocation_arity_error);
  EXPECT_THROW(k.invoke({}), kernjit::invocation_arity_error);
  // wrong kind
  EXPECT_THROW(k(int32_t{1}, int32_t{1}, int64_t{1}), kernjit::invocation_arity_error);
  EXPECT_THROW(k(&out, true, int64_t{1}), kernjit::invocation_arity_error);
  // scalar type must match exactly
  EXPECT_THROW(k(&out, int64_t{1}, int64_t{1}), kernjit::invocation_arity_error);
  EXPECT_THROW(k(&out, int32_t{1}, int32_t{1}), kernjit::invocation_arity_error);
  // typed buffers must match element type
  EXPECT_THROW(k(&wide, int32_t{1}, int64_t{1}), kernjit::invocation_arity_error);
  EXPECT_EQ(out, -1);

  // untyped buffers are accepted for any buffer parameter
  EXPECT_EQ(k.invoke({kernjit::buffer_arg{static_cast<void*>(&out), type_id::VOID},
                      int32_t{2},
                      int64_t{0}}),
            2);
  EXPECT_EQ(out, 6);
}

TEST_F(RuntimeTest, LoadRejectsMissingAndGarbageArtifacts)
{
  EXPECT_THROW(kernjit::jit::load(cache_root() + "/nonexistent.so"), kernjit::load_error);

  std::filesystem::create_directories(cache_root());
  auto const garbage = cache_root() + "/garbage.so";
  kernjit::test::overwrite_file(garbage, "not a shared object");
  EXPECT_THROW(kernjit::jit::load(garbage), kernjit::load_error);
  EXPECT_THROW(kernjit::jit::load(cache_root()), kernjit::load_error);
}

TEST_F(RuntimeTest, DeviceKernelFromIncludedHeader)
{
  if (!kernjit::test::has_cuda_device() ||
      kernjit::test::test_toolchain().kind() != kernjit::toolchain_kind::NVCC) {
    GTEST_SKIP() << "Requires a CUDA device and nvcc";
  }

  auto const header_dir = cache_root() + "_headers";
  std::filesystem::create_directories(header_dir);
  kernjit::test::overwrite_file(header_dir + "/scale.cuh",
                                "#pragma once\n"
                                "template <typename T>\n"
                                "__global__ void scale(T* data, int n, T factor)\n"
                                "{\n"
                                "  int i = blockIdx.x * blockDim.x + threadIdx.x;\n"
                                "  if (i < n) { data[i] *= factor; }\n"
                                "}\n");

  auto const sig  = kernjit::signature{{"data", arg_type::device_buffer(type_id::FLOAT32)},
                                       {"n", arg_type::scalar(type_id::INT32)},
                                       {"stream", arg_type::stream()}};
  auto const body =
    "scale<<<(n + BLOCK - 1) / BLOCK, BLOCK, 0, stream>>>(data, n, FACTOR);\n"
    "__return_code = static_cast<int>(cudaGetLastError());\n";
  auto const source =
    kernjit::generate({{"BLOCK", int32_t{128}}, {"FACTOR", 2.5f}}, sig, body, {"\"scale.cuh\""});

  auto opts         = options();
  opts.include_dirs = {header_dir};
  auto rt           = make_runtime(opts);
  auto k            = rt->build("scale", sig, source);

  constexpr int n = 1000;
  auto stream     = rmm::cuda_stream_view{};
  rmm::device_uvector<float> data(n, stream);
  std::vector<float> host(n, 4.0f);
  KERNJIT_CUDA_TRY(cudaMemcpyAsync(
    data.data(), host.data(), n * sizeof(float), cudaMemcpyHostToDevice, stream.value()));

  EXPECT_EQ(k(data.data(), int32_t{n}, stream), 0);

  KERNJIT_CUDA_TRY(cudaMemcpyAsync(
    host.data(), data.data(), n * sizeof(float), cudaMemcpyDeviceToHost, stream.value()));
  stream.synchronize();
  for (auto v : host) {
    EXPECT_EQ(v, 10.0f);
  }
}

KERNJIT_TEST_PROGRAM_MAIN()
