/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit_test/base_fixture.hpp>
#include <kernjit_test/testing_main.hpp>

#include <kernjit/signature.hpp>
#include <kernjit/types.hpp>
#include <kernjit/utilities/error.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_buffer.hpp>
#include <rmm/device_uvector.hpp>

#include <string>

using kernjit::arg_type;
using kernjit::param_kind;
using kernjit::type_id;

struct SignatureTest : public kernjit::test::BaseFixture {};

TEST_F(SignatureTest, ClassifyBuffers)
{
  for (auto id : {type_id::VOID,
                  type_id::BOOL8,
                  type_id::INT8,
                  type_id::UINT64,
                  type_id::FLOAT16,
                  type_id::BFLOAT16,
                  type_id::FLOAT32,
                  type_id::FLOAT64,
                  type_id::FP8_E4M3,
                  type_id::FP8_E5M2}) {
    EXPECT_EQ(kernjit::classify(arg_type::device_buffer(id)), param_kind::BUFFER)
      << kernjit::type_id_name(id);
  }
}

TEST_F(SignatureTest, ClassifyScalars)
{
  EXPECT_EQ(kernjit::classify(arg_type::scalar(type_id::BOOL8)), param_kind::BOOL);
  EXPECT_EQ(kernjit::classify(arg_type::scalar(type_id::FLOAT32)), param_kind::FLOAT);
  EXPECT_EQ(kernjit::classify(arg_type::scalar(type_id::FLOAT64)), param_kind::FLOAT);
  for (auto id : {type_id::INT8,
                  type_id::INT16,
                  type_id::INT32,
                  type_id::INT64,
                  type_id::UINT8,
                  type_id::UINT16,
                  type_id::UINT32,
                  type_id::UINT64}) {
    EXPECT_EQ(kernjit::classify(arg_type::scalar(id)), param_kind::INT)
      << kernjit::type_id_name(id);
  }
  EXPECT_EQ(kernjit::classify(arg_type::stream()), param_kind::STREAM);
}

TEST_F(SignatureTest, ClassifyRejectsUnsupported)
{
  EXPECT_THROW(kernjit::classify(arg_type::scalar(type_id::STRING)), kernjit::argument_type_error);
  EXPECT_THROW(kernjit::classify(arg_type::scalar(type_id::EMPTY)), kernjit::argument_type_error);
  EXPECT_THROW(kernjit::classify(arg_type::scalar(type_id::VOID)), kernjit::argument_type_error);
  EXPECT_THROW(kernjit::classify(arg_type::scalar(type_id::FLOAT16)),
               kernjit::argument_type_error);
  EXPECT_THROW(kernjit::classify(arg_type::device_buffer(type_id::STRING)),
               kernjit::argument_type_error);
  EXPECT_THROW(kernjit::classify(arg_type::device_buffer(type_id::EMPTY)),
               kernjit::argument_type_error);
}

TEST_F(SignatureTest, ClassifyIsDeterministic)
{
  auto const first  = kernjit::classify(arg_type::scalar(type_id::INT64));
  auto const second = kernjit::classify(arg_type::scalar(type_id::INT64));
  EXPECT_EQ(first, second);

  std::string first_error;
  std::string second_error;
  try {
    kernjit::classify(arg_type::scalar(type_id::STRING));
  } catch (kernjit::argument_type_error const& e) {
    first_error = e.what();
  }
  try {
    kernjit::classify(arg_type::scalar(type_id::STRING));
  } catch (kernjit::argument_type_error const& e) {
    second_error = e.what();
  }
  EXPECT_FALSE(first_error.empty());
  EXPECT_EQ(first_error, second_error);
  EXPECT_NE(first_error.find("scalar<STRING>"), std::string::npos);
}

TEST_F(SignatureTest, ArgTypeOf)
{
  constexpr auto f32_ptr = kernjit::arg_type_of<float*>();
  EXPECT_EQ(f32_ptr.get_category(), arg_type::category::DEVICE_BUFFER);
  EXPECT_EQ(f32_ptr.type(), type_id::FLOAT32);

  constexpr auto void_ptr = kernjit::arg_type_of<void const*>();
  EXPECT_EQ(void_ptr.get_category(), arg_type::category::DEVICE_BUFFER);
  EXPECT_EQ(void_ptr.type(), type_id::VOID);

  EXPECT_EQ(kernjit::arg_type_of<rmm::device_buffer>().type(), type_id::VOID);
  EXPECT_EQ(kernjit::arg_type_of<rmm::device_uvector<__nv_bfloat16>>().type(), type_id::BFLOAT16);
  EXPECT_EQ(kernjit::arg_type_of<rmm::cuda_stream_view>().get_category(),
            arg_type::category::STREAM);
  EXPECT_EQ(kernjit::arg_type_of<cudaStream_t>().get_category(), arg_type::category::STREAM);
  EXPECT_EQ(kernjit::arg_type_of<bool>().type(), type_id::BOOL8);
  EXPECT_EQ(kernjit::arg_type_of<int64_t const&>().type(), type_id::INT64);
  EXPECT_EQ(kernjit::arg_type_of<std::string>().type(), type_id::STRING);
}

TEST_F(SignatureTest, NativeTypeNames)
{
  auto const sig = kernjit::signature{{"a", arg_type::device_buffer(type_id::FP8_E4M3)},
                                      {"b", arg_type::device_buffer()},
                                      {"flag", kernjit::arg_type_of<bool>()},
                                      {"alpha", kernjit::arg_type_of<float>()},
                                      {"n", kernjit::arg_type_of<uint64_t>()},
                                      {"stream", arg_type::stream()}};
  ASSERT_EQ(sig.size(), 6u);
  EXPECT_EQ(sig[0].native_type_name(), "__nv_fp8_e4m3*");
  EXPECT_EQ(sig[1].native_type_name(), "void*");
  EXPECT_EQ(sig[2].native_type_name(), "bool");
  EXPECT_EQ(sig[3].native_type_name(), "float");
  EXPECT_EQ(sig[4].native_type_name(), "uint64_t");
  EXPECT_EQ(sig[5].native_type_name(), "cudaStream_t");
  EXPECT_EQ(sig[5].type(), type_id::EMPTY);
}

TEST_F(SignatureTest, Describe)
{
  auto const sig = kernjit::signature{{"out", arg_type::device_buffer(type_id::BFLOAT16)},
                                      {"flag", arg_type::scalar(type_id::BOOL8)},
                                      {"stream", arg_type::stream()}};
  EXPECT_EQ(sig.describe(), "0 out BUFFER BFLOAT16\n1 flag BOOL BOOL8\n2 stream STREAM EMPTY\n");
}

TEST_F(SignatureTest, EmptySignature)
{
  kernjit::signature const sig{};
  EXPECT_TRUE(sig.empty());
  EXPECT_EQ(sig.describe(), "");
}

TEST_F(SignatureTest, UnsupportedKindReportedFirst)
{
  // the invalid name would also be an error; the unsupported kind wins
  EXPECT_THROW((kernjit::signature{{"1bad", arg_type::device_buffer()},
                                   {"s", arg_type::scalar(type_id::STRING)}}),
               kernjit::argument_type_error);
}

TEST_F(SignatureTest, InvalidNames)
{
  EXPECT_THROW((kernjit::signature{{"", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"9lives", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"has space", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"launch", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"__return_code", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"x", arg_type::stream()}, {"x", arg_type::device_buffer()}}),
               kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"int", arg_type::stream()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"class", arg_type::device_buffer()}}), kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"return", arg_type::scalar(type_id::INT32)}}),
               kernjit::logic_error);
  EXPECT_THROW((kernjit::signature{{"__global__", arg_type::stream()}}), kernjit::logic_error);
}

TEST_F(SignatureTest, Identifiers)
{
  EXPECT_TRUE(kernjit::is_identifier("_x1"));
  EXPECT_TRUE(kernjit::is_identifier("BLOCK_M"));
  EXPECT_FALSE(kernjit::is_identifier("1x"));
  EXPECT_FALSE(kernjit::is_identifier("a-b"));
  EXPECT_FALSE(kernjit::is_identifier("while"));
  EXPECT_FALSE(kernjit::is_identifier("xor_eq"));
  EXPECT_FALSE(kernjit::is_identifier("nullptr"));
  EXPECT_TRUE(kernjit::is_identifier("integer"));
  EXPECT_TRUE(kernjit::is_identifier("Int"));
  EXPECT_TRUE(kernjit::is_reserved_name("launch_packed"));
  EXPECT_TRUE(kernjit::is_reserved_name("__args"));
  EXPECT_FALSE(kernjit::is_reserved_name("args"));
}

TEST_F(SignatureTest, TypeNames)
{
  EXPECT_EQ(kernjit::type_to_name(type_id::BFLOAT16), "__nv_bfloat16");
  EXPECT_EQ(kernjit::type_to_name(type_id::FP8_E5M2), "__nv_fp8_e5m2");
  EXPECT_EQ(kernjit::type_to_name(type_id::UINT16), "uint16_t");
  EXPECT_THROW(kernjit::type_to_name(type_id::STRING), kernjit::logic_error);
  EXPECT_EQ(kernjit::size_of(type_id::FP8_E4M3), 1u);
  EXPECT_EQ(kernjit::size_of(type_id::BFLOAT16), 2u);
  EXPECT_EQ(kernjit::size_of(type_id::FLOAT64), 8u);
  EXPECT_THROW(kernjit::size_of(type_id::VOID), kernjit::logic_error);
}

KERNJIT_TEST_PROGRAM_MAIN()
