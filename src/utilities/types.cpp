/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit/types.hpp>
#include <kernjit/utilities/error.hpp>

#include <string>

namespace kernjit {

std::string type_to_name(type_id id)
{
  switch (id) {
    case type_id::VOID: return "void";
    case type_id::BOOL8: return "bool";
    case type_id::INT8: return "int8_t";
    case type_id::INT16: return "int16_t";
    case type_id::INT32: return "int32_t";
    case type_id::INT64: return "int64_t";
    case type_id::UINT8: return "uint8_t";
    case type_id::UINT16: return "uint16_t";
    case type_id::UINT32: return "uint32_t";
    case type_id::UINT64: return "uint64_t";
    case type_id::FLOAT16: return "__half";
    case type_id::BFLOAT16: return "__nv_bfloat16";
    case type_id::FLOAT32: return "float";
    case type_id::FLOAT64: return "double";
    case type_id::FP8_E4M3: return "__nv_fp8_e4m3";
    case type_id::FP8_E5M2: return "__nv_fp8_e5m2";
    default: KERNJIT_FAIL("No native type name for type " + type_id_name(id));
  }
}

std::string type_id_name(type_id id)
{
  switch (id) {
    case type_id::EMPTY: return "EMPTY";
    case type_id::VOID: return "VOID";
    case type_id::BOOL8: return "BOOL8";
    case type_id::INT8: return "INT8";
    case type_id::INT16: return "INT16";
    case type_id::INT32: return "INT32";
    case type_id::INT64: return "INT64";
    case type_id::UINT8: return "UINT8";
    case type_id::UINT16: return "UINT16";
    case type_id::UINT32: return "UINT32";
    case type_id::UINT64: return "UINT64";
    case type_id::FLOAT16: return "FLOAT16";
    case type_id::BFLOAT16: return "BFLOAT16";
    case type_id::FLOAT32: return "FLOAT32";
    case type_id::FLOAT64: return "FLOAT64";
    case type_id::FP8_E4M3: return "FP8_E4M3";
    case type_id::FP8_E5M2: return "FP8_E5M2";
    case type_id::STRING: return "STRING";
    default: return "UNKNOWN(" + std::to_string(static_cast<int32_t>(id)) + ")";
  }
}

std::size_t size_of(type_id id)
{
  switch (id) {
    case type_id::BOOL8:
    case type_id::INT8:
    case type_id::UINT8:
    case type_id::FP8_E4M3:
    case type_id::FP8_E5M2: return 1;
    case type_id::INT16:
    case type_id::UINT16:
    case type_id::FLOAT16:
    case type_id::BFLOAT16: return 2;
    case type_id::INT32:
    case type_id::UINT32:
    case type_id::FLOAT32: return 4;
    case type_id::INT64:
    case type_id::UINT64:
    case type_id::FLOAT64: return 8;
    default: KERNJIT_FAIL("size_of is not defined for type " + type_id_name(id));
  }
}

}  // namespace kernjit
