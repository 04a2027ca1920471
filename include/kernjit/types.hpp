/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#include <cuda_bf16.h>
#include <cuda_fp16.h>
#include <cuda_fp8.h>

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file
 * @brief Type declarations for libkernjit.
 */

namespace KERNJIT_EXPORT kernjit {

/**
 * @addtogroup utility_types
 * @{
 */

/**
 * @brief Identifies the element type of a kernel buffer or the type of a kernel scalar.
 */
enum class type_id : int32_t {
  EMPTY,     ///< No native representation
  VOID,      ///< Opaque element type, only meaningful for buffers
  BOOL8,     ///< Boolean using one byte per value
  INT8,      ///< 1 byte signed integer
  INT16,     ///< 2 byte signed integer
  INT32,     ///< 4 byte signed integer
  INT64,     ///< 8 byte signed integer
  UINT8,     ///< 1 byte unsigned integer
  UINT16,    ///< 2 byte unsigned integer
  UINT32,    ///< 4 byte unsigned integer
  UINT64,    ///< 8 byte unsigned integer
  FLOAT16,   ///< IEEE half precision
  BFLOAT16,  ///< bfloat16
  FLOAT32,   ///< 4 byte floating point
  FLOAT64,   ///< 8 byte floating point
  FP8_E4M3,  ///< 8 bit float, 4 exponent and 3 mantissa bits
  FP8_E5M2,  ///< 8 bit float, 5 exponent and 2 mantissa bits
  STRING,    ///< Variable width string elements
  // `NUM_TYPE_IDS` must be last!
  NUM_TYPE_IDS  ///< Total number of type ids
};

/**
 * @brief Maps a C++ type to its corresponding `kernjit::type_id`
 *
 * When explicitly passed a template argument of a given type, returns the
 * appropriate `type_id` enum for the specified C++ type.
 *
 * For example:
 *
 * ```
 * return kernjit::type_to_id<int32_t>();        // Returns INT32
 * ```
 *
 * Types without a mapping return `type_id::EMPTY`.
 *
 * @tparam T The type to map to a `kernjit::type_id`
 * @return The `kernjit::type_id` corresponding to the specified type
 */
template <typename T>
inline constexpr type_id type_to_id()
{
  return type_id::EMPTY;
};

/**
 * @brief Macro used to define a mapping between a concrete C++ type and a
 *`kernjit::type_id` enum.
 *
 * @param Type The concrete C++ type
 * @param Id The `kernjit::type_id` enum
 */
#ifndef KERNJIT_TYPE_MAPPING
#define KERNJIT_TYPE_MAPPING(Type, Id)        \
  template <>                                 \
  constexpr inline type_id type_to_id<Type>() \
  {                                           \
    return Id;                                \
  }
#endif

// Defines all of the mappings between C++ types and their corresponding `kernjit::type_id` values.
KERNJIT_TYPE_MAPPING(void, type_id::VOID)
KERNJIT_TYPE_MAPPING(bool, type_id::BOOL8)
KERNJIT_TYPE_MAPPING(int8_t, type_id::INT8)
KERNJIT_TYPE_MAPPING(int16_t, type_id::INT16)
KERNJIT_TYPE_MAPPING(int32_t, type_id::INT32)
KERNJIT_TYPE_MAPPING(int64_t, type_id::INT64)
KERNJIT_TYPE_MAPPING(uint8_t, type_id::UINT8)
KERNJIT_TYPE_MAPPING(uint16_t, type_id::UINT16)
KERNJIT_TYPE_MAPPING(uint32_t, type_id::UINT32)
KERNJIT_TYPE_MAPPING(uint64_t, type_id::UINT64)
KERNJIT_TYPE_MAPPING(__half, type_id::FLOAT16)
KERNJIT_TYPE_MAPPING(__nv_bfloat16, type_id::BFLOAT16)
KERNJIT_TYPE_MAPPING(float, type_id::FLOAT32)
KERNJIT_TYPE_MAPPING(double, type_id::FLOAT64)
KERNJIT_TYPE_MAPPING(__nv_fp8_e4m3, type_id::FP8_E4M3)
KERNJIT_TYPE_MAPPING(__nv_fp8_e5m2, type_id::FP8_E5M2)
KERNJIT_TYPE_MAPPING(std::string, type_id::STRING)

/**
 * @brief Returns the CUDA C++ spelling of the type identified by `id`, as it must appear in
 * generated source.
 *
 * Example:
 * @code
 *   auto s = kernjit::type_to_name(kernjit::type_id::BFLOAT16);
 *   // s == std::string("__nv_bfloat16")
 * @endcode
 *
 * @throw kernjit::logic_error if `id` has no native spelling (`EMPTY`, `STRING`)
 *
 * @param id The type identifier
 * @return The native type name
 */
std::string type_to_name(type_id id);

/**
 * @brief Returns a human-readable name for `id` (e.g. "INT32"), used in error messages and
 * signature descriptions.
 *
 * @param id The type identifier
 * @return The enumerator name
 */
std::string type_id_name(type_id id);

/**
 * @brief Returns the size in bytes of one element of type `id`.
 *
 * @throw kernjit::logic_error if `id` has no fixed width (`EMPTY`, `VOID`, `STRING`)
 *
 * @param id The type identifier
 * @return Size in bytes
 */
std::size_t size_of(type_id id);

/**
 * @brief Indicates whether `id` is one of the integer types (signed or unsigned).
 *
 * @param id The type identifier
 * @return true if `id` is INT8..INT64 or UINT8..UINT64
 */
constexpr bool is_integral(type_id id) noexcept
{
  return id >= type_id::INT8 && id <= type_id::UINT64;
}

/**
 * @brief Indicates whether `id` is one of the floating point types usable as a scalar.
 *
 * @param id The type identifier
 * @return true if `id` is FLOAT32 or FLOAT64
 */
constexpr bool is_floating_scalar(type_id id) noexcept
{
  return id == type_id::FLOAT32 || id == type_id::FLOAT64;
}

/** @} */

}  // namespace KERNJIT_EXPORT kernjit
