/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <nvtx3/nvtx3.hpp>

namespace kernjit {
/**
 * @brief Tag type for libkernjit's NVTX domain.
 */
struct libkernjit_domain {
  static constexpr char const* name{"libkernjit"};  ///< Name of the libkernjit domain
};

/**
 * @brief Alias for an NVTX range in the libkernjit domain.
 *
 * Customizes an NVTX range with the given input.
 *
 * Example:
 * ```
 * void some_function(){
 *    kernjit::scoped_range rng{"custom_name"}; // Customizes range name
 *    ...
 * }
 * ```
 */
using scoped_range = ::nvtx3::scoped_range_in<libkernjit_domain>;

}  // namespace kernjit

/**
 * @brief Convenience macro for generating an NVTX range in the `libkernjit` domain
 * from the lifetime of a function.
 *
 * Uses the name of the immediately enclosing function returned by `__func__` to
 * name the range.
 *
 * Example:
 * ```
 * void some_function(){
 *    KERNJIT_FUNC_RANGE();
 *    ...
 * }
 * ```
 */
#define KERNJIT_FUNC_RANGE() NVTX3_FUNC_RANGE_IN(kernjit::libkernjit_domain)
