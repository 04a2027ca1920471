/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/signature.hpp>
#include <kernjit/utilities/export.hpp>

#include <string>
#include <utility>
#include <vector>

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief Generates the complete CUDA C++ source of a JIT kernel.
 *
 * The generated translation unit contains
 * - the standard includes (`<cuda.h>`, `<cuda_runtime.h>`, `<cstdint>`, `<iostream>`), the
 *   half/bfloat16/fp8 headers when the signature uses those element types, and `includes`,
 *   merged, deduplicated and sorted with system includes first
 * - one `static constexpr` definition per compile-time constant
 * - the entry point `extern "C" int launch(...)` whose formal parameters mirror `sig` in
 *   order and native type, and whose body is `body` spliced verbatim between the
 *   declaration of `int __return_code = 0;` and `return __return_code;`
 * - the packed-argument adapter `extern "C" int launch_packed(void** __args)` that unpacks
 *   one slot per parameter and forwards to `launch`
 *
 * The function is pure: identical inputs always produce byte-identical text.
 *
 * @throw kernjit::logic_error if a constant name is not a valid identifier, is reserved,
 * is duplicated, or collides with a parameter name
 *
 * @param constants Compile-time constants, in emission order
 * @param sig The classified runtime signature
 * @param body Code fragment forming the body of `launch`
 * @param includes Extra include targets, spelled with their delimiters (`<x.h>` or `"x.h"`)
 * @return The generated source text
 */
std::string generate(std::vector<compile_time_constant> const& constants,
                     signature const& sig,
                     std::string const& body,
                     std::vector<std::string> const& includes = {});

/**
 * @brief Substitutes `{key}` placeholders in a code template.
 *
 * Each placeholder whose key appears in `replacements` is replaced by its value;
 * placeholders with unknown keys, and braces that do not form a placeholder, are copied
 * through unchanged. Replacement values are not rescanned.
 *
 * Example:
 * @code{.cpp}
 * auto code = kernjit::format_template("gemm<{BLOCK_M}, {BLOCK_N}>(lhs, rhs, out);",
 *                                      {{"BLOCK_M", "128"}, {"BLOCK_N", "64"}});
 * // code == "gemm<128, 64>(lhs, rhs, out);"
 * @endcode
 *
 * @param text The template text
 * @param replacements `(key, value)` pairs
 * @return The formatted text
 */
std::string format_template(std::string const& text,
                            std::vector<std::pair<std::string, std::string>> const& replacements);

}  // namespace KERNJIT_EXPORT kernjit
