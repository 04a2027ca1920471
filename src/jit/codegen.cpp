/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit/codegen.hpp>
#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/signature.hpp>
#include <kernjit/utilities/error.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <set>
#include <string>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace kernjit {

namespace {

std::string const standard_includes[] = {"<cuda.h>", "<cuda_runtime.h>", "<cstdint>", "<iostream>"};

template <typename T>
std::string format_floating(T value)
{
  char buffer[64];
  auto const result = std::to_chars(buffer, buffer + sizeof(buffer), value);
  KERNJIT_EXPECTS(result.ec == std::errc{}, "Failed to format floating point constant");
  std::string text{buffer, result.ptr};
  KERNJIT_EXPECTS(text.find_first_of("ni") == std::string::npos,
                  "Compile-time constants must be finite: " + text);
  // keep the literal floating point even when the shortest form is integral
  if (text.find_first_of(".e") == std::string::npos) { text += ".0"; }
  if constexpr (std::is_same_v<T, float>) { text += "f"; }
  return text;
}

struct constant_formatter {
  std::string operator()(bool value) const { return value ? "true" : "false"; }
  // the most negative values have no literal spelling
  std::string operator()(int32_t value) const
  {
    if (value == std::numeric_limits<int32_t>::min()) { return "(-2147483647 - 1)"; }
    return std::to_string(value);
  }
  std::string operator()(int64_t value) const
  {
    if (value == std::numeric_limits<int64_t>::min()) { return "(-9223372036854775807LL - 1)"; }
    return std::to_string(value) + "LL";
  }
  std::string operator()(uint32_t value) const { return std::to_string(value) + "U"; }
  std::string operator()(uint64_t value) const { return std::to_string(value) + "ULL"; }
  std::string operator()(float value) const { return format_floating(value); }
  std::string operator()(double value) const { return format_floating(value); }
};

struct constant_type_name {
  template <typename T>
  std::string operator()(T) const
  {
    return type_to_name(type_to_id<T>());
  }
};

void validate_constants(std::vector<compile_time_constant> const& constants, signature const& sig)
{
  std::unordered_set<std::string> names;
  for (auto const& p : sig) {
    names.insert(p.name());
  }
  for (auto const& c : constants) {
    KERNJIT_EXPECTS(is_identifier(c.name), "Invalid compile-time constant name: '" + c.name + "'");
    KERNJIT_EXPECTS(!is_reserved_name(c.name),
                    "Reserved compile-time constant name: '" + c.name + "'");
    KERNJIT_EXPECTS(names.insert(c.name).second,
                    "Compile-time constant name collides with another name: '" + c.name + "'");
  }
}

std::vector<std::string> collect_includes(signature const& sig,
                                          std::vector<std::string> const& extra)
{
  std::set<std::string> system_includes(std::begin(standard_includes),
                                        std::end(standard_includes));
  std::set<std::string> package_includes;

  for (auto const& p : sig) {
    switch (p.type()) {
      case type_id::FLOAT16: system_includes.insert("<cuda_fp16.h>"); break;
      case type_id::BFLOAT16: system_includes.insert("<cuda_bf16.h>"); break;
      case type_id::FP8_E4M3:
      case type_id::FP8_E5M2: system_includes.insert("<cuda_fp8.h>"); break;
      default: break;
    }
  }

  for (auto const& include : extra) {
    auto const is_system  = include.size() > 2 && include.front() == '<' && include.back() == '>';
    auto const is_package = include.size() > 2 && include.front() == '"' && include.back() == '"';
    KERNJIT_EXPECTS(is_system || is_package,
                    "Include must be spelled as <header> or \"header\": " + include);
    (is_system ? system_includes : package_includes).insert(include);
  }

  std::vector<std::string> result(system_includes.begin(), system_includes.end());
  result.insert(result.end(), package_includes.begin(), package_includes.end());
  return result;
}

}  // namespace

std::string generate(std::vector<compile_time_constant> const& constants,
                     signature const& sig,
                     std::string const& body,
                     std::vector<std::string> const& includes)
{
  KERNJIT_FUNC_RANGE();

  validate_constants(constants, sig);

  std::string code = "// kernjit auto-generated JIT CUDA source file\n\n";

  for (auto const& include : collect_includes(sig, includes)) {
    code += "#include " + include + "\n";
  }
  code += "\n";

  if (!constants.empty()) {
    for (auto const& c : constants) {
      code += "static constexpr " + std::visit(constant_type_name{}, c.value) + " " + c.name +
              " = " + std::visit(constant_formatter{}, c.value) + ";\n";
    }
    code += "\n";
  }

  // entry point
  code += "extern \"C\" __attribute__((visibility(\"default\"))) int launch(";
  for (std::size_t i = 0; i < sig.size(); ++i) {
    if (i > 0) { code += ", "; }
    code += sig[i].native_type_name() + " " + sig[i].name();
  }
  code += ") {\n";
  code += "int __return_code = 0;\n";
  code += body;
  if (!body.empty() && body.back() != '\n') { code += "\n"; }
  code += "return __return_code;\n";
  code += "}\n\n";

  // packed-argument adapter
  code += "extern \"C\" __attribute__((visibility(\"default\"))) int launch_packed(void** __args) {\n";
  code += "return launch(";
  for (std::size_t i = 0; i < sig.size(); ++i) {
    if (i > 0) { code += ",\n              "; }
    auto const& p   = sig[i];
    auto const slot = "__args[" + std::to_string(i) + "]";
    if (p.kind() == param_kind::BUFFER) {
      code += "static_cast<" + p.native_type_name() + ">(*static_cast<void**>(" + slot + "))";
    } else {
      code += "*static_cast<" + p.native_type_name() + "*>(" + slot + ")";
    }
  }
  code += ");\n";
  code += "}\n";

  return code;
}

std::string format_template(std::string const& text,
                            std::vector<std::pair<std::string, std::string>> const& replacements)
{
  std::string result;
  result.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    auto const open = text.find('{', pos);
    if (open == std::string::npos) { break; }
    auto const close = text.find('}', open + 1);
    if (close == std::string::npos) { break; }

    auto const key = text.substr(open + 1, close - open - 1);
    auto const it  = std::find_if(replacements.begin(), replacements.end(), [&](auto const& r) {
      return r.first == key;
    });

    result.append(text, pos, open - pos);
    if (it != replacements.end()) {
      result += it->second;
      pos = close + 1;
    } else {
      // not a placeholder we know; emit the brace and rescan after it
      result += '{';
      pos = open + 1;
    }
  }
  result.append(text, pos, std::string::npos);
  return result;
}

}  // namespace kernjit
