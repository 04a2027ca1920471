/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit/signature.hpp>
#include <kernjit/types.hpp>
#include <kernjit/utilities/error.hpp>

#include <algorithm>
#include <array>
#include <sstream>
#include <string>
#include <unordered_set>

namespace kernjit {

namespace {

constexpr std::array<char const*, 4> reserved_names{
  "launch", "launch_packed", "__return_code", "__args"};

// C++20 keywords, alternative operator spellings and CUDA qualifiers
constexpr std::array<char const*, 96> cxx_keywords{
  "alignas",      "alignof",     "and",          "and_eq",      "asm",
  "auto",         "bitand",      "bitor",        "bool",        "break",
  "case",         "catch",       "char",         "char8_t",     "char16_t",
  "char32_t",     "class",       "compl",        "concept",     "const",
  "consteval",    "constexpr",   "constinit",    "const_cast",  "continue",
  "co_await",     "co_return",   "co_yield",     "decltype",    "default",
  "delete",       "do",          "double",       "dynamic_cast", "else",
  "enum",         "explicit",    "export",       "extern",      "false",
  "float",        "for",         "friend",       "goto",        "if",
  "inline",       "int",         "long",         "mutable",     "namespace",
  "new",          "noexcept",    "not",          "not_eq",      "nullptr",
  "operator",     "or",          "or_eq",        "private",     "protected",
  "public",       "register",    "reinterpret_cast", "requires", "return",
  "short",        "signed",      "sizeof",       "static",      "static_assert",
  "static_cast",  "struct",      "switch",       "template",    "this",
  "thread_local", "throw",       "true",         "try",         "typedef",
  "typeid",       "typename",    "union",        "unsigned",    "using",
  "virtual",      "void",        "volatile",     "wchar_t",     "while",
  "xor",          "xor_eq",      "__restrict__", "__global__",  "__device__",
  "__host__"};

bool is_keyword(std::string const& name)
{
  return std::any_of(cxx_keywords.begin(), cxx_keywords.end(), [&](char const* keyword) {
    return name == keyword;
  });
}

std::string describe_arg_type(arg_type type)
{
  switch (type.get_category()) {
    case arg_type::category::DEVICE_BUFFER: return "device_buffer<" + type_id_name(type.type()) + ">";
    case arg_type::category::SCALAR: return "scalar<" + type_id_name(type.type()) + ">";
    case arg_type::category::STREAM: return "stream";
  }
  return "unknown";
}

}  // namespace

std::string param_kind_name(param_kind kind)
{
  switch (kind) {
    case param_kind::BUFFER: return "BUFFER";
    case param_kind::BOOL: return "BOOL";
    case param_kind::FLOAT: return "FLOAT";
    case param_kind::INT: return "INT";
    case param_kind::STREAM: return "STREAM";
  }
  KERNJIT_FAIL("Invalid parameter kind");
}

param_kind classify(arg_type type)
{
  auto const id = type.type();
  switch (type.get_category()) {
    case arg_type::category::DEVICE_BUFFER:
      if (id != type_id::EMPTY && id != type_id::STRING && id < type_id::NUM_TYPE_IDS) {
        return param_kind::BUFFER;
      }
      break;
    case arg_type::category::SCALAR:
      if (id == type_id::BOOL8) { return param_kind::BOOL; }
      if (is_floating_scalar(id)) { return param_kind::FLOAT; }
      if (is_integral(id)) { return param_kind::INT; }
      break;
    case arg_type::category::STREAM: return param_kind::STREAM;
  }
  KERNJIT_FAIL("Unsupported kernel argument type: " + describe_arg_type(type),
               kernjit::argument_type_error);
}

bool is_identifier(std::string const& name)
{
  if (name.empty()) { return false; }
  auto const is_alpha = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  };
  auto const is_digit = [](char c) { return c >= '0' && c <= '9'; };
  if (!is_alpha(name.front())) { return false; }
  if (!std::all_of(
        name.begin(), name.end(), [&](char c) { return is_alpha(c) || is_digit(c); })) {
    return false;
  }
  return !is_keyword(name);
}

bool is_reserved_name(std::string const& name)
{
  return std::any_of(
    reserved_names.begin(), reserved_names.end(), [&](char const* r) { return name == r; });
}

param::param(std::string name, arg_type type)
  : _name{std::move(name)}, _kind{classify(type)}, _type{type.type()}
{
  KERNJIT_EXPECTS(is_identifier(_name), "Invalid kernel parameter name: '" + _name + "'");
  KERNJIT_EXPECTS(!is_reserved_name(_name), "Reserved kernel parameter name: '" + _name + "'");
}

std::string param::native_type_name() const
{
  switch (_kind) {
    case param_kind::BUFFER: return type_to_name(_type) + "*";
    case param_kind::BOOL: return "bool";
    case param_kind::FLOAT:
    case param_kind::INT: return type_to_name(_type);
    case param_kind::STREAM: return "cudaStream_t";
  }
  KERNJIT_FAIL("Invalid parameter kind");
}

signature::signature(std::vector<std::pair<std::string, arg_type>> const& params)
{
  _params.reserve(params.size());
  // classify everything first so an unsupported kind is reported ahead of naming problems
  for (auto const& entry : params) {
    static_cast<void>(classify(entry.second));
  }

  std::unordered_set<std::string> seen;
  for (auto const& [name, type] : params) {
    KERNJIT_EXPECTS(seen.insert(name).second, "Duplicate kernel parameter name: '" + name + "'");
    _params.emplace_back(name, type);
  }
}

signature::signature(std::initializer_list<std::pair<std::string, arg_type>> params)
  : signature(std::vector<std::pair<std::string, arg_type>>{params})
{
}

std::string signature::describe() const
{
  std::ostringstream out;
  for (std::size_t i = 0; i < _params.size(); ++i) {
    auto const& p = _params[i];
    out << i << ' ' << p.name() << ' ' << param_kind_name(p.kind()) << ' '
        << type_id_name(p.type()) << '\n';
  }
  return out.str();
}

}  // namespace kernjit
