/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "jit/loader.hpp"

#include <kernjit/detail/nvtx/ranges.hpp>
#include <kernjit/kernel.hpp>
#include <kernjit/utilities/error.hpp>

#include <cstring>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace kernjit {

namespace {

// one argument as the generated adapter reads it: the value at the start of the slot
struct alignas(8) arg_slot {
  unsigned char bytes[8];
};

template <typename T>
void store(arg_slot& slot, T const& value)
{
  static_assert(sizeof(T) <= sizeof(arg_slot::bytes));
  std::memcpy(slot.bytes, &value, sizeof(T));
}

std::string describe_arg(kernel_arg const& arg)
{
  return std::visit(
    [](auto const& value) -> std::string {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, buffer_arg>) {
        return "buffer<" + type_id_name(value.type) + ">";
      } else if constexpr (std::is_same_v<T, rmm::cuda_stream_view>) {
        return "stream";
      } else {
        return "scalar<" + type_id_name(type_to_id<T>()) + ">";
      }
    },
    arg);
}

bool matches(param const& p, kernel_arg const& arg)
{
  return std::visit(
    [&](auto const& value) -> bool {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, buffer_arg>) {
        return p.kind() == param_kind::BUFFER &&
               (p.type() == type_id::VOID || value.type == type_id::VOID || p.type() == value.type);
      } else if constexpr (std::is_same_v<T, rmm::cuda_stream_view>) {
        return p.kind() == param_kind::STREAM;
      } else if constexpr (std::is_same_v<T, bool>) {
        return p.kind() == param_kind::BOOL;
      } else {
        return (p.kind() == param_kind::INT || p.kind() == param_kind::FLOAT) &&
               p.type() == type_to_id<T>();
      }
    },
    arg);
}

void marshal(kernel_arg const& arg, arg_slot& slot)
{
  std::visit(
    [&](auto const& value) {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, buffer_arg>) {
        store(slot, const_cast<void*>(value.data));
      } else if constexpr (std::is_same_v<T, rmm::cuda_stream_view>) {
        store(slot, value.value());
      } else {
        store(slot, value);
      }
    },
    arg);
}

}  // namespace

kernel::kernel(std::shared_ptr<detail::loaded_kernel const> impl) : _impl{std::move(impl)}
{
  KERNJIT_EXPECTS(_impl != nullptr, "A kernel requires a loaded artifact");
}

int kernel::invoke(std::vector<kernel_arg> const& args) const
{
  KERNJIT_FUNC_RANGE();

  auto const& sig = _impl->get_signature();
  KERNJIT_EXPECTS(args.size() == sig.size(),
                  "Kernel " + _impl->name() + " expects " + std::to_string(sig.size()) +
                    " arguments, got " + std::to_string(args.size()),
                  invocation_arity_error);

  for (std::size_t i = 0; i < args.size(); ++i) {
    KERNJIT_EXPECTS(matches(sig[i], args[i]),
                    "Kernel " + _impl->name() + " argument " + std::to_string(i) + " (" +
                      sig[i].name() + ") expects " + param_kind_name(sig[i].kind()) + "<" +
                      type_id_name(sig[i].type()) + ">, got " + describe_arg(args[i]),
                    invocation_arity_error);
  }

  std::vector<arg_slot> slots(args.size());
  std::vector<void*> packed(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    marshal(args[i], slots[i]);
    packed[i] = slots[i].bytes;
  }

  return _impl->entry()(packed.data());
}

signature const& kernel::get_signature() const { return _impl->get_signature(); }

std::string const& kernel::name() const { return _impl->name(); }

std::string const& kernel::key() const { return _impl->key(); }

std::string const& kernel::artifact_path() const { return _impl->artifact_path(); }

}  // namespace kernjit
