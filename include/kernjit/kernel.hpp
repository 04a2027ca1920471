/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/signature.hpp>
#include <kernjit/types.hpp>
#include <kernjit/utilities/export.hpp>

#include <rmm/cuda_stream.hpp>
#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_buffer.hpp>
#include <rmm/device_uvector.hpp>

#include <cuda_runtime_api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file
 * @brief Bound JIT kernels and the live arguments they are invoked with.
 */

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief A live device-addressable buffer argument: its base address and element type.
 *
 * Only the address crosses into the kernel; the higher-level object it was taken from is never
 * passed. The memory must stay live for the duration of the invocation.
 */
struct buffer_arg {
  void const* data;  ///< Base address
  type_id type;      ///< Element type, `VOID` when unknown

  /**
   * @brief Constructs a buffer argument from an address and an element type
   *
   * @param data Base address
   * @param type Element type
   */
  buffer_arg(void const* data, type_id type) : data{data}, type{type} {}

  /**
   * @brief Constructs a buffer argument from a typed pointer; pointee types without a
   * `type_id` are described as `VOID`
   *
   * @param ptr Base address
   */
  template <typename T>
  buffer_arg(T* ptr) : data{ptr}, type{element_type_of<std::remove_cv_t<T>>()}
  {
  }

  /**
   * @brief Constructs an opaque buffer argument from the address of `buffer`
   *
   * @param buffer The device buffer
   */
  buffer_arg(rmm::device_buffer const& buffer) : data{buffer.data()}, type{type_id::VOID} {}

  /**
   * @brief Constructs a typed buffer argument from the address of `vector`
   *
   * @param vector The device vector
   */
  template <typename T>
  buffer_arg(rmm::device_uvector<T> const& vector)
    : data{vector.data()}, type{element_type_of<T>()}
  {
  }

 private:
  template <typename T>
  static constexpr type_id element_type_of()
  {
    constexpr auto id = type_to_id<T>();
    return (id == type_id::EMPTY || id == type_id::STRING) ? type_id::VOID : id;
  }
};

/**
 * @brief The closed set of live arguments a kernel may be invoked with.
 */
using kernel_arg = std::variant<buffer_arg,
                                bool,
                                int8_t,
                                int16_t,
                                int32_t,
                                int64_t,
                                uint8_t,
                                uint16_t,
                                uint32_t,
                                uint64_t,
                                float,
                                double,
                                rmm::cuda_stream_view>;

namespace detail {
template <typename T, typename Variant>
struct is_alternative_of;

template <typename T, typename... Ts>
struct is_alternative_of<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T>
constexpr bool dependent_false = false;

class loaded_kernel;
}  // namespace detail

/**
 * @brief Converts a C++ value into the `kernel_arg` alternative for its kind.
 *
 * Streams (`rmm::cuda_stream_view`, `rmm::cuda_stream`, `cudaStream_t`) become stream
 * arguments; pointers, `rmm::device_buffer` and `rmm::device_uvector` become buffer arguments;
 * `bool` and the fixed-width integer and floating point types are kept at their own width.
 *
 * @tparam T Type of the value
 * @param value The live value
 * @return The kernel argument
 */
template <typename T>
kernel_arg to_kernel_arg(T&& value)
{
  using U = std::remove_cv_t<std::remove_reference_t<T>>;
  if constexpr (std::is_same_v<U, kernel_arg>) {
    return value;
  } else if constexpr (std::is_same_v<U, buffer_arg>) {
    return kernel_arg{std::in_place_type<buffer_arg>, value};
  } else if constexpr (std::is_same_v<U, rmm::cuda_stream_view>) {
    return kernel_arg{std::in_place_type<rmm::cuda_stream_view>, value};
  } else if constexpr (std::is_same_v<U, rmm::cuda_stream>) {
    return kernel_arg{std::in_place_type<rmm::cuda_stream_view>, value.view()};
  } else if constexpr (std::is_same_v<U, cudaStream_t>) {
    return kernel_arg{std::in_place_type<rmm::cuda_stream_view>, rmm::cuda_stream_view{value}};
  } else if constexpr (std::is_pointer_v<U> || std::is_same_v<U, rmm::device_buffer> ||
                       detail::is_device_uvector<U>::value) {
    return kernel_arg{std::in_place_type<buffer_arg>, buffer_arg{value}};
  } else if constexpr (detail::is_alternative_of<U, kernel_arg>::value) {
    return kernel_arg{std::in_place_type<U>, value};
  } else {
    static_assert(detail::dependent_false<U>, "Unsupported kernel argument type");
  }
}

/**
 * @brief A compiled, loaded kernel bound to its signature.
 *
 * Copies share the loaded artifact, which stays loaded while any copy is alive.
 *
 * Example:
 * @code{.cpp}
 * auto k = kernjit::build("scale", sig, source);
 * int status = k(input.data(), output.data(), 2.0f, stream);
 * @endcode
 */
class kernel {
 public:
  /**
   * @brief Wraps a loaded kernel
   *
   * @param impl The loaded kernel
   */
  explicit kernel(std::shared_ptr<detail::loaded_kernel const> impl);

  /**
   * @brief Marshals `args` per the signature and calls the native entry point.
   *
   * Buffers are passed as their base addresses, booleans and scalars by value at their native
   * width, streams as their `cudaStream_t` handle. The call is synchronous with respect to the
   * host; work the kernel enqueues on a stream is not waited for.
   *
   * @throw kernjit::invocation_arity_error if the number of arguments differs from the
   * signature, an argument's kind differs from its parameter's, a scalar's type differs from its
   * parameter's, or a typed buffer's element type differs from a typed buffer parameter's.
   * Nothing is called in that case.
   *
   * @param args One argument per parameter, in declaration order
   * @return The status returned by the kernel, unmodified
   */
  int invoke(std::vector<kernel_arg> const& args) const;

  /**
   * @brief Converts each argument with `to_kernel_arg` and invokes the kernel.
   *
   * @param args One argument per parameter, in declaration order
   * @return The status returned by the kernel, unmodified
   */
  template <typename... Args>
  int operator()(Args&&... args) const
  {
    return invoke(std::vector<kernel_arg>{to_kernel_arg(std::forward<Args>(args))...});
  }

  /// @return The signature the kernel was built from
  [[nodiscard]] signature const& get_signature() const;

  /// @return The kernel name
  [[nodiscard]] std::string const& name() const;

  /// @return The cache key of the artifact
  [[nodiscard]] std::string const& key() const;

  /// @return Path the artifact was loaded from
  [[nodiscard]] std::string const& artifact_path() const;

 private:
  std::shared_ptr<detail::loaded_kernel const> _impl;
};

}  // namespace KERNJIT_EXPORT kernjit
