/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/types.hpp>
#include <kernjit/utilities/export.hpp>

#include <rmm/cuda_stream.hpp>
#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_buffer.hpp>
#include <rmm/device_uvector.hpp>

#include <cuda_runtime_api.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file
 * @brief Kernel signatures: the ordered, kind-tagged parameter list of a JIT kernel.
 */

namespace KERNJIT_EXPORT kernjit {

/**
 * @brief The closed set of parameter kinds a kernel may accept.
 *
 * Each kind has exactly one marshalling rule at invocation time.
 */
enum class param_kind : int8_t {
  BUFFER,  ///< Device-addressable buffer, passed as its base address
  BOOL,    ///< Boolean, passed by value
  FLOAT,   ///< Floating point scalar, passed by value at native width
  INT,     ///< Integer scalar, passed by value at native width
  STREAM   ///< CUDA stream, passed as the native `cudaStream_t` handle
};

/**
 * @brief Returns the name of a parameter kind (e.g. "BUFFER").
 *
 * @param kind The parameter kind
 * @return The enumerator name
 */
std::string param_kind_name(param_kind kind);

/**
 * @brief Describes the class of a runtime argument before it has been classified.
 *
 * An `arg_type` may describe arguments the runtime cannot pass to a kernel (e.g. a
 * string scalar); such descriptions are rejected by `classify`.
 */
class arg_type {
 public:
  /// @brief Broad category of a runtime argument
  enum class category : int8_t {
    DEVICE_BUFFER,  ///< Memory addressed through a pointer
    SCALAR,         ///< A single value
    STREAM          ///< An execution stream
  };

  /**
   * @brief Describes a device buffer whose elements have type `element`
   *
   * @param element Element type; `type_id::VOID` describes an opaque buffer
   * @return The argument description
   */
  static constexpr arg_type device_buffer(type_id element = type_id::VOID)
  {
    return arg_type{category::DEVICE_BUFFER, element};
  }

  /**
   * @brief Describes a scalar of type `type`
   *
   * @param type The scalar type
   * @return The argument description
   */
  static constexpr arg_type scalar(type_id type) { return arg_type{category::SCALAR, type}; }

  /**
   * @brief Describes a CUDA stream
   *
   * @return The argument description
   */
  static constexpr arg_type stream() { return arg_type{category::STREAM, type_id::EMPTY}; }

  /**
   * @brief Returns the category of the argument
   *
   * @return The category
   */
  [[nodiscard]] constexpr category get_category() const noexcept { return _category; }

  /**
   * @brief Returns the element type (buffers) or value type (scalars)
   *
   * @return The type identifier
   */
  [[nodiscard]] constexpr type_id type() const noexcept { return _type; }

 private:
  constexpr arg_type(category c, type_id t) : _category{c}, _type{t} {}

  category _category;
  type_id _type;
};

namespace detail {
template <typename T>
struct is_device_uvector : std::false_type {};

template <typename T>
struct is_device_uvector<rmm::device_uvector<T>> : std::true_type {};
}  // namespace detail

/**
 * @brief Derives the `arg_type` that describes arguments of the C++ type `T`.
 *
 * - `rmm::cuda_stream_view`, `rmm::cuda_stream` and `cudaStream_t` describe streams
 * - pointers, `rmm::device_buffer` and `rmm::device_uvector<U>` describe device buffers
 * - every other type describes a scalar of type `type_to_id<T>()`
 *
 * The result is not validated; unsupported types surface when the description is classified.
 *
 * @tparam T The C++ argument type
 * @return The argument description
 */
template <typename T>
constexpr arg_type arg_type_of()
{
  using U = std::remove_cv_t<std::remove_reference_t<T>>;
  if constexpr (std::is_same_v<U, rmm::cuda_stream_view> || std::is_same_v<U, rmm::cuda_stream> ||
                std::is_same_v<U, cudaStream_t>) {
    return arg_type::stream();
  } else if constexpr (std::is_pointer_v<U>) {
    return arg_type::device_buffer(type_to_id<std::remove_cv_t<std::remove_pointer_t<U>>>());
  } else if constexpr (std::is_same_v<U, rmm::device_buffer>) {
    return arg_type::device_buffer(type_id::VOID);
  } else if constexpr (detail::is_device_uvector<U>::value) {
    return arg_type::device_buffer(type_to_id<typename U::value_type>());
  } else {
    return arg_type::scalar(type_to_id<U>());
  }
}

/**
 * @brief Classifies a runtime argument description into a parameter kind.
 *
 * The mapping is total over the supported set:
 * - a device buffer of any element type other than `EMPTY` or `STRING` is a `BUFFER`
 * - a `BOOL8` scalar is a `BOOL`
 * - a `FLOAT32` or `FLOAT64` scalar is a `FLOAT`
 * - a signed or unsigned integer scalar is an `INT`
 * - a stream is a `STREAM`
 *
 * Classification has no side effects.
 *
 * @throw kernjit::argument_type_error for every other description
 *
 * @param type The argument description
 * @return The parameter kind
 */
param_kind classify(arg_type type);

/**
 * @brief One classified kernel parameter.
 */
class param {
 public:
  /**
   * @brief Classifies `type` and constructs the parameter
   *
   * @throw kernjit::argument_type_error if `type` cannot be classified
   * @throw kernjit::logic_error if `name` is not a valid C identifier
   *
   * @param name Parameter name as it appears in generated source
   * @param type Argument description
   */
  param(std::string name, arg_type type);

  /// @return The parameter name
  [[nodiscard]] std::string const& name() const noexcept { return _name; }

  /// @return The parameter kind
  [[nodiscard]] param_kind kind() const noexcept { return _kind; }

  /**
   * @brief Returns the element type for buffers, the value type for booleans and scalars,
   * and `EMPTY` for streams.
   *
   * @return The type identifier
   */
  [[nodiscard]] type_id type() const noexcept { return _type; }

  /**
   * @brief Returns the native CUDA C++ type of the parameter in the generated entry point
   * (e.g. `__nv_bfloat16*`, `bool`, `int64_t`, `cudaStream_t`).
   *
   * @return The native type spelling
   */
  [[nodiscard]] std::string native_type_name() const;

 private:
  std::string _name;
  param_kind _kind;
  type_id _type;
};

/**
 * @brief The ordered, kind-tagged parameter list describing a kernel's calling convention.
 *
 * Every entry is classified when the signature is constructed, so an unsupported argument
 * kind is reported before any code is generated or any compiler is invoked.
 *
 * Example:
 * @code{.cpp}
 * auto sig = kernjit::signature{{"lhs", kernjit::arg_type::device_buffer(type_id::FP8_E4M3)},
 *                               {"out", kernjit::arg_type::device_buffer(type_id::BFLOAT16)},
 *                               {"flag", kernjit::arg_type_of<bool>()},
 *                               {"stream", kernjit::arg_type::stream()}};
 * @endcode
 */
class signature {
 public:
  signature() = default;

  /**
   * @brief Classifies and validates each `(name, type)` entry in order
   *
   * @throw kernjit::argument_type_error if any entry cannot be classified
   * @throw kernjit::logic_error if a name is invalid, reserved or duplicated
   *
   * @param params The parameter descriptions in declaration order
   */
  signature(std::vector<std::pair<std::string, arg_type>> const& params);

  /**
   * @copydoc signature(std::vector<std::pair<std::string, arg_type>> const&)
   */
  signature(std::initializer_list<std::pair<std::string, arg_type>> params);

  /// @return The classified parameters in declaration order
  [[nodiscard]] std::vector<param> const& params() const noexcept { return _params; }

  /// @return The number of parameters
  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  /// @return true if the signature has no parameters
  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  /**
   * @brief Returns the parameter at position `i`
   *
   * @param i Position of the parameter
   * @return The parameter
   */
  [[nodiscard]] param const& operator[](std::size_t i) const { return _params[i]; }

  /// @return Iterator to the first parameter
  [[nodiscard]] auto begin() const noexcept { return _params.begin(); }

  /// @return Iterator past the last parameter
  [[nodiscard]] auto end() const noexcept { return _params.end(); }

  /**
   * @brief Renders one line per parameter as `<index> <name> <KIND> <TYPE>`.
   *
   * The rendering is stable and is stored beside compiled artifacts.
   *
   * @return The description
   */
  [[nodiscard]] std::string describe() const;

 private:
  std::vector<param> _params;
};

/**
 * @brief The value of a compile-time constant.
 */
using constant_value = std::variant<bool, int32_t, int64_t, uint32_t, uint64_t, float, double>;

/**
 * @brief A named constant baked into the generated source, distinct from runtime parameters.
 */
struct compile_time_constant {
  std::string name;      ///< Identifier in generated source
  constant_value value;  ///< The value and, through its alternative, its type
};

/**
 * @brief Indicates whether `name` is a valid identifier in generated CUDA C++ source.
 *
 * @param name The candidate identifier
 * @return true if `name` matches `[A-Za-z_][A-Za-z0-9_]*` and is not a C++ keyword,
 * alternative operator spelling or CUDA execution-space qualifier
 */
bool is_identifier(std::string const& name);

/**
 * @brief Indicates whether `name` is reserved by the code generator (`launch`,
 * `launch_packed`, `__return_code`, `__args`).
 *
 * @param name The candidate identifier
 * @return true if the name is reserved
 */
bool is_reserved_name(std::string const& name);

}  // namespace KERNJIT_EXPORT kernjit
