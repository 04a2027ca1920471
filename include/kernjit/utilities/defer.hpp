/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#define KERNJIT_DEFER__CONCATENATE_DETAIL(x, y) x##y
#define KERNJIT_DEFER__CONCATENATE(x, y)        KERNJIT_DEFER__CONCATENATE_DETAIL(x, y)
#define KERNJIT_DEFER(...) \
  ::kernjit::defer KERNJIT_DEFER__CONCATENATE(defer_, __COUNTER__)(__VA_ARGS__)

namespace KERNJIT_EXPORT kernjit {

/// @brief RAII utility to execute a callable at the end of a scope.
/// This is useful for ensuring cleanup code is executed, even in the presence of exceptions.
/// And is intended for wrapping C APIs that require explicit resource management without having to
/// write custom wrapper types.
template <typename T>
struct defer {
 private:
  T func_;

 public:
  /// @brief Construct a `defer` object that will invoke the provided callable upon destruction.
  /// @param args Arguments to forward to the callable's constructor.
  template <typename... Args>
  defer(Args&&... args) : func_{static_cast<Args&&>(args)...}
  {
  }
  defer(defer const&)            = delete;
  defer& operator=(defer const&) = delete;
  defer(defer&&)                 = delete;
  defer& operator=(defer&&)      = delete;
  ~defer() { func_(); }
};

template <typename T>
defer(T) -> defer<T>;  ///< Class template argument deduction guide

}  // namespace KERNJIT_EXPORT kernjit
