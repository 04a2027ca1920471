/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <kernjit/utilities/export.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>

extern "C" {
typedef struct evp_md_ctx_st EVP_MD_CTX;
}

namespace KERNJIT_EXPORT kernjit {
namespace jit {

struct sha256_hash {
  alignas(16) uint8_t data_[32];

  bool operator==(sha256_hash const& hash) const
  {
    return std::equal(std::begin(data_), std::end(data_), std::begin(hash.data_));
  }

  bool operator!=(sha256_hash const& hash) const { return !(*this == hash); }

  /// @return The digest as 64 lowercase hexadecimal characters
  [[nodiscard]] std::string to_hex() const
  {
    static constexpr char const HEX_CHARS[] = "0123456789abcdef";
    std::string hex(64, '\0');
    for (size_t i = 0; i < 32; ++i) {
      hex[i * 2]     = HEX_CHARS[(data_[i] >> 4) & 0x0F];
      hex[i * 2 + 1] = HEX_CHARS[data_[i] & 0x0F];
    }
    return hex;
  }
};

struct sha256_context {
 private:
  EVP_MD_CTX* ectx_;

 public:
  sha256_context();
  sha256_context(sha256_context const& other)            = delete;
  sha256_context& operator=(sha256_context const& other) = delete;
  sha256_context(sha256_context&& other) noexcept : ectx_(other.ectx_) { other.ectx_ = nullptr; }

  sha256_context& operator=(sha256_context&& other) noexcept
  {
    if (this == &other) [[unlikely]] { return *this; }
    this->~sha256_context();
    new (this) sha256_context(std::move(other));
    return *this;
  }

  ~sha256_context();

  void update(std::span<uint8_t const> data);

  void update(std::string_view data)
  {
    update(std::span<uint8_t const>{reinterpret_cast<uint8_t const*>(data.data()), data.size()});
  }

  sha256_hash finalize();
};

}  // namespace jit
}  // namespace KERNJIT_EXPORT kernjit
