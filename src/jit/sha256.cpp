/*
 * SPDX-FileCopyrightText: Copyright (c) 2025, NVIDIA CORPORATION.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <kernjit/utilities/error.hpp>

#include <jit/sha256.hpp>

extern "C" {
#include <openssl/evp.h>
}

namespace KERNJIT_EXPORT kernjit {
namespace jit {

sha256_context::sha256_context() : ectx_(nullptr)
{
  EVP_MD const* type = EVP_sha256();
  ectx_              = EVP_MD_CTX_new();
  KERNJIT_EXPECTS(ectx_ != nullptr, "EVP_MD_CTX_new failed");
  KERNJIT_EXPECTS(EVP_DigestInit_ex(ectx_, type, nullptr) == 1, "EVP_DigestInit_ex failed");
}

sha256_context::~sha256_context()
{
  if (ectx_ != nullptr) { EVP_MD_CTX_free(ectx_); }
}

void sha256_context::update(std::span<uint8_t const> data)
{
  KERNJIT_EXPECTS(EVP_DigestUpdate(ectx_, data.data(), data.size()) == 1,
                  "EVP_DigestUpdate failed");
}

sha256_hash sha256_context::finalize()
{
  sha256_hash hash;
  unsigned int length = 0;
  KERNJIT_EXPECTS(EVP_DigestFinal_ex(ectx_, hash.data_, &length) == 1,
                  "EVP_DigestFinal_ex failed");
  KERNJIT_EXPECTS(length == sizeof(hash.data_), "Unexpected SHA256 length");
  EVP_MD const* type = EVP_sha256();
  KERNJIT_EXPECTS(EVP_DigestInit_ex(ectx_, type, nullptr) == 1, "EVP_DigestInit_ex failed");
  return hash;
}

}  // namespace jit
}  // namespace KERNJIT_EXPORT kernjit
