// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace ukulele {
namespace util {

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Sha256: failed to allocate EVP_MD_CTX");
  }
  Reset();
}

Sha256::~Sha256() = default;

Sha256& Sha256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestInit_ex failed");
  }
  return *this;
}

Sha256& Sha256::Write(std::span<const uint8_t> data) {
  if (data.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestUpdate failed");
  }
  return *this;
}

std::vector<uint8_t> Sha256::Finalize() {
  std::vector<uint8_t> digest(OUTPUT_SIZE);
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("Sha256: EVP_DigestFinal_ex failed");
  }
  Reset();
  return digest;
}

}  // namespace util
}  // namespace ukulele
