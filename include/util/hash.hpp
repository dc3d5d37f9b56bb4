// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

struct evp_md_ctx_st;

namespace ukulele {
namespace util {

// Incremental SHA-256 over OpenSSL's EVP digest interface.
// Throws std::runtime_error if libcrypto reports a failure.
class Sha256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  Sha256& Write(std::span<const uint8_t> data);
  Sha256& Write(const uint8_t* data, size_t len) { return Write(std::span<const uint8_t>(data, len)); }

  // Returns the digest and leaves the hasher reset
  std::vector<uint8_t> Finalize();
  Sha256& Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Double SHA-256, used for block hashes
class CHash256 {
public:
  static constexpr size_t OUTPUT_SIZE = Sha256::OUTPUT_SIZE;

  CHash256& Write(std::span<const uint8_t> data) {
    sha_.Write(data);
    return *this;
  }
  CHash256& Write(const uint8_t* data, size_t len) { return Write(std::span<const uint8_t>(data, len)); }

  std::vector<uint8_t> Finalize() {
    auto first = sha_.Finalize();
    return sha_.Write(first).Finalize();
  }

  CHash256& Reset() {
    sha_.Reset();
    return *this;
  }

private:
  Sha256 sha_;
};

inline std::vector<uint8_t> Hash(std::span<const uint8_t> data) {
  return CHash256().Write(data).Finalize();
}

}  // namespace util
}  // namespace ukulele
