// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

struct evp_md_ctx_st;

namespace synthnet {

using Hash256 = std::array<uint8_t, 32>;

/** SHA-256 over OpenSSL's EVP interface. */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256&) = delete;
  CSHA256& operator=(const CSHA256&) = delete;

  CSHA256& Write(const unsigned char* data, size_t len);
  void Finalize(unsigned char hash[OUTPUT_SIZE]);
  CSHA256& Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/** A hasher class for Bitcoin's 256-bit hash (double SHA-256). */
class CHash256 {
public:
  static constexpr size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

  CHash256& Write(const unsigned char* data, size_t len) {
    sha_.Write(data, len);
    return *this;
  }

  void Finalize(Hash256& output) {
    unsigned char buf[CSHA256::OUTPUT_SIZE];
    sha_.Finalize(buf);
    sha_.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(output.data());
  }

  CHash256& Reset() {
    sha_.Reset();
    return *this;
  }

private:
  CSHA256 sha_;
};

/** Compute the 256-bit hash of a byte span (double SHA-256). */
inline Hash256 Hash(std::span<const uint8_t> data) {
  Hash256 result;
  CHash256().Write(data.data(), data.size()).Finalize(result);
  return result;
}

inline Hash256 Hash(const std::vector<uint8_t>& data) {
  return Hash(std::span<const uint8_t>(data.data(), data.size()));
}

}  // namespace synthnet
