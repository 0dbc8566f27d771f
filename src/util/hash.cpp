// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace synthnet {

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("CSHA256: EVP_MD_CTX_new() allocation failed");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256& CSHA256::Write(const unsigned char* data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("CSHA256: EVP_DigestUpdate() failed");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &digest_len) != 1 || digest_len != OUTPUT_SIZE) {
    throw std::runtime_error("CSHA256: EVP_DigestFinal_ex() failed");
  }
}

CSHA256& CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("CSHA256: EVP_DigestInit_ex() failed");
  }
  return *this;
}

}  // namespace synthnet
