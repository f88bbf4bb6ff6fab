#include "sha256.hpp"

#include <cstdio>
#include <stdexcept>

#include <openssl/evp.h>

std::string Sha256::calculateHash(const std::string &bytes) const {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx)
    throw std::runtime_error("sha256: cannot allocate digest context");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, digest, &digest_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("sha256: digest computation failed");
  }
  EVP_MD_CTX_free(ctx);

  std::string result;
  result.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    char b[3];
    std::snprintf(b, sizeof(b), "%02x", digest[i]);
    result += b;
  }
  return result;
}
