// SHA-256 via the OpenSSL EVP digest interface.

#include "core/sha256.h"

#include <openssl/evp.h>

#include <cstdio>
#include <memory>

namespace calib {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    std::fprintf(stderr, "[sha256] ERROR: cannot allocate digest context\n");
    return {};
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    std::fprintf(stderr, "[sha256] ERROR: digest computation failed\n");
    return {};
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  char byte_buf[3];
  for (unsigned int idx = 0; idx < digest_len; ++idx) {
    std::snprintf(byte_buf, sizeof(byte_buf), "%02x", digest[idx]);
    hex += byte_buf;
  }
  return hex;
}

std::string sha256Tagged(std::string_view data) {
  std::string hex = sha256Hex(data);
  if (hex.empty()) return hex;
  return kSha256Prefix + hex;
}

}  // namespace calib
