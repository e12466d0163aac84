// SHA-256 content hashing for configuration and certificate identity.

#ifndef CALIB_CORE_SHA256_H
#define CALIB_CORE_SHA256_H

#include <string>
#include <string_view>

namespace calib {

/// Prefix that tags every digest string produced by sha256Tagged().
constexpr const char* kSha256Prefix = "sha256:";

/// @brief Lowercase hex SHA-256 digest of a byte string.
/// @param data Bytes to hash.
/// @return 64 hex characters, or an empty string if the digest could not be
///         computed (OpenSSL context allocation failure).
std::string sha256Hex(std::string_view data);

/// @brief Digest formatted as "sha256:<hex>".
/// @return Empty string on failure, like sha256Hex().
std::string sha256Tagged(std::string_view data);

}  // namespace calib

#endif  // CALIB_CORE_SHA256_H
