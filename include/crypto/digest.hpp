#ifndef DOCREP_CRYPTO_DIGEST_HPP
#define DOCREP_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace docrep::crypto {

// ---- DIGESTS ----
// Hex encoded SHA-256 of an in-memory buffer
std::string sha256_hex(const std::string& data);
// Hex encoded SHA-256 of a file, read in chunks
std::string sha256_file(const std::filesystem::path& path);
// Hex encoded MD5, used only for cache keys
std::string md5_hex(const std::string& data);

// ---- RANDOMNESS ----
// Lowercase alphanumeric string drawn from RAND_bytes
std::string random_token(std::size_t length);

} // namespace docrep::crypto

#endif // DOCREP_CRYPTO_DIGEST_HPP
