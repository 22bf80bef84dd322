#include "crypto/digest.hpp"
#include "common/errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace docrep::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  explicit DigestContext(const EVP_MD* md) {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw Error("Digest: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, md, nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw Error("Digest: Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const void* data, std::size_t length) {
    if (!EVP_DigestUpdate(ctx, data, length)) {
      throw Error("Digest: Failed to update hash");
    }
  }

  // Finalizes the digest and converts the raw bytes to lowercase hex
  std::string hex() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
      throw Error("Digest: Failed to finalize hash");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
      ss << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<int>(hash[i]);
    }
    return ss.str();
  }
};

} // namespace

//==============================================
// DIGESTS
//==============================================

std::string sha256_hex(const std::string& data) {
  DigestContext ctx(EVP_sha256());
  ctx.update(data.data(), data.size());
  return ctx.hex();
}

std::string sha256_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to open file for hashing: " << path.string();
    throw StoreError("Digest: Failed to open file: " + path.string());
  }

  DigestContext ctx(EVP_sha256());
  std::vector<char> buffer(64 * 1024);

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()))) {
    ctx.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    ctx.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
  }

  if (file.bad()) {
    throw StoreError("Digest: Failed while reading file: " + path.string());
  }

  return ctx.hex();
}

std::string md5_hex(const std::string& data) {
  DigestContext ctx(EVP_md5());
  ctx.update(data.data(), data.size());
  return ctx.hex();
}

//==============================================
// RANDOMNESS
//==============================================

std::string random_token(std::size_t length) {
  static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;

  std::vector<unsigned char> bytes(length);
  if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
    throw Error("Digest: RAND_bytes failed");
  }

  std::string token;
  token.reserve(length);
  for (unsigned char b : bytes) {
    token.push_back(alphabet[b % alphabet_size]);
  }
  return token;
}

} // namespace docrep::crypto
