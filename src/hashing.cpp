#include "hashing.hpp"
#include "chunk.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

std::string sha256_hex(const std::string& s) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), s.data(), s.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
    throw std::runtime_error("sha256: digest failed");
  }

  static const char* hex = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out[2*i]   = hex[md[i] >> 4];
    out[2*i+1] = hex[md[i] & 0xf];
  }
  return out;
}

std::uint64_t fnv1a64(const char* data, std::size_t n) {
  std::uint64_t h = 1469598103934665603ULL;
  for (std::size_t i = 0; i < n; ++i) {
    h ^= (unsigned char)data[i];
    h *= 1099511628211ULL;
  }
  return h;
}

void seal_chunk(Chunk& c) {
  c.content_hash = sha256_hex(c.text);
}
