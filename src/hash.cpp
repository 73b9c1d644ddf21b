#include "warden/hash.hpp"

// BLAKE3 is the sole hash primitive. Domain prefixes keep request ids, cache
// keys and blob checksums from colliding across contexts; changing a prefix
// invalidates every cache key, so bump version::CACHE_KEY_VERSION with it.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace warden {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string request_hash(std::string_view canonical_request) {
  return hash_domain("req:", canonical_request);
}

std::string artifact_key_hash(std::string_view canonical_key) {
  return hash_domain("art:", canonical_key);
}

std::string blob_hash(std::string_view stored_bytes) {
  return hash_domain("blob:", stored_bytes);
}

}  // namespace warden
