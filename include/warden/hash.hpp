#pragma once

#include <string>
#include <string_view>

namespace warden {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Prefixes in use:
//   "req:" canonical request JSON (execution id)
//   "art:" compilation cache keys
//   "blob:" stored artifact blobs
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string request_hash(std::string_view canonical_request);
std::string artifact_key_hash(std::string_view canonical_key);
std::string blob_hash(std::string_view stored_bytes);

}  // namespace warden
