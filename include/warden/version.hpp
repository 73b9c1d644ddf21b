#pragma once

// warden/version.hpp — Version manifest for every persisted or hashed format.
//
// INVARIANT:
//   Any change to how cache keys are derived (hash prefix, canonical key
//   layout, preamble text) bumps CACHE_KEY_VERSION so stale artifacts can
//   never be served for a new derivation.

#include <cstdint>
#include <string>

namespace warden {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// Version 1 = BLAKE3-256, 64-char lowercase hex.
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// Version 1 = "art:" domain over language/toolchain/flags/source lines.
constexpr uint32_t CACHE_KEY_VERSION = 1;

// Version 1 = camelCase request/result JSON documented in runtime.hpp.
constexpr uint32_t PROTOCOL_VERSION = 1;

// Version 1 = one ExecutionEvent object per line.
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cache_key{CACHE_KEY_VERSION};
  uint32_t protocol{PROTOCOL_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string compression;      // "zstd" or "identity"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace warden
