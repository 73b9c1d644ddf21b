#include "warden/version.hpp"

#include <sstream>

namespace warden {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver  = ENGINE_SEMVER;
  m.hash_primitive = "blake3";
#if defined(WARDEN_WITH_ZSTD)
  m.compression = "zstd";
#else
  m.compression = "identity";
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cache_key\":" << m.cache_key
    << ",\"protocol\":" << m.protocol
    << ",\"event_log\":" << m.event_log
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"compression\":\"" << m.compression << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace warden
