#include "tally/version.hpp"

#include "tally/hash.hpp"
#include "tally/jsonlite.hpp"

namespace tally {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_primitive = hash_runtime_info().primitive;
#if defined(TALLY_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["engine_semver"] = m.engine_semver;
  o["event_digest"] = static_cast<int64_t>(m.event_digest);
  o["archive_format"] = static_cast<int64_t>(m.archive_format);
  o["audit_log"] = static_cast<int64_t>(m.audit_log);
  o["hash_primitive"] = m.hash_primitive;
  o["zstd"] = m.zstd_enabled;
  return jsonlite::to_json(o);
}

}  // namespace version
}  // namespace tally
