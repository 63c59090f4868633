#pragma once

// tally/version.hpp - Format versions for every persisted or hashed surface.
//
// INVARIANT:
//   Any change to the canonical event form, the archive layout or the audit
//   record fields requires bumping the matching constant. Readers reject
//   versions newer than the one they were built with.

#include <cstdint>
#include <string>

namespace tally {
namespace version {

constexpr const char* ENGINE_SEMVER = "1.2.0";

// Canonical lifecycle event form hashed for duplicate detection.
constexpr uint32_t EVENT_DIGEST_VERSION = 1;

// Sample store archive: header line + NDJSON samples, optionally zstd.
constexpr uint32_t ARCHIVE_FORMAT_VERSION = 1;

// Audit NDJSON record layout.
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  uint32_t event_digest{EVENT_DIGEST_VERSION};
  uint32_t archive_format{ARCHIVE_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string hash_primitive;
  bool zstd_enabled{false};
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace tally
