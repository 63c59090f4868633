#pragma once

// tally/hash.hpp - BLAKE3 digests for event identity and audit chaining.
//
// DESIGN:
//   BLAKE3 is the only hash primitive. Every digest that is persisted or
//   compared across processes is domain-separated so that an event digest can
//   never collide with an audit chain digest computed over the same bytes.
//
// DOMAINS:
//   "evt:"  canonical lifecycle event (duplicate replay detection)
//   "aud:"  audit record line (tamper-evident chain)
//   "arc:"  sample store archive body

#include <string>
#include <string_view>

namespace tally {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);

// blake3_hex(domain || payload)
std::string hash_domain(std::string_view domain, std::string_view payload);

std::string event_digest(std::string_view canonical_event);
std::string audit_chain_digest(std::string_view audit_line);
std::string archive_digest(std::string_view archive_body);

HashRuntimeInfo hash_runtime_info();

}  // namespace tally
