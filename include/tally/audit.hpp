#pragma once

// tally/audit.hpp - Append-only, hash-chained audit log for ledger overrides.
//
// Every write to usage that does not come from a lifecycle event is recorded
// here: reconciliation corrections and scope usage resets before removal.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence.
//   3. CHAINED: each entry carries the BLAKE3 digest ("aud:" domain) of the
//      previous line; the first entry chains to 64 zeros.
//   3a. GENESIS: the first entry a log object writes carries "genesis":true.
//      It is the only place a sequence may restart at 1, so a file appended
//      to by several processes still verifies and a spliced record does not.
//   4. FAIL-SAFE: a write failure never fails the ledger operation; it is
//      counted in failure_count(). The chain does not advance past a record
//      that was not written.

#include <cstdint>
#include <memory>
#include <string>

namespace tally {

struct AuditRecord {
  uint64_t    sequence{0};
  std::string previous_digest;
  std::string action;          // "reconcile.correction", "scope.usage_reset", ...
  std::string quota_key;       // QuotaKey::to_string()
  int64_t     before{0};
  int64_t     after{0};
  std::string detail;
  uint64_t    timestamp_unix_ms{0};
  uint32_t    audit_log_version{0};
  bool        genesis{false};      // first record of a chain
};

std::string audit_record_to_json(const AuditRecord& r);

struct AuditLogImpl;

class ImmutableAuditLog {
 public:
  // Empty path = disabled (appends succeed without writing).
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, previous_digest, timestamp and version in place.
  bool append(AuditRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  std::string last_digest() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<AuditLogImpl> impl_;
};

struct ChainVerification {
  bool ok{true};
  uint64_t entries{0};
  uint64_t first_bad_sequence{0};
  std::string error;
};

// Re-reads an audit file and checks sequence continuity and the digest chain.
ChainVerification verify_audit_chain(const std::string& path);

// Process-wide log. Path from set_audit_log_path(), else TALLY_AUDIT_LOG,
// else disabled.
ImmutableAuditLog& global_audit_log();

// Must be called before the first global_audit_log() use to take effect.
void set_audit_log_path(const std::string& path);

}  // namespace tally
