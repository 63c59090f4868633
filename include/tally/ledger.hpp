#pragma once

// tally/ledger.hpp - Quota Ledger: per-scope, per-resource-type limit/usage.
//
// DESIGN:
//   Each (scope, resource_type) key is a Cell holding a short list of
//   versions {ticket, usage, limit}. Writers never block each other on a lock:
//   a commit reads the newest installed version of each key, claims the keys
//   with a compare-and-swap on the cell's claim word (in key order), checks
//   that nothing was installed in between, and otherwise releases and
//   retries. Writers to disjoint keys never touch the same claim word.
//
//   A successful commit takes the next ticket from the commit clock, installs
//   one invisible version per key, releases its claims and then publishes
//   the ticket by advancing the visible watermark from ticket-1 to ticket.
//   Readers pick, for every key, the newest version at or below the watermark
//   they loaded, so a batch is seen either completely or not at all.
//
// INVARIANTS:
//   - usage >= 0. A delta that would drive usage negative clamps at zero and
//     is counted (EngineStats::clamped_adjustments); reconciliation repairs it.
//   - A batch that fails on any key (missing scope, injected fault) leaves no
//     installed version behind. Its ticket is still published, empty.
//   - Tickets are published strictly in order; visible_ticket() never moves
//     backwards.
//   - The version at or below the watermark is never pruned while it is the
//     newest such version.
//
// HISTORY:
//   Every committed change appends (ts, usage, limit) to the key's history.
//   Entries older than the retention window are dropped, except the newest
//   one before the cutoff, which anchors the value at the window start.

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tally/types.hpp"

namespace tally {

struct QuotaValue {
  int64_t usage{0};
  std::optional<int64_t> limit;   // nullopt = unlimited
  uint64_t ticket{0};             // commit that produced this value
};

struct Adjustment {
  QuotaKey key;
  int64_t delta{0};
};

struct LedgerResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

struct AdjustResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  int64_t new_usage{0};
  bool clamped{false};
};

struct BatchResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  uint64_t ticket{0};
  std::map<QuotaKey, int64_t> new_usage;
  size_t clamped{0};
};

struct OverwriteResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool conflict{false};       // usage moved away from `expected`
  int64_t observed{0};        // usage found at commit time
};

struct QuotaHistoryEntry {
  int64_t ts{0};
  int64_t usage{0};
  std::optional<int64_t> limit;
};

struct QuotaHistory {
  std::optional<QuotaHistoryEntry> baseline;   // newest entry before `from`
  std::vector<QuotaHistoryEntry> entries;      // entries with ts in [from, to)
};

struct LedgerSnapshot {
  uint64_t ticket{0};
  std::map<QuotaKey, QuotaValue> values;

  // Zero/unlimited when the key is absent.
  QuotaValue get(const QuotaKey& key) const;
};

class QuotaLedger {
 public:
  using Clock = std::function<int64_t()>;   // epoch seconds

  explicit QuotaLedger(Clock clock = {}, int64_t history_retention_seconds = 90LL * 24 * 3600);
  ~QuotaLedger();

  QuotaLedger(const QuotaLedger&) = delete;
  QuotaLedger& operator=(const QuotaLedger&) = delete;

  // Creates the standard records (usage 0, unlimited). Idempotent.
  LedgerResult register_scope(const ScopeRef& scope);
  // Drops every record of the scope. Callers zero usage first.
  LedgerResult unregister_scope(const ScopeRef& scope);
  bool has_scope(const ScopeRef& scope) const;
  std::vector<ScopeRef> scopes() const;

  // Single-key batch. Creates the resource type record for a registered
  // scope; quota_record_missing when the scope is not registered.
  AdjustResult adjust(const QuotaKey& key, int64_t delta);

  // All-or-nothing. Repeated keys are summed.
  BatchResult apply_batch(const std::vector<Adjustment>& adjustments);

  // Idempotent; never touches usage.
  LedgerResult set_limit(const QuotaKey& key, std::optional<int64_t> limit);

  // Compare-and-set of usage used by reconciliation.
  OverwriteResult overwrite_usage(const QuotaKey& key, int64_t expected, int64_t value);

  // usage + delta <= limit; true for an unlimited or missing record.
  bool check(const QuotaKey& key, int64_t requested_delta) const;

  // One message per (scope, type) that would exceed its limit:
  //   "<type> quota limit: <limit>, requires: <usage+delta> (<scope>)"
  std::vector<std::string> validate_change(const std::vector<ScopeRef>& chain,
                                           const std::map<std::string, int64_t>& deltas) const;

  std::optional<QuotaValue> get(const QuotaKey& key) const;
  LedgerSnapshot snapshot(const std::vector<QuotaKey>& keys) const;
  LedgerSnapshot snapshot_scope(const ScopeRef& scope) const;
  LedgerSnapshot snapshot_all() const;

  QuotaHistory history(const QuotaKey& key, int64_t from, int64_t to) const;

  uint64_t visible_ticket() const { return visible_.load(std::memory_order_acquire); }

 private:
  struct Cell;
  struct Mutation;
  using CellPtr = std::shared_ptr<Cell>;

  CellPtr find_cell(const QuotaKey& key) const;
  CellPtr find_or_create_cell(const QuotaKey& key, LedgerResult& err);
  BatchResult commit(const std::vector<Mutation>& mutations, OverwriteResult* overwrite);
  void publish(uint64_t ticket);
  LedgerSnapshot read(const std::vector<std::pair<QuotaKey, CellPtr>>& cells) const;
  int64_t now() const;

  Clock clock_;
  int64_t history_retention_seconds_;

  mutable std::shared_mutex dir_mu_;
  std::map<ScopeRef, std::map<std::string, CellPtr>> scopes_;

  std::atomic<uint64_t> next_ticket_{0};
  std::atomic<uint64_t> visible_{0};
  std::atomic<uint64_t> claim_tokens_{0};
};

}  // namespace tally
