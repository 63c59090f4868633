#pragma once

// tally/stats.hpp - Aggregation Query Engine.
//
// All queries are read-only over the hierarchy, resource registry, ledger,
// sample store and alert log. Every query takes a QueryContext; when its
// deadline passes or it is cancelled, the query stops at the next scope or
// resource boundary and returns deadline_exceeded with partial = true and
// whatever it computed so far.
//
// AGGREGATION RULES:
//   usage statistics   per resource: mean of samples per bucket;
//                      per scope: sum of the per-resource bucket values.
//   quota statistics   limits summed over limited scopes only, -1 when every
//                      scope is unlimited; <type>_usage summed over all.
//   quota timeline     per scope: mean of the values in effect within the
//                      bucket; then summed across scopes.
//
// Buckets are half-open [from, to) and strictly ascending.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tally/alerts.hpp"
#include "tally/hierarchy.hpp"
#include "tally/jsonlite.hpp"
#include "tally/ledger.hpp"
#include "tally/resources.hpp"
#include "tally/samples.hpp"
#include "tally/types.hpp"

namespace tally {

class QueryContext {
 public:
  QueryContext() = default;
  explicit QueryContext(std::chrono::milliseconds timeout)
      : deadline_(std::chrono::steady_clock::now() + timeout) {}

  QueryContext(const QueryContext&) = delete;
  QueryContext& operator=(const QueryContext&) = delete;

  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool expired() const {
    if (cancelled_.load(std::memory_order_acquire)) return true;
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
  }

 private:
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::atomic<bool> cancelled_{false};
};

enum class TimelineInterval { hour, day, week, month };

std::string to_string(TimelineInterval i);
std::optional<TimelineInterval> parse_interval(const std::string& s);
int64_t interval_seconds(TimelineInterval i);   // month = 30 days

// ---------------------------------------------------------------------------
// Query parameters. Unset windows resolve against the engine clock.
// ---------------------------------------------------------------------------

struct UsageQuery {
  ScopeType aggregate{ScopeType::customer};
  std::optional<std::string> scope_uuid;
  Item item{Item::cpu};
  std::optional<int64_t> from;        // default: to - 1 hour
  std::optional<int64_t> to;          // default: now
  uint32_t n_buckets{6};
};

struct CreationTimeQuery {
  ScopeType type{ScopeType::customer};
  std::optional<int64_t> from;        // default: to - 30 days
  std::optional<int64_t> to;
  uint32_t n_buckets{6};
};

struct QuotaQuery {
  ScopeType aggregate{ScopeType::customer};
  std::optional<std::string> scope_uuid;
};

struct TimelineQuery {
  std::optional<int64_t> from;        // default: to - 1 day
  std::optional<int64_t> to;
  TimelineInterval interval{TimelineInterval::day};
  std::optional<std::string> item;    // one quota resource type, or all standard ones
  ScopeType aggregate{ScopeType::customer};
  std::optional<std::string> scope_uuid;
};

struct AlertQuery {
  std::optional<int64_t> from;        // opened_at >= from
  std::optional<int64_t> to;          // opened_at < to
  std::optional<ScopeRef> scope;      // scope and its descendants
  std::vector<std::string> types;     // empty = any
  std::optional<bool> acknowledged;
  std::optional<bool> opened;         // true = still open, false = closed
};

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

struct ScopeSeries {
  ScopeRef scope;
  std::string name;
  size_t resources{0};
  std::vector<Bucket> buckets;
};

struct UsageStatistics {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool partial{false};
  Item item{Item::cpu};
  std::vector<ScopeSeries> scopes;
  std::vector<std::string> warnings;   // per-resource backend failures

  std::string to_json() const;
};

struct CustomerSummaryRow {
  std::string uuid;
  std::string name;
  size_t projects{0};
  size_t project_groups{0};
  size_t resources{0};
  QuotaAmounts limits;       // -1 = unlimited
  QuotaAmounts usages;
};

struct CustomerSummary {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool partial{false};
  std::vector<CustomerSummaryRow> customers;

  std::string to_json() const;
};

struct ResourceStatistics {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  std::string backend_ref;
  size_t resources{0};
  std::map<std::string, size_t> by_state;
  int64_t vcpu{0};
  int64_t ram_mb{0};
  int64_t storage_mb{0};

  std::string to_json() const;
};

struct CreationTimeStatistics {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  ScopeType type{ScopeType::customer};
  std::vector<Bucket> buckets;   // value = number of entities created in the bucket

  std::string to_json() const;
};

struct QuotaStatistics {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool partial{false};
  size_t scopes{0};
  // "<type>" = limit sum (-1 when all unlimited), "<type>_usage" = usage sum.
  std::map<std::string, int64_t> values;

  std::string to_json() const;
};

struct TimelinePoint {
  int64_t from{0};
  int64_t to{0};
  std::map<std::string, double> values;   // same keys as QuotaStatistics
};

struct QuotaTimeline {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool partial{false};
  TimelineInterval interval{TimelineInterval::day};
  std::vector<TimelinePoint> points;

  std::string to_json() const;
};

struct AlertStatistics {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  size_t total{0};
  std::map<std::string, size_t> by_severity;   // every severity present, 0 when none

  std::string to_json() const;
};

class StatsEngine {
 public:
  using Clock = std::function<int64_t()>;

  // ingestor may be null: usage statistics then read the sample store only.
  StatsEngine(const Hierarchy& hierarchy, const ResourceRegistry& resources,
              const QuotaLedger& ledger, const SampleStore& samples, const AlertLog& alerts,
              SampleIngestor* ingestor = nullptr, Clock clock = {});

  UsageStatistics usage_statistics(const UsageQuery& q, const QueryContext& ctx) const;
  CustomerSummary customer_summary(const QueryContext& ctx) const;
  ResourceStatistics resource_statistics(const std::string& backend_ref) const;
  CreationTimeStatistics creation_time_statistics(const CreationTimeQuery& q) const;
  QuotaStatistics quota_statistics(const QuotaQuery& q, const QueryContext& ctx) const;
  QuotaTimeline quota_timeline(const TimelineQuery& q, const QueryContext& ctx) const;
  AlertStatistics alert_statistics(const AlertQuery& q) const;

 private:
  // Instances of `aggregate`, or the single named one. Empty + *error when
  // the named scope does not exist.
  std::vector<ScopeRef> resolve_scopes(ScopeType aggregate,
                                       const std::optional<std::string>& uuid,
                                       std::string* error) const;
  int64_t now() const;

  const Hierarchy& hierarchy_;
  const ResourceRegistry& resources_;
  const QuotaLedger& ledger_;
  const SampleStore& samples_;
  const AlertLog& alerts_;
  SampleIngestor* ingestor_;
  Clock clock_;
};

}  // namespace tally
