#pragma once

// tally/observability.hpp - Counters, latency histogram and structured logs.
//
// DESIGN:
//   EngineStats is the process-wide counter set. Every event outcome, ledger
//   commit, reconciliation correction and query lands here. Counters are
//   atomics; the per-error breakdown sits behind its own mutex.
//
//   Log records are single-line JSON. When a hook is registered it receives
//   every record; otherwise records are appended to the file named by
//   TALLY_EVENT_LOG (unset = dropped after counting).
//
// INVARIANTS:
//   - emit_log() never throws and never blocks on anything but the sink mutex.
//   - Counters only increase.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "tally/jsonlite.hpp"
#include "tally/types.hpp"

namespace tally {

enum class LogLevel { debug, info, warning, error };

std::string to_string(LogLevel level);

struct LogRecord {
  LogLevel level{LogLevel::info};
  std::string type;      // e.g. "reconcile.correction", "ingest.backend_failure"
  std::string message;
  jsonlite::Object fields;
  int64_t ts_unix_ms{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) us; bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]; microseconds; 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  jsonlite::Object to_object() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  // Lifecycle events
  alignas(64) std::atomic<uint64_t> events_applied{0};
  alignas(64) std::atomic<uint64_t> events_rejected{0};
  std::atomic<uint64_t> events_duplicate{0};
  std::atomic<uint64_t> events_parked{0};
  std::atomic<uint64_t> events_drained{0};

  // Ledger
  alignas(64) std::atomic<uint64_t> batches_committed{0};
  std::atomic<uint64_t> batches_aborted{0};
  std::atomic<uint64_t> clamped_adjustments{0};
  std::atomic<uint64_t> commit_retries{0};   // optimistic claim lost to a concurrent writer

  // Reconciliation
  alignas(64) std::atomic<uint64_t> reconcile_passes{0};
  std::atomic<uint64_t> reconcile_corrections{0};
  std::atomic<uint64_t> reconcile_drift_magnitude{0};
  std::atomic<uint64_t> reconcile_deferred{0};

  // Samples
  alignas(64) std::atomic<uint64_t> samples_ingested{0};
  std::atomic<uint64_t> backend_failures{0};

  // Queries
  alignas(64) std::atomic<uint64_t> queries{0};
  std::atomic<uint64_t> partial_results{0};
  std::atomic<uint64_t> alerts_opened{0};
  std::atomic<uint64_t> alerts_closed{0};

  LatencyHistogram query_latency;

  void record_rejection(ErrorCode code);
  uint64_t rejections(ErrorCode code) const;

  std::string to_json() const;

 private:
  mutable std::mutex rejection_mu_;
  std::map<ErrorCode, uint64_t> rejections_;
};

EngineStats& global_engine_stats();

// Non-blocking, never throws. Routed to the hook if registered, otherwise to
// TALLY_EVENT_LOG.
void emit_log(const LogRecord& record);
void emit_log(LogLevel level, const std::string& type, const std::string& message,
              jsonlite::Object fields = {});

using LogHook = void (*)(const LogRecord&);
void set_log_hook(LogHook hook);

// Redirect the file sink (overrides TALLY_EVENT_LOG). Empty disables it.
void set_event_log_path(const std::string& path);

int64_t now_unix_ms();

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace tally
