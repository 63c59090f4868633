#include "tally/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace tally {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::mutex g_sink_mu;
LogHook g_hook = nullptr;
bool g_path_overridden = false;
std::string g_path;

std::string sink_path() {
  if (g_path_overridden) return g_path;
  const char* env = std::getenv("TALLY_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warning: return "warning";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::string LogRecord::to_json() const {
  jsonlite::Object o;
  o["level"] = to_string(level);
  o["type"] = type;
  o["message"] = message;
  o["ts_unix_ms"] = ts_unix_ms;
  if (!fields.empty()) o["fields"] = fields;
  return jsonlite::to_json(o);
}

int64_t now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

jsonlite::Object LatencyHistogram::to_object() const {
  jsonlite::Object o;
  o["count"] = count();
  o["mean_us"] = mean_us();
  o["p50_us"] = percentile(0.50);
  o["p95_us"] = percentile(0.95);
  o["p99_us"] = percentile(0.99);
  return o;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_rejection(ErrorCode code) {
  events_rejected.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(rejection_mu_);
  ++rejections_[code];
}

uint64_t EngineStats::rejections(ErrorCode code) const {
  std::lock_guard<std::mutex> lk(rejection_mu_);
  auto it = rejections_.find(code);
  return it == rejections_.end() ? 0 : it->second;
}

std::string EngineStats::to_json() const {
  auto ld = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };

  jsonlite::Object by_reason;
  {
    std::lock_guard<std::mutex> lk(rejection_mu_);
    for (const auto& [code, n] : rejections_) by_reason[tally::to_string(code)] = n;
  }

  jsonlite::Object events;
  events["applied"] = ld(events_applied);
  events["rejected"] = ld(events_rejected);
  events["rejected_by_reason"] = by_reason;
  events["duplicate"] = ld(events_duplicate);
  events["parked"] = ld(events_parked);
  events["drained"] = ld(events_drained);

  jsonlite::Object ledger;
  ledger["batches_committed"] = ld(batches_committed);
  ledger["batches_aborted"] = ld(batches_aborted);
  ledger["clamped_adjustments"] = ld(clamped_adjustments);
  ledger["commit_retries"] = ld(commit_retries);

  jsonlite::Object reconcile;
  reconcile["passes"] = ld(reconcile_passes);
  reconcile["corrections"] = ld(reconcile_corrections);
  reconcile["drift_magnitude"] = ld(reconcile_drift_magnitude);
  reconcile["deferred"] = ld(reconcile_deferred);

  jsonlite::Object samples;
  samples["ingested"] = ld(samples_ingested);
  samples["backend_failures"] = ld(backend_failures);

  jsonlite::Object q;
  q["count"] = ld(queries);
  q["partial_results"] = ld(partial_results);
  q["latency"] = query_latency.to_object();

  jsonlite::Object alerts;
  alerts["opened"] = ld(alerts_opened);
  alerts["closed"] = ld(alerts_closed);

  jsonlite::Object out;
  out["events"] = events;
  out["ledger"] = ledger;
  out["reconcile"] = reconcile;
  out["samples"] = samples;
  out["queries"] = q;
  out["alerts"] = alerts;
  return jsonlite::to_json(out);
}

EngineStats& global_engine_stats() {
  static EngineStats stats;
  return stats;
}

// ---------------------------------------------------------------------------
// Log sink
// ---------------------------------------------------------------------------

void set_log_hook(LogHook hook) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_hook = hook;
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_path_overridden = true;
  g_path = path;
}

void emit_log(const LogRecord& record) {
  LogRecord r = record;
  if (r.ts_unix_ms == 0) r.ts_unix_ms = now_unix_ms();

  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_hook) {
    g_hook(r);
    return;
  }
  const std::string path = sink_path();
  if (path.empty()) return;
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return;
  const std::string line = r.to_json() + "\n";
  std::fwrite(line.data(), 1, line.size(), f);
  std::fclose(f);
}

void emit_log(LogLevel level, const std::string& type, const std::string& message,
              jsonlite::Object fields) {
  LogRecord r;
  r.level = level;
  r.type = type;
  r.message = message;
  r.fields = std::move(fields);
  emit_log(r);
}

}  // namespace tally
