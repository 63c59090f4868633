#include "tally/reconcile.hpp"

#include <map>
#include <set>
#include <utility>

#include "tally/audit.hpp"
#include "tally/observability.hpp"

namespace tally {

std::string ReconciliationReport::to_json() const {
  jsonlite::Array corr;
  for (const auto& c : corrections) {
    corr.push_back(jsonlite::Object{{"key", c.key.to_string()}, {"before", c.before}, {"after", c.after}});
  }
  jsonlite::Array def;
  for (const auto& k : deferred) def.push_back(k.to_string());

  jsonlite::Object o;
  o["pass"] = pass;
  o["started_unix_ms"] = started_unix_ms;
  o["duration_ns"] = duration_ns;
  o["scopes_scanned"] = static_cast<uint64_t>(scopes_scanned);
  o["keys_checked"] = static_cast<uint64_t>(keys_checked);
  o["drift_magnitude"] = drift_magnitude;
  o["corrections"] = corr;
  o["deferred"] = def;
  return jsonlite::to_json(o);
}

ReconciliationJob::ReconciliationJob(QuotaLedger& ledger, const ResourceRegistry& resources,
                                     std::chrono::milliseconds interval,
                                     std::function<void()> after_pass)
    : ledger_(ledger),
      resources_(resources),
      interval_(interval),
      after_pass_(std::move(after_pass)) {}

ReconciliationJob::~ReconciliationJob() { stop(); }

ReconciliationReport ReconciliationJob::run_once() {
  std::lock_guard<std::mutex> run_lk(run_mu_);
  auto& stats = global_engine_stats();

  ReconciliationReport report;
  report.pass = passes_.fetch_add(1, std::memory_order_relaxed) + 1;
  report.started_unix_ms = now_unix_ms();
  {
    ScopeTimer timer(report.duration_ns);

    // Ledger first: an event committed after this read but before the
    // resource snapshot makes the compare-and-set below fail and defer.
    const LedgerSnapshot recorded = ledger_.snapshot_all();
    const auto live = resources_.live_snapshot();

    std::map<QuotaKey, int64_t> truth;
    for (const auto& r : live) {
      const auto contribution = r.contribution();
      for (const auto& scope : r.ancestors) {
        for (const auto& [name, v] : contribution) truth[QuotaKey{scope, name}] += v;
      }
    }

    std::set<ScopeRef> scanned;
    std::vector<std::pair<QuotaKey, int64_t>> to_check;   // key, recorded usage
    for (const auto& [key, value] : recorded.values) {
      scanned.insert(key.scope);
      to_check.emplace_back(key, value.usage);
    }
    // Keys with live usage but no record yet on a registered scope.
    for (const auto& [key, v] : truth) {
      if (recorded.values.count(key) == 0 && ledger_.has_scope(key.scope)) to_check.emplace_back(key, 0);
    }
    report.scopes_scanned = scanned.size();
    report.keys_checked = to_check.size();

    for (const auto& [key, usage] : to_check) {
      auto t = truth.find(key);
      const int64_t actual = t == truth.end() ? 0 : t->second;
      if (actual == usage) continue;

      auto res = ledger_.overwrite_usage(key, usage, actual);
      if (res.conflict) {
        report.deferred.push_back(key);
        stats.reconcile_deferred.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      if (!res.ok) {
        // Scope removed mid-pass or an injected commit fault; retried next pass.
        report.deferred.push_back(key);
        stats.reconcile_deferred.fetch_add(1, std::memory_order_relaxed);
        emit_log(LogLevel::warning, "reconcile.overwrite_failed", res.detail,
                 jsonlite::Object{{"key", key.to_string()}, {"error", to_string(res.error)}});
        continue;
      }

      const uint64_t drift = static_cast<uint64_t>(actual > usage ? actual - usage : usage - actual);
      report.corrections.push_back(Correction{key, usage, actual});
      report.drift_magnitude += drift;
      stats.reconcile_corrections.fetch_add(1, std::memory_order_relaxed);
      stats.reconcile_drift_magnitude.fetch_add(drift, std::memory_order_relaxed);

      emit_log(LogLevel::info, "reconcile.correction", "usage corrected",
               jsonlite::Object{{"key", key.to_string()}, {"before", usage}, {"after", actual}});
      AuditRecord audit;
      audit.action = "reconcile.correction";
      audit.quota_key = key.to_string();
      audit.before = usage;
      audit.after = actual;
      audit.detail = "pass " + std::to_string(report.pass);
      if (!global_audit_log().append(audit)) {
        emit_log(LogLevel::warning, "audit.append_failed", "correction not audited",
                 jsonlite::Object{{"key", key.to_string()}});
      }
    }
  }

  stats.reconcile_passes.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(report_mu_);
    last_report_ = report;
  }
  return report;
}

void ReconciliationJob::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void ReconciliationJob::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool ReconciliationJob::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_;
}

std::optional<ReconciliationReport> ReconciliationJob::last_report() const {
  std::lock_guard<std::mutex> lk(report_mu_);
  return last_report_;
}

void ReconciliationJob::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    run_once();
    if (after_pass_) after_pass_();
  }
}

}  // namespace tally
