#pragma once

// tally/reconcile.hpp - Reconciliation Job: periodic drift correction.
//
// A pass reads the ledger, then the live resources, recomputes the true usage
// of every registered key and overwrites mismatches with a compare-and-set
// against the value it read. A key that moved in between is deferred to the
// next pass. Corrections are counted, logged and audited; they are never
// errors.
//
// SKEW:
//   A lifecycle event commits to the ledger before it updates the resource
//   registry. An event landing inside that window can be undone by a pass
//   (one event of skew on the touched keys); the next pass restores it.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "tally/ledger.hpp"
#include "tally/resources.hpp"

namespace tally {

struct Correction {
  QuotaKey key;
  int64_t before{0};
  int64_t after{0};
};

struct ReconciliationReport {
  uint64_t pass{0};
  int64_t started_unix_ms{0};
  uint64_t duration_ns{0};
  size_t scopes_scanned{0};
  size_t keys_checked{0};
  uint64_t drift_magnitude{0};
  std::vector<Correction> corrections;
  std::vector<QuotaKey> deferred;

  std::string to_json() const;
};

class ReconciliationJob {
 public:
  // after_pass runs on the worker thread after every background pass; the
  // engine uses it for housekeeping that shares the interval.
  ReconciliationJob(QuotaLedger& ledger, const ResourceRegistry& resources,
                    std::chrono::milliseconds interval = std::chrono::seconds(60),
                    std::function<void()> after_pass = {});
  ~ReconciliationJob();

  ReconciliationJob(const ReconciliationJob&) = delete;
  ReconciliationJob& operator=(const ReconciliationJob&) = delete;

  ReconciliationReport run_once();

  // Background thread running run_once() every interval. stop() wakes it and
  // joins promptly.
  void start();
  void stop();
  bool running() const;

  std::optional<ReconciliationReport> last_report() const;

 private:
  void worker_loop();

  QuotaLedger& ledger_;
  const ResourceRegistry& resources_;
  std::chrono::milliseconds interval_;
  std::function<void()> after_pass_;

  std::mutex run_mu_;   // one pass at a time
  std::atomic<uint64_t> passes_{0};

  mutable std::mutex report_mu_;
  std::optional<ReconciliationReport> last_report_;

  std::thread worker_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopping_{false};
};

}  // namespace tally
