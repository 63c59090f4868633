#pragma once

// tally/chaos.hpp - Fault injection for resilience tests.
//
// DESIGN:
//   ChaosController is inert until activated with the CI activation key.
//   Production code asks should_inject()/inject() at the two places where a
//   failure must be survivable: the ledger commit (per adjusted key) and the
//   monitoring backend fetch (per resource).
//
// INVARIANTS:
//   - A fault never leaves the ledger partially applied; the caller aborts the
//     whole batch.
//   - A fault is always reported as a structured error, never swallowed.
//
// FAULT TYPES:
//   ledger_commit_failure - the ledger fails while installing one key of a batch
//   monitoring_timeout    - the monitoring backend times out for one resource

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tally {
namespace chaos {

enum class FaultType : uint8_t {
  none                  = 0,
  ledger_commit_failure = 1,
  monitoring_timeout    = 2,
};

std::string fault_type_to_string(FaultType ft);
FaultType fault_type_from_string(const std::string& s);

struct FaultSpec {
  FaultType   type{FaultType::none};
  std::string target;                 // QuotaKey or resource id; empty = any
  std::string description;
  uint32_t    skip_count{0};          // matching calls to let through first
  uint32_t    max_inject_count{0};    // 0 = unlimited
  uint64_t    duration_ms{0};         // simulated latency before failing
  uint32_t    seen_count{0};
  uint32_t    inject_count{0};
};

struct ChaosResult {
  bool        injected{false};
  FaultType   fault_type{FaultType::none};
  std::string error_code;
  std::string description;
};

class ChaosController {
 public:
  static constexpr const char* ACTIVATION_KEY = "chaos-ci-only-not-production";

  bool is_enabled() const { return enabled_.load(std::memory_order_relaxed); }

  // Refuses (and logs) an invalid key.
  void activate(const std::string& activation_key);
  void deactivate();

  void register_fault(const FaultSpec& spec);
  void clear_faults();

  // Consumes one matching call. Sleeps for duration_ms when the fault fires.
  ChaosResult inject(FaultType fault_type, const std::string& target);

  std::string status_to_json() const;
  uint64_t total_injections() const;

 private:
  std::atomic<bool>        enabled_{false};
  mutable std::mutex       mu_;
  std::vector<FaultSpec>   faults_;
  std::atomic<uint64_t>    total_injections_{0};
};

ChaosController& global_chaos();

}  // namespace chaos
}  // namespace tally
