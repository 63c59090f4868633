#include "tally/chaos.hpp"

#include <chrono>
#include <thread>

#include "tally/jsonlite.hpp"
#include "tally/observability.hpp"

namespace tally {
namespace chaos {

std::string fault_type_to_string(FaultType ft) {
  switch (ft) {
    case FaultType::ledger_commit_failure: return "ledger_commit_failure";
    case FaultType::monitoring_timeout: return "monitoring_timeout";
    case FaultType::none: return "none";
  }
  return "none";
}

FaultType fault_type_from_string(const std::string& s) {
  if (s == "ledger_commit_failure") return FaultType::ledger_commit_failure;
  if (s == "monitoring_timeout") return FaultType::monitoring_timeout;
  return FaultType::none;
}

void ChaosController::activate(const std::string& activation_key) {
  if (activation_key != ACTIVATION_KEY) {
    emit_log(LogLevel::warning, "chaos.activation_refused",
             "invalid activation key, chaos mode not activated");
    return;
  }
  enabled_.store(true, std::memory_order_release);
  emit_log(LogLevel::info, "chaos.activated", "chaos mode activated");
}

void ChaosController::deactivate() {
  enabled_.store(false, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mu_);
  faults_.clear();
}

void ChaosController::register_fault(const FaultSpec& spec) {
  if (!is_enabled()) return;
  std::lock_guard<std::mutex> lock(mu_);
  faults_.push_back(spec);
}

void ChaosController::clear_faults() {
  std::lock_guard<std::mutex> lock(mu_);
  faults_.clear();
}

ChaosResult ChaosController::inject(FaultType fault_type, const std::string& target) {
  ChaosResult result;
  result.fault_type = fault_type;
  if (!is_enabled()) return result;

  uint64_t sleep_ms = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    FaultSpec* spec = nullptr;
    for (auto& f : faults_) {
      if (f.type == fault_type && (f.target.empty() || f.target == target)) {
        spec = &f;
        break;
      }
    }
    if (!spec) return result;
    if (spec->seen_count++ < spec->skip_count) return result;
    if (spec->max_inject_count > 0 && spec->inject_count >= spec->max_inject_count) return result;

    spec->inject_count++;
    total_injections_.fetch_add(1, std::memory_order_relaxed);
    result.injected = true;
    result.description = spec->description;
    result.error_code = "chaos_" + fault_type_to_string(fault_type);
    sleep_ms = spec->duration_ms;
  }
  if (sleep_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
  return result;
}

std::string ChaosController::status_to_json() const {
  std::lock_guard<std::mutex> lock(mu_);
  jsonlite::Array faults;
  for (const auto& f : faults_) {
    jsonlite::Object o;
    o["type"] = fault_type_to_string(f.type);
    o["target"] = f.target;
    o["inject_count"] = static_cast<int64_t>(f.inject_count);
    o["max_inject_count"] = static_cast<int64_t>(f.max_inject_count);
    faults.push_back(o);
  }
  jsonlite::Object out;
  out["chaos_enabled"] = is_enabled();
  out["total_injections"] = total_injections_.load();
  out["faults"] = faults;
  return jsonlite::to_json(out);
}

uint64_t ChaosController::total_injections() const {
  return total_injections_.load(std::memory_order_relaxed);
}

ChaosController& global_chaos() {
  static ChaosController inst;
  return inst;
}

}  // namespace chaos
}  // namespace tally
