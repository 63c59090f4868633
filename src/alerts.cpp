#include "tally/alerts.hpp"

#include <chrono>

#include "tally/observability.hpp"

namespace tally {

std::string to_string(Severity s) {
  switch (s) {
    case Severity::debug: return "debug";
    case Severity::info: return "info";
    case Severity::warning: return "warning";
    case Severity::error: return "error";
  }
  return "info";
}

std::optional<Severity> parse_severity(const std::string& s) {
  if (s == "debug") return Severity::debug;
  if (s == "info") return Severity::info;
  if (s == "warning") return Severity::warning;
  if (s == "error") return Severity::error;
  return std::nullopt;
}

jsonlite::Object Alert::to_object() const {
  jsonlite::Object o;
  o["id"] = id;
  o["scope"] = scope.to_string();
  o["severity"] = to_string(severity);
  o["type"] = type;
  o["message"] = message;
  o["opened_at"] = opened_at;
  o["closed_at"] = closed_at ? jsonlite::Value{*closed_at} : jsonlite::Value{nullptr};
  o["acknowledged"] = acknowledged;
  return o;
}

AlertLog::AlertLog(Clock clock) : clock_(std::move(clock)) {}

int64_t AlertLog::now() const {
  if (clock_) return clock_();
  using SC = std::chrono::system_clock;
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(SC::now().time_since_epoch()).count());
}

Alert AlertLog::raise(const ScopeRef& scope, const std::string& type, const std::string& message,
                      Severity severity) {
  const int64_t ts = now();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = open_.find({scope, type});
  if (it != open_.end()) {
    Alert& a = alerts_[it->second];
    a.severity = severity;
    a.message = message;
    return a;
  }
  Alert a;
  a.id = next_id_++;
  a.scope = scope;
  a.severity = severity;
  a.type = type;
  a.message = message;
  a.opened_at = ts;
  open_[{scope, type}] = alerts_.size();
  alerts_.push_back(a);
  global_engine_stats().alerts_opened.fetch_add(1, std::memory_order_relaxed);
  return a;
}

bool AlertLog::close(const ScopeRef& scope, const std::string& type) {
  const int64_t ts = now();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = open_.find({scope, type});
  if (it == open_.end()) return false;
  alerts_[it->second].closed_at = ts;
  open_.erase(it);
  global_engine_stats().alerts_closed.fetch_add(1, std::memory_order_relaxed);
  return true;
}

AlertResult AlertLog::acknowledge(uint64_t id) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& a : alerts_) {
    if (a.id != id) continue;
    if (a.acknowledged) return AlertResult{false, ErrorCode::validation_error, "alert is already acknowledged"};
    a.acknowledged = true;
    return {};
  }
  return AlertResult{false, ErrorCode::validation_error, "unknown alert " + std::to_string(id)};
}

AlertResult AlertLog::cancel_acknowledgment(uint64_t id) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& a : alerts_) {
    if (a.id != id) continue;
    if (!a.acknowledged) return AlertResult{false, ErrorCode::validation_error, "alert is not acknowledged"};
    a.acknowledged = false;
    return {};
  }
  return AlertResult{false, ErrorCode::validation_error, "unknown alert " + std::to_string(id)};
}

std::optional<Alert> AlertLog::open_alert(const ScopeRef& scope, const std::string& type) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = open_.find({scope, type});
  if (it == open_.end()) return std::nullopt;
  return alerts_[it->second];
}

std::vector<Alert> AlertLog::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return alerts_;
}

void AlertLog::evaluate_quota(const ScopeRef& scope, const LedgerSnapshot& scope_snapshot,
                              double threshold) {
  std::string message;
  for (const auto& [key, value] : scope_snapshot.values) {
    if (key.scope != scope || !value.limit) continue;
    if (static_cast<double>(value.usage) > threshold * static_cast<double>(*value.limit)) {
      if (!message.empty()) message += "; ";
      message += "Quota " + key.resource_type + " is over threshold. Limit: " +
                 std::to_string(*value.limit) + ", usage: " + std::to_string(value.usage);
    }
  }
  if (!message.empty()) {
    raise(scope, kQuotaThresholdAlert, message, Severity::warning);
  } else {
    close(scope, kQuotaThresholdAlert);
  }
}

}  // namespace tally
