#pragma once

// tally/alerts.hpp - Alert records and quota-threshold alert evaluation.
//
// At most one open alert exists per (scope, type). Raising an alert that is
// already open updates its severity and message in place; closing stamps
// closed_at. Closed alerts are kept for statistics.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tally/jsonlite.hpp"
#include "tally/ledger.hpp"
#include "tally/types.hpp"

namespace tally {

enum class Severity { debug, info, warning, error };

std::string to_string(Severity s);
std::optional<Severity> parse_severity(const std::string& s);

inline constexpr const char* kQuotaThresholdAlert = "quota_usage_is_over_threshold";

struct Alert {
  uint64_t id{0};
  ScopeRef scope;
  Severity severity{Severity::info};
  std::string type;
  std::string message;
  int64_t opened_at{0};
  std::optional<int64_t> closed_at;
  bool acknowledged{false};

  bool is_open() const { return !closed_at.has_value(); }
  jsonlite::Object to_object() const;
};

struct AlertResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

class AlertLog {
 public:
  using Clock = std::function<int64_t()>;

  explicit AlertLog(Clock clock = {});

  // Opens a new alert or updates the open one for (scope, type).
  Alert raise(const ScopeRef& scope, const std::string& type, const std::string& message,
              Severity severity);
  // Returns false when no alert of (scope, type) is open.
  bool close(const ScopeRef& scope, const std::string& type);

  AlertResult acknowledge(uint64_t id);
  AlertResult cancel_acknowledgment(uint64_t id);

  std::optional<Alert> open_alert(const ScopeRef& scope, const std::string& type) const;
  std::vector<Alert> snapshot() const;

  // Opens a warning when any limited quota of the scope has
  // usage > threshold * limit, closes it otherwise.
  void evaluate_quota(const ScopeRef& scope, const LedgerSnapshot& scope_snapshot, double threshold);

 private:
  int64_t now() const;

  Clock clock_;
  mutable std::mutex mu_;
  uint64_t next_id_{1};
  std::vector<Alert> alerts_;
  std::map<std::pair<ScopeRef, std::string>, size_t> open_;   // -> index into alerts_
};

}  // namespace tally
