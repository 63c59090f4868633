#pragma once

// tally/config.hpp - Engine configuration: JSON file plus TALLY_* overrides.
//
// Precedence: defaults < JSON file < environment. Every value is validated
// after the last layer is applied; an invalid value yields config_invalid and
// names the offending field.
//
//   TALLY_RECONCILE_INTERVAL_MS    reconcile_interval_ms
//   TALLY_SAMPLE_HISTORY_SECONDS   sample_history_seconds
//   TALLY_QUOTA_HISTORY_SECONDS    quota_history_seconds
//   TALLY_FAIL_SILENTLY            fail_silently (1/0, true/false)
//   TALLY_DEFAULT_BUCKETS          default_buckets
//   TALLY_ALERT_THRESHOLD          alert_threshold
//   TALLY_PENDING_QUEUE_CAPACITY   pending_queue_capacity
//   TALLY_QUERY_TIMEOUT_MS         query_timeout_ms

#include <cstdint>
#include <functional>
#include <string>

#include "tally/jsonlite.hpp"
#include "tally/types.hpp"

namespace tally {

struct EngineConfig {
  uint64_t reconcile_interval_ms{60'000};
  int64_t sample_history_seconds{30LL * 24 * 3600};
  int64_t quota_history_seconds{90LL * 24 * 3600};
  bool fail_silently{true};
  uint32_t default_buckets{6};
  double alert_threshold{0.8};
  uint32_t pending_queue_capacity{1024};
  uint64_t query_timeout_ms{0};  // 0 = no deadline

  std::string to_json() const;
};

struct ConfigResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  EngineConfig config;
};

ConfigResult config_from_json(const jsonlite::Object& obj, EngineConfig base = {});

// getenv is injectable so tests do not mutate the process environment.
using EnvLookup = std::function<const char*(const char*)>;
ConfigResult apply_env_overrides(EngineConfig base, const EnvLookup& getenv_fn);
ConfigResult apply_env_overrides(EngineConfig base);

ConfigResult validate_config(const EngineConfig& cfg);

// Empty path = defaults + environment.
ConfigResult load_config(const std::string& path);

}  // namespace tally
