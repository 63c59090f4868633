#include "tally/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace tally {

namespace {

ConfigResult invalid(const std::string& detail) {
  ConfigResult r;
  r.ok = false;
  r.error = ErrorCode::config_invalid;
  r.detail = detail;
  return r;
}

bool parse_int(const char* s, int64_t& out) {
  const std::string str(s);
  auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
  return ec == std::errc() && p == str.data() + str.size();
}

bool parse_bool(const char* s, bool& out) {
  const std::string str(s);
  if (str == "1" || str == "true") { out = true; return true; }
  if (str == "0" || str == "false") { out = false; return true; }
  return false;
}

bool parse_real(const char* s, double& out) {
  char* end = nullptr;
  out = std::strtod(s, &end);
  return end && *end == '\0' && end != s;
}

}  // namespace

std::string EngineConfig::to_json() const {
  jsonlite::Object o;
  o["reconcile_interval_ms"] = reconcile_interval_ms;
  o["sample_history_seconds"] = sample_history_seconds;
  o["quota_history_seconds"] = quota_history_seconds;
  o["fail_silently"] = fail_silently;
  o["default_buckets"] = static_cast<int64_t>(default_buckets);
  o["alert_threshold"] = alert_threshold;
  o["pending_queue_capacity"] = static_cast<int64_t>(pending_queue_capacity);
  o["query_timeout_ms"] = query_timeout_ms;
  return jsonlite::to_json(o);
}

ConfigResult validate_config(const EngineConfig& cfg) {
  if (cfg.reconcile_interval_ms == 0) return invalid("reconcile_interval_ms must be > 0");
  if (cfg.sample_history_seconds <= 0) return invalid("sample_history_seconds must be > 0");
  if (cfg.quota_history_seconds <= 0) return invalid("quota_history_seconds must be > 0");
  if (cfg.default_buckets == 0 || cfg.default_buckets > 10'000) {
    return invalid("default_buckets must be in [1, 10000]");
  }
  if (!(cfg.alert_threshold > 0.0 && cfg.alert_threshold <= 1.0)) {
    return invalid("alert_threshold must be in (0, 1]");
  }
  ConfigResult r;
  r.config = cfg;
  return r;
}

ConfigResult config_from_json(const jsonlite::Object& obj, EngineConfig base) {
  static const char* const kKnown[] = {
      "reconcile_interval_ms", "sample_history_seconds", "quota_history_seconds",
      "fail_silently", "default_buckets", "alert_threshold",
      "pending_queue_capacity", "query_timeout_ms"};
  for (const auto& [key, value] : obj) {
    bool known = false;
    for (const char* k : kKnown) known = known || key == k;
    if (!known) return invalid("unknown config key: " + key);
  }

  auto int_field = [&](const char* key, int64_t& out) -> bool {
    if (!jsonlite::has_key(obj, key)) return true;
    const auto& v = obj.at(key).v;
    if (!std::holds_alternative<int64_t>(v)) return false;
    out = std::get<int64_t>(v);
    return true;
  };

  int64_t n = static_cast<int64_t>(base.reconcile_interval_ms);
  if (!int_field("reconcile_interval_ms", n) || n < 0) return invalid("reconcile_interval_ms: expected non-negative integer");
  base.reconcile_interval_ms = static_cast<uint64_t>(n);

  if (!int_field("sample_history_seconds", base.sample_history_seconds)) return invalid("sample_history_seconds: expected integer");
  if (!int_field("quota_history_seconds", base.quota_history_seconds)) return invalid("quota_history_seconds: expected integer");

  n = base.default_buckets;
  if (!int_field("default_buckets", n) || n < 0 || n > 10'000) return invalid("default_buckets: expected integer in [1, 10000]");
  base.default_buckets = static_cast<uint32_t>(n);

  n = base.pending_queue_capacity;
  if (!int_field("pending_queue_capacity", n) || n < 0) return invalid("pending_queue_capacity: expected non-negative integer");
  base.pending_queue_capacity = static_cast<uint32_t>(n);

  n = static_cast<int64_t>(base.query_timeout_ms);
  if (!int_field("query_timeout_ms", n) || n < 0) return invalid("query_timeout_ms: expected non-negative integer");
  base.query_timeout_ms = static_cast<uint64_t>(n);

  if (jsonlite::has_key(obj, "fail_silently")) {
    if (!std::holds_alternative<bool>(obj.at("fail_silently").v)) return invalid("fail_silently: expected boolean");
    base.fail_silently = jsonlite::get_bool(obj, "fail_silently");
  }
  if (jsonlite::has_key(obj, "alert_threshold")) {
    const auto& v = obj.at("alert_threshold").v;
    if (!std::holds_alternative<double>(v) && !std::holds_alternative<int64_t>(v)) {
      return invalid("alert_threshold: expected number");
    }
    base.alert_threshold = jsonlite::get_double(obj, "alert_threshold");
  }
  return validate_config(base);
}

ConfigResult apply_env_overrides(EngineConfig base, const EnvLookup& getenv_fn) {
  auto env_int = [&](const char* name, auto& field) -> bool {
    const char* s = getenv_fn(name);
    if (!s || !s[0]) return true;
    int64_t v = 0;
    if (!parse_int(s, v) || v < 0) return false;
    field = static_cast<std::remove_reference_t<decltype(field)>>(v);
    return true;
  };

  if (!env_int("TALLY_RECONCILE_INTERVAL_MS", base.reconcile_interval_ms)) return invalid("TALLY_RECONCILE_INTERVAL_MS: expected non-negative integer");
  if (!env_int("TALLY_SAMPLE_HISTORY_SECONDS", base.sample_history_seconds)) return invalid("TALLY_SAMPLE_HISTORY_SECONDS: expected non-negative integer");
  if (!env_int("TALLY_QUOTA_HISTORY_SECONDS", base.quota_history_seconds)) return invalid("TALLY_QUOTA_HISTORY_SECONDS: expected non-negative integer");
  if (!env_int("TALLY_DEFAULT_BUCKETS", base.default_buckets)) return invalid("TALLY_DEFAULT_BUCKETS: expected non-negative integer");
  if (!env_int("TALLY_PENDING_QUEUE_CAPACITY", base.pending_queue_capacity)) return invalid("TALLY_PENDING_QUEUE_CAPACITY: expected non-negative integer");
  if (!env_int("TALLY_QUERY_TIMEOUT_MS", base.query_timeout_ms)) return invalid("TALLY_QUERY_TIMEOUT_MS: expected non-negative integer");

  if (const char* s = getenv_fn("TALLY_FAIL_SILENTLY"); s && s[0]) {
    if (!parse_bool(s, base.fail_silently)) return invalid("TALLY_FAIL_SILENTLY: expected 1/0/true/false");
  }
  if (const char* s = getenv_fn("TALLY_ALERT_THRESHOLD"); s && s[0]) {
    if (!parse_real(s, base.alert_threshold)) return invalid("TALLY_ALERT_THRESHOLD: expected number");
  }
  return validate_config(base);
}

ConfigResult apply_env_overrides(EngineConfig base) {
  return apply_env_overrides(std::move(base), [](const char* name) { return std::getenv(name); });
}

ConfigResult load_config(const std::string& path) {
  EngineConfig cfg;
  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) return invalid("cannot read config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(ss.str(), &err);
    if (err) {
      ConfigResult r;
      r.ok = false;
      r.error = ErrorCode::json_parse_error;
      r.detail = path + ": " + err->message;
      return r;
    }
    auto from_file = config_from_json(obj, cfg);
    if (!from_file.ok) return from_file;
    cfg = from_file.config;
  }
  return apply_env_overrides(cfg);
}

}  // namespace tally
