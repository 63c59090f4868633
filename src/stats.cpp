#include "tally/stats.hpp"

#include <algorithm>
#include <chrono>
#include <set>

#include "tally/observability.hpp"

namespace tally {

namespace {

constexpr uint32_t kMaxBuckets = 10'000;

// Counts the query and records its latency on scope exit.
class QueryMeter {
 public:
  QueryMeter() { global_engine_stats().queries.fetch_add(1, std::memory_order_relaxed); }
  ~QueryMeter() {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    global_engine_stats().query_latency.record(static_cast<uint64_t>(ns.count()));
  }

 private:
  std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

template <typename Result>
void mark_deadline(Result& r) {
  if (r.partial) return;
  r.ok = false;
  r.error = ErrorCode::deadline_exceeded;
  r.partial = true;
  r.detail = "deadline exceeded; partial result";
  global_engine_stats().partial_results.fetch_add(1, std::memory_order_relaxed);
}

template <typename Result>
Result invalid(std::string detail) {
  Result r;
  r.ok = false;
  r.error = ErrorCode::validation_error;
  r.detail = std::move(detail);
  return r;
}

void put_status(jsonlite::Object& o, bool ok, ErrorCode error, const std::string& detail) {
  o["ok"] = ok;
  if (!ok) {
    o["error"] = to_string(error);
    o["detail"] = detail;
  }
}

jsonlite::Array buckets_to_array(const std::vector<Bucket>& buckets) {
  jsonlite::Array out;
  for (const auto& b : buckets) {
    out.push_back(jsonlite::Object{{"from", b.from}, {"to", b.to}, {"value", b.value}});
  }
  return out;
}

std::string validate_window(int64_t from, int64_t to, uint32_t n_buckets) {
  if (to <= from) return "'to' must be greater than 'from'";
  if (n_buckets == 0 || n_buckets > kMaxBuckets) {
    return "n_buckets must be in [1, " + std::to_string(kMaxBuckets) + "]";
  }
  return {};
}

std::vector<std::string> quota_types(const std::optional<std::string>& item) {
  if (item) return {*item};
  return standard_quota_names();
}

}  // namespace

std::string to_string(TimelineInterval i) {
  switch (i) {
    case TimelineInterval::hour: return "hour";
    case TimelineInterval::day: return "day";
    case TimelineInterval::week: return "week";
    case TimelineInterval::month: return "month";
  }
  return "day";
}

std::optional<TimelineInterval> parse_interval(const std::string& s) {
  if (s == "hour") return TimelineInterval::hour;
  if (s == "day") return TimelineInterval::day;
  if (s == "week") return TimelineInterval::week;
  if (s == "month") return TimelineInterval::month;
  return std::nullopt;
}

int64_t interval_seconds(TimelineInterval i) {
  switch (i) {
    case TimelineInterval::hour: return 3600;
    case TimelineInterval::day: return 24 * 3600;
    case TimelineInterval::week: return 7 * 24 * 3600;
    case TimelineInterval::month: return 30 * 24 * 3600;
  }
  return 24 * 3600;
}

// ---------------------------------------------------------------------------
// JSON shapes
// ---------------------------------------------------------------------------

std::string UsageStatistics::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["partial"] = partial;
  o["item"] = to_string(item);
  jsonlite::Array arr;
  for (const auto& s : scopes) {
    jsonlite::Object so;
    so["scope"] = s.scope.to_string();
    so["name"] = s.name;
    so["resources"] = static_cast<uint64_t>(s.resources);
    so["buckets"] = buckets_to_array(s.buckets);
    arr.push_back(std::move(so));
  }
  o["scopes"] = std::move(arr);
  jsonlite::Array w;
  for (const auto& m : warnings) w.push_back(m);
  o["warnings"] = std::move(w);
  return jsonlite::to_json(o);
}

std::string CustomerSummary::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["partial"] = partial;
  jsonlite::Array arr;
  for (const auto& c : customers) {
    jsonlite::Object co;
    co["uuid"] = c.uuid;
    co["name"] = c.name;
    co["projects"] = static_cast<uint64_t>(c.projects);
    co["project_groups"] = static_cast<uint64_t>(c.project_groups);
    co["resources"] = static_cast<uint64_t>(c.resources);
    jsonlite::Object quotas;
    for (const auto& [name, limit] : c.limits) quotas[name] = limit;
    for (const auto& [name, usage] : c.usages) quotas[name + "_usage"] = usage;
    co["quotas"] = std::move(quotas);
    arr.push_back(std::move(co));
  }
  o["customers"] = std::move(arr);
  return jsonlite::to_json(o);
}

std::string ResourceStatistics::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["backend_ref"] = backend_ref;
  o["resources"] = static_cast<uint64_t>(resources);
  jsonlite::Object states;
  for (const auto& [state, n] : by_state) states[state] = static_cast<uint64_t>(n);
  o["by_state"] = std::move(states);
  o["vcpu"] = vcpu;
  o["ram"] = ram_mb;
  o["storage"] = storage_mb;
  return jsonlite::to_json(o);
}

std::string CreationTimeStatistics::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["type"] = to_string(type);
  o["buckets"] = buckets_to_array(buckets);
  return jsonlite::to_json(o);
}

std::string QuotaStatistics::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["partial"] = partial;
  o["scopes"] = static_cast<uint64_t>(scopes);
  for (const auto& [k, v] : values) o[k] = v;
  return jsonlite::to_json(o);
}

std::string QuotaTimeline::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["partial"] = partial;
  o["interval"] = to_string(interval);
  jsonlite::Array arr;
  for (const auto& p : points) {
    jsonlite::Object po;
    po["from"] = p.from;
    po["to"] = p.to;
    for (const auto& [k, v] : p.values) po[k] = v;
    arr.push_back(std::move(po));
  }
  o["points"] = std::move(arr);
  return jsonlite::to_json(o);
}

std::string AlertStatistics::to_json() const {
  jsonlite::Object o;
  put_status(o, ok, error, detail);
  o["total"] = static_cast<uint64_t>(total);
  for (const auto& [sev, n] : by_severity) o[sev] = static_cast<uint64_t>(n);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// StatsEngine
// ---------------------------------------------------------------------------

StatsEngine::StatsEngine(const Hierarchy& hierarchy, const ResourceRegistry& resources,
                         const QuotaLedger& ledger, const SampleStore& samples,
                         const AlertLog& alerts, SampleIngestor* ingestor, Clock clock)
    : hierarchy_(hierarchy),
      resources_(resources),
      ledger_(ledger),
      samples_(samples),
      alerts_(alerts),
      ingestor_(ingestor),
      clock_(std::move(clock)) {}

int64_t StatsEngine::now() const {
  return clock_ ? clock_() : now_unix_ms() / 1000;
}

std::vector<ScopeRef> StatsEngine::resolve_scopes(ScopeType aggregate,
                                                  const std::optional<std::string>& uuid,
                                                  std::string* error) const {
  if (!uuid) return hierarchy_.scopes_of_type(aggregate);
  ScopeRef scope{aggregate, *uuid};
  if (!hierarchy_.exists(scope)) {
    if (error) *error = "unknown scope " + scope.to_string();
    return {};
  }
  return {scope};
}

UsageStatistics StatsEngine::usage_statistics(const UsageQuery& q, const QueryContext& ctx) const {
  QueryMeter meter;
  const int64_t to = q.to.value_or(now());
  const int64_t from = q.from.value_or(to - 3600);
  if (auto why = validate_window(from, to, q.n_buckets); !why.empty()) {
    return invalid<UsageStatistics>(why);
  }
  std::string why;
  auto scopes = resolve_scopes(q.aggregate, q.scope_uuid, &why);
  if (!why.empty()) return invalid<UsageStatistics>(why);

  UsageStatistics out;
  out.item = q.item;

  // Resources per scope, including ones deleted since: their samples still
  // count for the windows in which they ran.
  std::vector<std::vector<std::string>> members(scopes.size());
  std::set<std::string> all_ids;
  for (size_t i = 0; i < scopes.size(); ++i) {
    for (const auto& project : hierarchy_.projects_under(scopes[i])) {
      for (const auto& r : resources_.by_project(project)) {
        members[i].push_back(r.resource_id);
        all_ids.insert(r.resource_id);
      }
    }
  }

  if (ingestor_ && !all_ids.empty()) {
    const std::vector<std::string> ids(all_ids.begin(), all_ids.end());
    auto report = ingestor_->ingest(ids, q.item, from, to, [&ctx] { return ctx.expired(); });
    out.warnings = report.warnings;
    if (report.deadline_exceeded) {
      mark_deadline(out);
      return out;
    }
    if (!report.ok) {
      out.ok = false;
      out.error = report.error;
      out.detail = report.detail;
      return out;
    }
  }

  for (size_t i = 0; i < scopes.size(); ++i) {
    if (ctx.expired()) {
      mark_deadline(out);
      break;
    }
    ScopeSeries series;
    series.scope = scopes[i];
    series.name = hierarchy_.name_of(scopes[i]);
    series.resources = members[i].size();
    series.buckets = bucketize({}, from, to, q.n_buckets);
    bool complete = true;
    for (const auto& id : members[i]) {
      if (ctx.expired()) {
        complete = false;
        break;
      }
      auto per_resource = bucketize(samples_.query(id, q.item, from, to), from, to, q.n_buckets);
      for (size_t b = 0; b < per_resource.size(); ++b) series.buckets[b].value += per_resource[b].value;
    }
    if (!complete) {
      mark_deadline(out);
      break;
    }
    out.scopes.push_back(std::move(series));
  }
  return out;
}

CustomerSummary StatsEngine::customer_summary(const QueryContext& ctx) const {
  QueryMeter meter;
  CustomerSummary out;

  std::map<std::string, size_t> live_per_customer;
  for (const auto& r : resources_.live_snapshot()) {
    for (const auto& scope : r.ancestors) {
      if (scope.type == ScopeType::customer) ++live_per_customer[scope.uuid];
    }
  }

  for (const auto& scope : hierarchy_.scopes_of_type(ScopeType::customer)) {
    if (ctx.expired()) {
      mark_deadline(out);
      break;
    }
    CustomerSummaryRow row;
    row.uuid = scope.uuid;
    row.name = hierarchy_.name_of(scope);
    row.projects = hierarchy_.projects_under(scope).size();
    row.project_groups = hierarchy_.group_count(scope.uuid);
    auto it = live_per_customer.find(scope.uuid);
    row.resources = it == live_per_customer.end() ? 0 : it->second;
    for (const auto& [key, value] : ledger_.snapshot_scope(scope).values) {
      row.limits[key.resource_type] = value.limit.value_or(-1);
      row.usages[key.resource_type] = value.usage;
    }
    out.customers.push_back(std::move(row));
  }
  return out;
}

ResourceStatistics StatsEngine::resource_statistics(const std::string& backend_ref) const {
  QueryMeter meter;
  if (backend_ref.empty()) return invalid<ResourceStatistics>("backend_ref is required");

  ResourceStatistics out;
  out.backend_ref = backend_ref;
  for (const auto& r : resources_.snapshot()) {
    if (r.backend_ref != backend_ref || is_terminal(r.state)) continue;
    ++out.resources;
    ++out.by_state[to_string(r.state)];
    if (consumes_quota(r.state)) {
      out.vcpu += r.figures.vcpu;
      out.ram_mb += r.figures.ram_mb;
      out.storage_mb += r.figures.storage_mb;
    }
  }
  return out;
}

CreationTimeStatistics StatsEngine::creation_time_statistics(const CreationTimeQuery& q) const {
  QueryMeter meter;
  const int64_t to = q.to.value_or(now());
  const int64_t from = q.from.value_or(to - 30LL * 24 * 3600);
  if (auto why = validate_window(from, to, q.n_buckets); !why.empty()) {
    return invalid<CreationTimeStatistics>(why);
  }

  CreationTimeStatistics out;
  out.type = q.type;
  out.buckets = bucketize({}, from, to, q.n_buckets);
  for (int64_t created : hierarchy_.creation_times(q.type)) {
    if (created < from || created >= to) continue;
    auto it = std::upper_bound(out.buckets.begin(), out.buckets.end(), created,
                               [](int64_t ts, const Bucket& b) { return ts < b.from; });
    (it - 1)->value += 1.0;
  }
  return out;
}

QuotaStatistics StatsEngine::quota_statistics(const QuotaQuery& q, const QueryContext& ctx) const {
  QueryMeter meter;
  std::string why;
  auto scopes = resolve_scopes(q.aggregate, q.scope_uuid, &why);
  if (!why.empty()) return invalid<QuotaStatistics>(why);

  QuotaStatistics out;
  std::map<std::string, bool> any_limited;
  for (const auto& name : standard_quota_names()) {
    out.values[name] = 0;
    out.values[name + "_usage"] = 0;
    any_limited[name] = false;
  }

  for (const auto& scope : scopes) {
    if (ctx.expired()) {
      mark_deadline(out);
      break;
    }
    ++out.scopes;
    for (const auto& [key, value] : ledger_.snapshot_scope(scope).values) {
      const auto& name = key.resource_type;
      out.values[name + "_usage"] += value.usage;
      if (value.limit) {
        out.values[name] += *value.limit;
        any_limited[name] = true;
      } else {
        any_limited.emplace(name, false);
      }
    }
  }
  for (const auto& [name, limited] : any_limited) {
    if (!limited) out.values[name] = -1;
  }
  return out;
}

QuotaTimeline StatsEngine::quota_timeline(const TimelineQuery& q, const QueryContext& ctx) const {
  QueryMeter meter;
  const int64_t step = interval_seconds(q.interval);
  const int64_t to = q.to.value_or(now());
  const int64_t from = q.from.value_or(to - 24 * 3600);
  if (to <= from) return invalid<QuotaTimeline>("'to' must be greater than 'from'");
  if ((to - from) / step >= kMaxBuckets) {
    return invalid<QuotaTimeline>("timeline spans more than " + std::to_string(kMaxBuckets) +
                                  " intervals");
  }
  std::string why;
  auto scopes = resolve_scopes(q.aggregate, q.scope_uuid, &why);
  if (!why.empty()) return invalid<QuotaTimeline>(why);
  if (q.item && q.item->empty()) return invalid<QuotaTimeline>("empty quota item");

  QuotaTimeline out;
  out.interval = q.interval;
  const auto types = quota_types(q.item);
  for (int64_t b = from; b < to; b += step) {
    TimelinePoint p;
    p.from = b;
    p.to = std::min(b + step, to);
    for (const auto& t : types) {
      p.values[t] = -1;
      p.values[t + "_usage"] = 0;
    }
    out.points.push_back(std::move(p));
  }

  for (const auto& scope : scopes) {
    if (ctx.expired()) {
      mark_deadline(out);
      break;
    }
    for (const auto& type : types) {
      const QuotaKey key{scope, type};
      for (auto& p : out.points) {
        auto h = ledger_.history(key, p.from, p.to);
        std::vector<QuotaHistoryEntry> in_effect;
        if (h.baseline) in_effect.push_back(*h.baseline);
        in_effect.insert(in_effect.end(), h.entries.begin(), h.entries.end());
        if (in_effect.empty()) continue;   // scope did not exist yet

        double usage_sum = 0;
        double limit_sum = 0;
        size_t limited = 0;
        for (const auto& e : in_effect) {
          usage_sum += static_cast<double>(e.usage);
          if (e.limit) {
            limit_sum += static_cast<double>(*e.limit);
            ++limited;
          }
        }
        p.values[type + "_usage"] += usage_sum / static_cast<double>(in_effect.size());
        if (limited > 0) {
          double& slot = p.values[type];
          if (slot < 0) slot = 0;
          slot += limit_sum / static_cast<double>(limited);
        }
      }
    }
  }
  return out;
}

AlertStatistics StatsEngine::alert_statistics(const AlertQuery& q) const {
  QueryMeter meter;
  if (q.from && q.to && *q.to <= *q.from) {
    return invalid<AlertStatistics>("'to' must be greater than 'from'");
  }
  std::set<ScopeRef> in_scope;
  if (q.scope) {
    if (!hierarchy_.exists(*q.scope)) {
      return invalid<AlertStatistics>("unknown scope " + q.scope->to_string());
    }
    for (const auto& s : hierarchy_.subtree(*q.scope)) in_scope.insert(s);
  }
  const std::set<std::string> types(q.types.begin(), q.types.end());

  AlertStatistics out;
  for (auto s : {Severity::debug, Severity::info, Severity::warning, Severity::error}) {
    out.by_severity[to_string(s)] = 0;
  }
  for (const auto& a : alerts_.snapshot()) {
    if (q.from && a.opened_at < *q.from) continue;
    if (q.to && a.opened_at >= *q.to) continue;
    if (q.scope && in_scope.count(a.scope) == 0) continue;
    if (!types.empty() && types.count(a.type) == 0) continue;
    if (q.acknowledged && a.acknowledged != *q.acknowledged) continue;
    if (q.opened && a.is_open() != *q.opened) continue;
    ++out.total;
    ++out.by_severity[to_string(a.severity)];
  }
  return out;
}

}  // namespace tally
