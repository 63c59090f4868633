#include "tally/engine.hpp"

#include <algorithm>
#include <map>

#include "tally/audit.hpp"
#include "tally/chaos.hpp"
#include "tally/hash.hpp"
#include "tally/observability.hpp"
#include "tally/version.hpp"

namespace tally {

namespace {

HierarchyResult fail(ErrorCode code, std::string detail) {
  HierarchyResult r;
  r.ok = false;
  r.error = code;
  r.detail = std::move(detail);
  return r;
}

bool has_ancestor(const ResourceRecord& r, const ScopeRef& scope) {
  return std::find(r.ancestors.begin(), r.ancestors.end(), scope) != r.ancestors.end();
}

}  // namespace

Engine::Engine(EngineConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      ledger_(clock_, config_.quota_history_seconds),
      alerts_(clock_),
      processor_(ledger_, resources_, hierarchy_, &alerts_,
                 EventProcessorOptions{config_.pending_queue_capacity, config_.alert_threshold}),
      reconciler_(ledger_, resources_, std::chrono::milliseconds(config_.reconcile_interval_ms),
                  [this] { purge_expired_samples(); }),
      samples_(config_.sample_history_seconds, clock_) {
  rebuild_stats();
}

Engine::~Engine() { stop_background(); }

int64_t Engine::now() const {
  return clock_ ? clock_() : now_unix_ms() / 1000;
}

void Engine::rebuild_stats() {
  stats_ = std::make_unique<StatsEngine>(hierarchy_, resources_, ledger_, samples_, alerts_,
                                         ingestor_.get(), clock_);
}

// ---------------------------------------------------------------------------
// Topology
// ---------------------------------------------------------------------------

HierarchyResult Engine::add_customer(const Customer& c) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  Customer rec = c;
  if (rec.created == 0) rec.created = now();
  auto res = hierarchy_.add_customer(rec);
  if (!res.ok) return res;
  auto reg = ledger_.register_scope(ScopeRef{ScopeType::customer, rec.uuid});
  if (!reg.ok) return fail(reg.error, reg.detail);
  return res;
}

HierarchyResult Engine::add_project_group(const ProjectGroup& g) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  ProjectGroup rec = g;
  if (rec.created == 0) rec.created = now();
  auto res = hierarchy_.add_project_group(rec);
  if (!res.ok) return res;
  auto reg = ledger_.register_scope(ScopeRef{ScopeType::project_group, rec.uuid});
  if (!reg.ok) return fail(reg.error, reg.detail);
  return res;
}

HierarchyResult Engine::add_project(const Project& p) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  Project rec = p;
  if (rec.created == 0) rec.created = now();
  auto res = hierarchy_.add_project(rec);
  if (!res.ok) return res;
  auto reg = ledger_.register_scope(ScopeRef{ScopeType::project, rec.uuid});
  if (!reg.ok) return fail(reg.error, reg.detail);
  return res;
}

// Caller holds processor_.quiesce() and has already changed the hierarchy.
// Each record is moved according to its own cached ancestors: on join only
// records not yet counted in the group, on leave only records still counted.
HierarchyResult Engine::transfer_project_usage(const std::string& project_uuid,
                                               const ScopeRef& group, bool joining) {
  const int64_t sign = joining ? 1 : -1;
  QuotaAmounts moved;
  for (const auto& r : resources_.by_project(project_uuid)) {
    if (has_ancestor(r, group) == joining) continue;
    for (const auto& [name, v] : r.contribution()) moved[name] += v;
  }

  std::vector<Adjustment> batch;
  for (const auto& [name, v] : moved) {
    if (v != 0) batch.push_back(Adjustment{QuotaKey{group, name}, sign * v});
  }
  if (!batch.empty()) {
    auto committed = ledger_.apply_batch(batch);
    if (!committed.ok) return fail(committed.error, committed.detail);
  }
  resources_.set_ancestors_for_project(project_uuid, hierarchy_.ancestors_of_project(project_uuid));
  return {};
}

HierarchyResult Engine::add_project_to_group(const std::string& project_uuid,
                                             const std::string& group_uuid) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  auto quiet = processor_.quiesce();
  auto res = hierarchy_.add_project_to_group(project_uuid, group_uuid);
  if (!res.ok) return res;

  const ScopeRef group{ScopeType::project_group, group_uuid};
  auto moved = transfer_project_usage(project_uuid, group, true);
  if (!moved.ok) {
    auto undo = hierarchy_.remove_project_from_group(project_uuid, group_uuid);
    if (!undo.ok) {
      emit_log(LogLevel::error, "topology.rollback_failed", undo.detail,
               jsonlite::Object{{"project", project_uuid}, {"group", group_uuid}});
    }
    return moved;
  }
  quiet.clear();
  emit_log(LogLevel::info, "topology.group_joined", "project added to group",
           jsonlite::Object{{"project", project_uuid}, {"group", group_uuid}});
  alerts_.evaluate_quota(group, ledger_.snapshot_scope(group), config_.alert_threshold);
  return res;
}

HierarchyResult Engine::remove_project_from_group(const std::string& project_uuid,
                                                  const std::string& group_uuid) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  auto quiet = processor_.quiesce();
  auto res = hierarchy_.remove_project_from_group(project_uuid, group_uuid);
  if (!res.ok) return res;

  const ScopeRef group{ScopeType::project_group, group_uuid};
  auto moved = transfer_project_usage(project_uuid, group, false);
  if (!moved.ok) {
    auto undo = hierarchy_.add_project_to_group(project_uuid, group_uuid);
    if (!undo.ok) {
      emit_log(LogLevel::error, "topology.rollback_failed", undo.detail,
               jsonlite::Object{{"project", project_uuid}, {"group", group_uuid}});
    }
    return moved;
  }
  quiet.clear();
  emit_log(LogLevel::info, "topology.group_left", "project removed from group",
           jsonlite::Object{{"project", project_uuid}, {"group", group_uuid}});
  alerts_.evaluate_quota(group, ledger_.snapshot_scope(group), config_.alert_threshold);
  return res;
}

void Engine::reset_scope(const ScopeRef& scope, const std::string& reason) {
  for (const auto& [key, value] : ledger_.snapshot_scope(scope).values) {
    if (value.usage == 0) continue;
    AuditRecord audit;
    audit.action = "scope.usage_reset";
    audit.quota_key = key.to_string();
    audit.before = value.usage;
    audit.after = 0;
    audit.detail = reason;
    if (!global_audit_log().append(audit)) {
      emit_log(LogLevel::warning, "audit.append_failed", "usage reset not audited",
               jsonlite::Object{{"key", key.to_string()}});
    }
  }
  alerts_.close(scope, kQuotaThresholdAlert);
  auto res = ledger_.unregister_scope(scope);
  if (!res.ok) {
    emit_log(LogLevel::warning, "topology.unregister_failed", res.detail,
             jsonlite::Object{{"scope", scope.to_string()}});
  }
}

HierarchyResult Engine::remove_project(const std::string& uuid) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  auto quiet = processor_.quiesce();
  auto project = hierarchy_.project(uuid);
  if (!project) return fail(ErrorCode::validation_error, "unknown project " + uuid);
  const auto ancestors = hierarchy_.ancestors_of_project(uuid);

  // Out of the hierarchy first: once the locks drop, events for the project
  // fail with quota_record_missing instead of creating orphaned records.
  auto res = hierarchy_.remove_project(uuid);
  if (!res.ok) return res;

  // Release each record from the ancestors it is counted in.
  const ScopeRef self{ScopeType::project, uuid};
  std::map<QuotaKey, int64_t> released;
  for (const auto& r : resources_.by_project(uuid)) {
    const auto contribution = r.contribution();
    for (const auto& scope : r.ancestors) {
      if (scope == self) continue;
      for (const auto& [name, v] : contribution) released[QuotaKey{scope, name}] -= v;
    }
  }
  std::vector<Adjustment> batch;
  for (const auto& [key, d] : released) {
    if (d != 0) batch.push_back(Adjustment{key, d});
  }
  if (!batch.empty()) {
    auto committed = ledger_.apply_batch(batch);
    if (!committed.ok) {
      auto undo = hierarchy_.add_project(*project);
      if (!undo.ok) {
        emit_log(LogLevel::error, "topology.rollback_failed", undo.detail,
                 jsonlite::Object{{"project", uuid}});
      }
      return fail(committed.error, committed.detail);
    }
  }

  reset_scope(self, "project removed");
  const size_t dropped = resources_.remove_project(uuid);
  quiet.clear();
  for (const auto& scope : ancestors) {
    if (scope != self) alerts_.evaluate_quota(scope, ledger_.snapshot_scope(scope), config_.alert_threshold);
  }
  emit_log(LogLevel::info, "topology.project_removed", "project removed",
           jsonlite::Object{{"project", uuid}, {"resources", static_cast<uint64_t>(dropped)}});
  return res;
}

HierarchyResult Engine::remove_project_group(const std::string& uuid) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  auto quiet = processor_.quiesce();
  const ScopeRef group{ScopeType::project_group, uuid};
  const auto members = hierarchy_.projects_under(group);
  auto res = hierarchy_.remove_project_group(uuid);
  if (!res.ok) return res;

  // The group's counters go away with it; only the members' cached
  // ancestor lists change.
  for (const auto& project : members) {
    resources_.set_ancestors_for_project(project, hierarchy_.ancestors_of_project(project));
  }
  reset_scope(group, "project group removed");
  return res;
}

HierarchyResult Engine::remove_customer(const std::string& uuid) {
  std::lock_guard<std::mutex> lk(topology_mu_);
  auto res = hierarchy_.remove_customer(uuid);
  if (!res.ok) return res;
  reset_scope(ScopeRef{ScopeType::customer, uuid}, "customer removed");
  return res;
}

TopologyResult Engine::load_topology(const jsonlite::Object& doc) {
  TopologyResult out;
  auto fail_with = [&](ErrorCode code, const std::string& detail) {
    out.ok = false;
    out.error = code;
    out.detail = detail;
    return out;
  };

  for (const auto& v : jsonlite::get_array(doc, "customers").value_or(jsonlite::Array{})) {
    if (!std::holds_alternative<jsonlite::Object>(v.v)) {
      return fail_with(ErrorCode::validation_error, "customer entry is not an object");
    }
    const auto& o = std::get<jsonlite::Object>(v.v);
    Customer c{jsonlite::get_string(o, "uuid"), jsonlite::get_string(o, "name"),
               jsonlite::get_i64(o, "created")};
    auto res = add_customer(c);
    if (!res.ok) return fail_with(res.error, res.detail);
    ++out.customers;
  }

  for (const auto& v : jsonlite::get_array(doc, "project_groups").value_or(jsonlite::Array{})) {
    if (!std::holds_alternative<jsonlite::Object>(v.v)) {
      return fail_with(ErrorCode::validation_error, "project group entry is not an object");
    }
    const auto& o = std::get<jsonlite::Object>(v.v);
    ProjectGroup g{jsonlite::get_string(o, "uuid"), jsonlite::get_string(o, "name"),
                   jsonlite::get_string(o, "customer"), jsonlite::get_i64(o, "created")};
    auto res = add_project_group(g);
    if (!res.ok) return fail_with(res.error, res.detail);
    ++out.project_groups;
  }

  for (const auto& v : jsonlite::get_array(doc, "projects").value_or(jsonlite::Array{})) {
    if (!std::holds_alternative<jsonlite::Object>(v.v)) {
      return fail_with(ErrorCode::validation_error, "project entry is not an object");
    }
    const auto& o = std::get<jsonlite::Object>(v.v);
    Project p;
    p.uuid = jsonlite::get_string(o, "uuid");
    p.name = jsonlite::get_string(o, "name");
    p.customer_uuid = jsonlite::get_string(o, "customer");
    p.created = jsonlite::get_i64(o, "created");
    for (const auto& g : jsonlite::get_string_array(o, "groups")) p.groups.insert(g);
    auto res = add_project(p);
    if (!res.ok) return fail_with(res.error, res.detail);
    ++out.projects;
  }

  for (const auto& v : jsonlite::get_array(doc, "limits").value_or(jsonlite::Array{})) {
    if (!std::holds_alternative<jsonlite::Object>(v.v)) {
      return fail_with(ErrorCode::validation_error, "limit entry is not an object");
    }
    const auto& o = std::get<jsonlite::Object>(v.v);
    auto type = parse_scope_type(jsonlite::get_string(o, "scope"));
    if (!type) return fail_with(ErrorCode::validation_error, "limit with unknown scope type");
    const QuotaKey key{ScopeRef{*type, jsonlite::get_string(o, "uuid")},
                       jsonlite::get_string(o, "type")};
    std::optional<int64_t> limit;
    if (!jsonlite::is_null(o, "limit")) {
      if (!jsonlite::has_key(o, "limit")) {
        return fail_with(ErrorCode::validation_error, "limit entry without 'limit' for " + key.to_string());
      }
      limit = jsonlite::get_i64(o, "limit", -1);
      // -1 is the unlimited marker of the quota statistics surface.
      if (*limit == -1) limit.reset();
    }
    auto res = set_limit(key, limit);
    if (!res.ok) return fail_with(res.error, res.detail);
    ++out.limits;
  }

  emit_log(LogLevel::info, "topology.loaded", "topology loaded",
           jsonlite::Object{{"customers", static_cast<uint64_t>(out.customers)},
                            {"project_groups", static_cast<uint64_t>(out.project_groups)},
                            {"projects", static_cast<uint64_t>(out.projects)},
                            {"limits", static_cast<uint64_t>(out.limits)}});
  return out;
}

// ---------------------------------------------------------------------------
// Ledger, events, reconciliation
// ---------------------------------------------------------------------------

LedgerResult Engine::set_limit(const QuotaKey& key, std::optional<int64_t> limit) {
  auto res = ledger_.set_limit(key, limit);
  if (res.ok) {
    alerts_.evaluate_quota(key.scope, ledger_.snapshot_scope(key.scope), config_.alert_threshold);
  }
  return res;
}

EventOutcome Engine::apply_event(const LifecycleEvent& ev) {
  return processor_.apply(ev);
}

ReconciliationReport Engine::reconcile() {
  return reconciler_.run_once();
}

void Engine::start_background() {
  reconciler_.start();
}

void Engine::stop_background() {
  reconciler_.stop();
}

// ---------------------------------------------------------------------------
// Samples
// ---------------------------------------------------------------------------

void Engine::attach_backend(std::unique_ptr<MonitoringBackend> backend) {
  backend_ = std::move(backend);
  if (backend_) {
    ingestor_ = std::make_unique<SampleIngestor>(*backend_, samples_, config_.fail_silently);
  } else {
    ingestor_.reset();
  }
  rebuild_stats();
}

size_t Engine::purge_expired_samples() {
  const size_t removed = samples_.purge_expired();
  if (removed > 0) {
    emit_log(LogLevel::info, "samples.purged", "expired samples purged",
             jsonlite::Object{{"removed", static_cast<uint64_t>(removed)}});
  }
  return removed;
}

std::string Engine::health_json() const {
  const auto hash = hash_runtime_info();
  std::string out = "{";
  out += "\"hash\":{\"primitive\":\"" + jsonlite::escape(hash.primitive) + "\",\"version\":\"" +
         jsonlite::escape(hash.version) + "\"}";
  out += ",\"version\":" + version::manifest_to_json(version::current_manifest());
  out += ",\"config\":" + config_.to_json();
  out += ",\"stats\":" + global_engine_stats().to_json();
  out += ",\"chaos\":" + chaos::global_chaos().status_to_json();
  out += ",\"pending_events\":" + std::to_string(processor_.pending_count());
  out += ",\"audit_entries\":" + std::to_string(global_audit_log().entry_count());
  out += "}";
  return out;
}

}  // namespace tally
