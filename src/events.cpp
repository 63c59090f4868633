#include "tally/events.hpp"

#include <functional>

#include "tally/hash.hpp"
#include "tally/observability.hpp"
#include "tally/version.hpp"

namespace tally {

namespace {

jsonlite::Object figures_to_object(const Figures& f) {
  jsonlite::Object o;
  o["vcpu"] = f.vcpu;
  o["ram_mb"] = f.ram_mb;
  o["storage_mb"] = f.storage_mb;
  return o;
}

bool figures_from_object(const jsonlite::Object& parent, const std::string& key, Figures& out,
                         std::string* error) {
  auto obj = jsonlite::get_object(parent, key);
  if (!obj) return true;  // absent = zero figures
  out.vcpu = jsonlite::get_i64(*obj, "vcpu");
  out.ram_mb = jsonlite::get_i64(*obj, "ram_mb");
  out.storage_mb = jsonlite::get_i64(*obj, "storage_mb");
  if (out.vcpu < 0 || out.ram_mb < 0 || out.storage_mb < 0) {
    if (error) *error = key + ": figures must be non-negative";
    return false;
  }
  return true;
}

jsonlite::Object amounts_to_object(const QuotaAmounts& a) {
  jsonlite::Object o;
  for (const auto& [name, v] : a) o[name] = v;
  return o;
}

}  // namespace

// ---------------------------------------------------------------------------
// Canonical form
// ---------------------------------------------------------------------------

jsonlite::Object event_to_object(const LifecycleEvent& ev) {
  jsonlite::Object o;
  o["resource_id"] = ev.resource_id;
  o["project"] = ev.project_uuid;
  o["kind"] = ev.kind;
  o["backend_ref"] = ev.backend_ref;
  o["before"] = figures_to_object(ev.before);
  o["after"] = figures_to_object(ev.after);
  o["transition"] = to_string(ev.transition);
  o["seq"] = ev.sequence;
  o["timestamp"] = ev.timestamp;
  return o;
}

std::string canonicalize_event(const LifecycleEvent& ev) {
  auto o = event_to_object(ev);
  o["v"] = static_cast<int64_t>(version::EVENT_DIGEST_VERSION);
  return jsonlite::to_json(o);
}

std::string lifecycle_event_digest(const LifecycleEvent& ev) {
  return event_digest(canonicalize_event(ev));
}

std::optional<LifecycleEvent> event_from_object(const jsonlite::Object& obj, std::string* error) {
  LifecycleEvent ev;
  ev.resource_id = jsonlite::get_string(obj, "resource_id");
  ev.project_uuid = jsonlite::get_string(obj, "project");
  ev.kind = jsonlite::get_string(obj, "kind", kInstanceKind);
  ev.backend_ref = jsonlite::get_string(obj, "backend_ref");
  ev.timestamp = jsonlite::get_i64(obj, "timestamp");

  const int64_t seq = jsonlite::get_i64(obj, "seq", -1);
  if (seq < 0) {
    if (error) *error = "seq: expected non-negative integer";
    return std::nullopt;
  }
  ev.sequence = static_cast<uint64_t>(seq);

  const auto state = parse_resource_state(jsonlite::get_string(obj, "transition"));
  if (!state) {
    if (error) *error = "transition: unknown state '" + jsonlite::get_string(obj, "transition") + "'";
    return std::nullopt;
  }
  ev.transition = *state;

  if (!figures_from_object(obj, "before", ev.before, error)) return std::nullopt;
  if (!figures_from_object(obj, "after", ev.after, error)) return std::nullopt;
  return ev;
}

std::string EventOutcome::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  o["error"] = tally::to_string(error);
  o["detail"] = detail;
  o["retryable"] = retryable;
  o["duplicate"] = duplicate;
  o["queued"] = queued;
  o["ticket"] = ticket;
  o["applied"] = amounts_to_object(applied);
  o["drained"] = static_cast<uint64_t>(drained);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LifecycleEventProcessor
// ---------------------------------------------------------------------------

LifecycleEventProcessor::LifecycleEventProcessor(QuotaLedger& ledger, ResourceRegistry& resources,
                                                 const Hierarchy& hierarchy, AlertLog* alerts,
                                                 EventProcessorOptions options)
    : ledger_(ledger),
      resources_(resources),
      hierarchy_(hierarchy),
      alerts_(alerts),
      options_(options) {}

std::mutex& LifecycleEventProcessor::resource_lock(const std::string& resource_id) {
  return stripes_[std::hash<std::string>{}(resource_id) % kStripes];
}

std::vector<std::unique_lock<std::mutex>> LifecycleEventProcessor::quiesce() {
  std::vector<std::unique_lock<std::mutex>> held;
  held.reserve(kStripes);
  for (auto& m : stripes_) held.emplace_back(m);
  return held;
}

size_t LifecycleEventProcessor::pending_count() const {
  std::lock_guard<std::mutex> lk(pending_mu_);
  return pending_size_;
}

EventOutcome LifecycleEventProcessor::reject(ErrorCode code, std::string detail) {
  EventOutcome out;
  out.ok = false;
  out.error = code;
  out.detail = std::move(detail);
  out.retryable = is_retryable(code);
  global_engine_stats().record_rejection(code);
  return out;
}

bool LifecycleEventProcessor::park(const LifecycleEvent& ev, const std::string& digest,
                                   bool* already_parked) {
  std::lock_guard<std::mutex> lk(pending_mu_);
  auto& slots = pending_[ev.resource_id];
  if (slots.count(ev.sequence) != 0) {
    *already_parked = true;
    return true;
  }
  if (pending_size_ >= options_.pending_capacity) {
    if (slots.empty()) pending_.erase(ev.resource_id);
    return false;
  }
  slots.emplace(ev.sequence, std::make_pair(ev, digest));
  ++pending_size_;
  return true;
}

std::optional<std::pair<LifecycleEvent, std::string>> LifecycleEventProcessor::take_parked(
    const std::string& resource_id, uint64_t seq) {
  std::lock_guard<std::mutex> lk(pending_mu_);
  auto r = pending_.find(resource_id);
  if (r == pending_.end()) return std::nullopt;
  auto s = r->second.find(seq);
  if (s == r->second.end()) return std::nullopt;
  auto entry = std::move(s->second);
  r->second.erase(s);
  if (r->second.empty()) pending_.erase(r);
  --pending_size_;
  return entry;
}

EventOutcome LifecycleEventProcessor::apply(const LifecycleEvent& ev) {
  if (ev.resource_id.empty()) return reject(ErrorCode::validation_error, "resource_id is empty");
  if (ev.project_uuid.empty()) return reject(ErrorCode::validation_error, "project is empty");
  if (ev.sequence == 0) return reject(ErrorCode::validation_error, "sequence numbers start at 1");
  if (ev.after.vcpu < 0 || ev.after.ram_mb < 0 || ev.after.storage_mb < 0 ||
      ev.before.vcpu < 0 || ev.before.ram_mb < 0 || ev.before.storage_mb < 0) {
    return reject(ErrorCode::validation_error, "figures must be non-negative");
  }

  const std::string digest = lifecycle_event_digest(ev);
  auto& stats = global_engine_stats();

  std::lock_guard<std::mutex> lk(resource_lock(ev.resource_id));
  const auto rec = resources_.get(ev.resource_id);
  const uint64_t last = rec ? rec->last_seq : 0;

  if (ev.sequence <= last) {
    if (ev.sequence - 1 < rec->digests.size() && rec->digests[ev.sequence - 1] == digest) {
      stats.events_duplicate.fetch_add(1, std::memory_order_relaxed);
      auto out = reject(ErrorCode::out_of_order_event,
                        "duplicate of applied event seq " + std::to_string(ev.sequence));
      out.duplicate = true;
      return out;
    }
    return reject(ErrorCode::validation_error,
                  "non-monotonic sequence " + std::to_string(ev.sequence) + " (last applied " +
                      std::to_string(last) + ")");
  }

  if (ev.sequence > last + 1) {
    bool already = false;
    const bool parked = park(ev, digest, &already);
    if (parked && !already) stats.events_parked.fetch_add(1, std::memory_order_relaxed);
    auto out = reject(ErrorCode::out_of_order_event,
                      "expected seq " + std::to_string(last + 1) + ", got " + std::to_string(ev.sequence) +
                          (parked ? "" : " (pending queue full)"));
    out.queued = parked;
    out.duplicate = already;
    return out;
  }

  auto out = apply_in_order(ev, digest, rec);
  if (!out.ok) return out;

  // Drain parked successors now that the gap is closed.
  uint64_t next_seq = ev.sequence + 1;
  while (auto parked = take_parked(ev.resource_id, next_seq)) {
    auto next = apply_in_order(parked->first, parked->second, resources_.get(ev.resource_id));
    if (!next.ok) {
      // Leave it for the caller's retry of the same event; the sequence did not advance.
      emit_log(LogLevel::warning, "events.drain_failed",
               "parked event could not be applied: " + next.detail,
               jsonlite::Object{{"resource_id", ev.resource_id}, {"seq", next_seq}});
      break;
    }
    ++out.drained;
    stats.events_drained.fetch_add(1, std::memory_order_relaxed);
    ++next_seq;
  }
  return out;
}

EventOutcome LifecycleEventProcessor::apply_in_order(const LifecycleEvent& ev,
                                                     const std::string& digest,
                                                     const std::optional<ResourceRecord>& rec) {
  auto& stats = global_engine_stats();

  ResourceRecord next;
  if (rec) {
    next = *rec;
    if (rec->project_uuid != ev.project_uuid) {
      return reject(ErrorCode::validation_error,
                    "resource " + ev.resource_id + " belongs to project " + rec->project_uuid);
    }
    if (rec->state == ResourceState::deleted && !is_terminal(ev.transition)) {
      return reject(ErrorCode::validation_error, "resource " + ev.resource_id + " is already deleted");
    }
    if (!consumes_quota(rec->state) && consumes_quota(ev.transition)) {
      return reject(ErrorCode::validation_error,
                    "transition " + to_string(rec->state) + " -> " + to_string(ev.transition) +
                        " would re-acquire released quota");
    }
    if (consumes_quota(rec->state) && consumes_quota(ev.transition) && ev.before != rec->figures) {
      emit_log(LogLevel::warning, "events.before_mismatch",
               "event before-figures differ from recorded figures; recorded figures used",
               jsonlite::Object{{"resource_id", ev.resource_id}, {"seq", ev.sequence}});
    }
  } else {
    next.resource_id = ev.resource_id;
    next.project_uuid = ev.project_uuid;
    next.kind = ev.kind;
    next.backend_ref = ev.backend_ref;
    next.ancestors = hierarchy_.ancestors_of_project(ev.project_uuid);
    next.created = ev.timestamp;
    next.figures = ev.before;
    if (next.ancestors.empty()) {
      return reject(ErrorCode::quota_record_missing, "unknown project " + ev.project_uuid);
    }
  }

  const QuotaAmounts old_contribution = rec ? rec->contribution() : QuotaAmounts{};
  next.state = ev.transition;
  if (consumes_quota(ev.transition)) next.figures = ev.after;
  if (!ev.backend_ref.empty()) next.backend_ref = ev.backend_ref;
  const QuotaAmounts delta = quota_delta(old_contribution, next.contribution());

  EventOutcome out;
  out.applied = delta;

  if (!delta.empty()) {
    std::vector<Adjustment> batch;
    batch.reserve(next.ancestors.size() * delta.size());
    for (const auto& scope : next.ancestors) {
      for (const auto& [name, d] : delta) batch.push_back(Adjustment{QuotaKey{scope, name}, d});
    }
    auto committed = ledger_.apply_batch(batch);
    if (!committed.ok) return reject(committed.error, committed.detail);
    out.ticket = committed.ticket;
  }

  next.last_seq = ev.sequence;
  next.digests.push_back(digest);
  next.updated = ev.timestamp;
  resources_.upsert(next);
  stats.events_applied.fetch_add(1, std::memory_order_relaxed);

  if (alerts_ && !delta.empty()) {
    for (const auto& scope : next.ancestors) {
      alerts_->evaluate_quota(scope, ledger_.snapshot_scope(scope), options_.alert_threshold);
    }
  }
  return out;
}

}  // namespace tally
