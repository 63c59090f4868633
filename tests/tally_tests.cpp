#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "tally/alerts.hpp"
#include "tally/audit.hpp"
#include "tally/chaos.hpp"
#include "tally/cli_args.hpp"
#include "tally/config.hpp"
#include "tally/engine.hpp"
#include "tally/events.hpp"
#include "tally/hash.hpp"
#include "tally/hierarchy.hpp"
#include "tally/jsonlite.hpp"
#include "tally/ledger.hpp"
#include "tally/observability.hpp"
#include "tally/reconcile.hpp"
#include "tally/samples.hpp"
#include "tally/stats.hpp"
#include "tally/types.hpp"
#include "tally/version.hpp"

namespace fs = std::filesystem;

using tally::Figures;
using tally::QuotaKey;
using tally::ResourceState;
using tally::ScopeRef;
using tally::ScopeType;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Engine clock for tests that depend on time.
std::atomic<int64_t> g_now{1'700'000'000};
int64_t fake_clock() { return g_now.load(); }

std::mutex g_log_mu;
std::vector<tally::LogRecord> g_logs;
void capture_log(const tally::LogRecord& r) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_logs.push_back(r);
}

fs::path scratch_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() /
             ("tally_tests_" + name + "_" +
              std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  fs::create_directories(dir);
  return dir;
}

ScopeRef customer(const std::string& uuid) { return ScopeRef{ScopeType::customer, uuid}; }
ScopeRef group(const std::string& uuid) { return ScopeRef{ScopeType::project_group, uuid}; }
ScopeRef project(const std::string& uuid) { return ScopeRef{ScopeType::project, uuid}; }

QuotaKey vcpu(const ScopeRef& s) { return QuotaKey{s, tally::quota_names::kVcpu}; }
QuotaKey ram(const ScopeRef& s) { return QuotaKey{s, tally::quota_names::kRam}; }

int64_t usage_of(const tally::QuotaLedger& ledger, const QuotaKey& key) {
  auto v = ledger.get(key);
  return v ? v->usage : -1;
}

// Number of ledger keys whose usage differs from the sum of live resource
// contributions over each record's ancestors.
size_t keys_off_truth(const tally::Engine& engine) {
  std::map<QuotaKey, int64_t> truth;
  for (const auto& r : engine.resources().live_snapshot()) {
    for (const auto& [name, amount] : r.contribution()) {
      for (const auto& scope : r.ancestors) truth[QuotaKey{scope, name}] += amount;
    }
  }
  size_t off = 0;
  for (const auto& scope : engine.ledger().scopes()) {
    for (const auto& name : tally::standard_quota_names()) {
      const QuotaKey key{scope, name};
      const auto it = truth.find(key);
      if (usage_of(engine.ledger(), key) != (it == truth.end() ? 0 : it->second)) ++off;
    }
  }
  return off;
}

bool has_ancestor(const tally::ResourceRecord& r, const ScopeRef& scope) {
  return std::find(r.ancestors.begin(), r.ancestors.end(), scope) != r.ancestors.end();
}

// c1 with p1, and g1 that p1 is not a member of.
void seed_ungrouped(tally::Engine& engine) {
  expect(engine.add_customer(tally::Customer{"c1", "Acme", 0}).ok, "add customer");
  expect(engine.add_project_group(tally::ProjectGroup{"g1", "Web", "c1", 0}).ok, "add group");
  tally::Project p1;
  p1.uuid = "p1";
  p1.name = "frontend";
  p1.customer_uuid = "c1";
  expect(engine.add_project(p1).ok, "add p1");
}

tally::LifecycleEvent make_event(const std::string& resource, const std::string& proj,
                                 uint64_t seq, ResourceState transition, Figures before,
                                 Figures after) {
  tally::LifecycleEvent ev;
  ev.resource_id = resource;
  ev.project_uuid = proj;
  ev.backend_ref = "openstack-1";
  ev.sequence = seq;
  ev.transition = transition;
  ev.before = before;
  ev.after = after;
  ev.timestamp = g_now.load();
  return ev;
}

// c1 with projects p1 and p2; p1 also in group g1.
void seed_topology(tally::Engine& engine) {
  expect(engine.add_customer(tally::Customer{"c1", "Acme", 0}).ok, "add customer");
  expect(engine.add_project_group(tally::ProjectGroup{"g1", "Web", "c1", 0}).ok, "add group");
  tally::Project p1;
  p1.uuid = "p1";
  p1.name = "frontend";
  p1.customer_uuid = "c1";
  p1.groups = {"g1"};
  expect(engine.add_project(p1).ok, "add p1");
  tally::Project p2;
  p2.uuid = "p2";
  p2.name = "backend";
  p2.customer_uuid = "c1";
  expect(engine.add_project(p2).ok, "add p2");
}

// ============================================================================
// Vocabulary, hashing, JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(tally::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(tally::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"seq\":1}";
  expect(tally::event_digest(payload) != tally::audit_chain_digest(payload),
         "event and audit domains must differ");
  expect(tally::event_digest(payload) != tally::blake3_hex(payload), "domain prefix must change digest");
  expect(tally::event_digest(payload) == tally::event_digest(payload), "digest must be deterministic");
}

void test_event_digest_stable() {
  auto a = make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{1, 512, 10});
  auto b = a;
  expect(tally::lifecycle_event_digest(a) == tally::lifecycle_event_digest(b), "same event same digest");
  b.after.vcpu = 2;
  expect(tally::lifecycle_event_digest(a) != tally::lifecycle_event_digest(b), "figures change digest");
}

void test_quota_contribution() {
  auto inst = tally::quota_contribution(tally::kInstanceKind, Figures{2, 1024, 0});
  expect(inst.size() == 3, "instance contributes vcpu, ram, max_instances");
  expect(inst.at("vcpu") == 2 && inst.at("ram") == 1024 && inst.at("max_instances") == 1,
         "instance contribution values");
  auto vol = tally::quota_contribution("volume", Figures{0, 0, 40});
  expect(vol.size() == 1 && vol.at("storage") == 40, "volume contributes storage only");

  auto d = tally::quota_delta(inst, tally::QuotaAmounts{{"vcpu", 4}, {"ram", 1024}});
  expect(d.at("vcpu") == 2, "vcpu grows by 2");
  expect(d.count("ram") == 0, "unchanged ram omitted");
  expect(d.at("max_instances") == -1, "missing entry released");
}

void test_jsonlite_parse() {
  std::optional<tally::jsonlite::JsonError> err;
  auto obj = tally::jsonlite::parse("{\"a\":1,\"b\":[true,null,2.5],\"c\":{\"d\":\"x\\u0041\"}}", &err);
  expect(!err, "valid document parses");
  expect(tally::jsonlite::get_i64(obj, "a") == 1, "integer field");
  auto c = tally::jsonlite::get_object(obj, "c");
  expect(c && tally::jsonlite::get_string(*c, "d") == "xA", "unicode escape");

  tally::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  std::string deep(70, '[');
  deep += std::string(70, ']');
  tally::jsonlite::parse("{\"x\":" + deep + "}", &err);
  expect(err.has_value(), "nesting limit enforced");

  tally::jsonlite::parse("[1,2]", &err);
  expect(err.has_value(), "non-object root rejected");
}

void test_error_taxonomy() {
  expect(tally::is_retryable(tally::ErrorCode::out_of_order_event), "out of order retryable");
  expect(tally::is_retryable(tally::ErrorCode::fault_injected), "fault retryable");
  expect(!tally::is_retryable(tally::ErrorCode::validation_error), "validation not retryable");
  expect(tally::to_string(tally::ErrorCode::deadline_exceeded) == "deadline_exceeded", "error names");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults() {
  tally::EngineConfig cfg;
  expect(tally::validate_config(cfg).ok, "defaults valid");
  expect(cfg.default_buckets == 6, "6 buckets by default");
  expect(cfg.fail_silently, "fail silently by default");
}

void test_config_from_json() {
  auto obj = tally::jsonlite::parse(
      "{\"default_buckets\":12,\"alert_threshold\":0.5,\"fail_silently\":false,"
      "\"reconcile_interval_ms\":1000}", nullptr);
  auto r = tally::config_from_json(obj);
  expect(r.ok, "config parses: " + r.detail);
  expect(r.config.default_buckets == 12, "buckets from JSON");
  expect(r.config.alert_threshold == 0.5, "threshold from JSON");
  expect(!r.config.fail_silently, "fail_silently from JSON");
  expect(r.config.reconcile_interval_ms == 1000, "interval from JSON");

  auto bad = tally::config_from_json(tally::jsonlite::parse("{\"buckets\":3}", nullptr));
  expect(!bad.ok && bad.error == tally::ErrorCode::config_invalid, "unknown key rejected");

  auto range = tally::config_from_json(tally::jsonlite::parse("{\"alert_threshold\":1.5}", nullptr));
  expect(!range.ok, "threshold above 1 rejected");
}

void test_config_env_overrides() {
  auto lookup = [](const char* name) -> const char* {
    const std::string n = name;
    if (n == "TALLY_RECONCILE_INTERVAL_MS") return "250";
    if (n == "TALLY_FAIL_SILENTLY") return "false";
    if (n == "TALLY_ALERT_THRESHOLD") return "0.9";
    return nullptr;
  };
  auto r = tally::apply_env_overrides(tally::EngineConfig{}, lookup);
  expect(r.ok, "env overrides apply: " + r.detail);
  expect(r.config.reconcile_interval_ms == 250, "interval from env");
  expect(!r.config.fail_silently, "fail_silently from env");
  expect(r.config.alert_threshold == 0.9, "threshold from env");

  auto garbage = tally::apply_env_overrides(tally::EngineConfig{}, [](const char* name) -> const char* {
    return std::string(name) == "TALLY_DEFAULT_BUCKETS" ? "six" : nullptr;
  });
  expect(!garbage.ok && garbage.error == tally::ErrorCode::config_invalid, "non-numeric env rejected");
}

// ============================================================================
// Hierarchy
// ============================================================================

void test_hierarchy_ancestors() {
  tally::Hierarchy h;
  expect(h.add_customer(tally::Customer{"c1", "Acme", 10}).ok, "customer");
  expect(h.add_project_group(tally::ProjectGroup{"g1", "Web", "c1", 20}).ok, "group");
  expect(h.add_project_group(tally::ProjectGroup{"g2", "Ops", "c1", 30}).ok, "group 2");
  tally::Project p;
  p.uuid = "p1";
  p.customer_uuid = "c1";
  p.groups = {"g1", "g2"};
  expect(h.add_project(p).ok, "project");

  auto chain = h.ancestors_of_project("p1");
  expect(chain.size() == 4, "project, two groups, customer");
  expect(chain.front() == project("p1"), "project first");
  expect(chain.back() == customer("c1"), "customer last");

  expect(!h.remove_customer("c1").ok, "customer with projects cannot be removed");
  tally::Project orphan;
  orphan.uuid = "p2";
  orphan.customer_uuid = "nope";
  expect(!h.add_project(orphan).ok, "project needs a known customer");
  expect(h.subtree(customer("c1")).size() == 4, "subtree: customer, 2 groups, project");
}

// ============================================================================
// Quota Ledger
// ============================================================================

void test_ledger_missing_scope() {
  tally::QuotaLedger ledger;
  auto r = ledger.adjust(vcpu(project("ghost")), 1);
  expect(!r.ok && r.error == tally::ErrorCode::quota_record_missing, "unregistered scope");
  expect(ledger.check(vcpu(project("ghost")), 1000), "missing record is not limited");
}

void test_ledger_check() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  const auto key = vcpu(project("p1"));
  expect(ledger.adjust(key, 3).ok, "adjust");

  // Unlimited: every delta passes.
  for (int64_t d : {-100, -1, 0, 1, 1'000'000}) expect(ledger.check(key, d), "unlimited check passes");

  expect(ledger.set_limit(key, 5).ok, "set limit");
  expect(ledger.set_limit(key, 5).ok, "set limit idempotent");
  expect(usage_of(ledger, key) == 3, "limit does not touch usage");
  expect(ledger.check(key, 2), "3 + 2 <= 5");
  expect(!ledger.check(key, 3), "3 + 3 > 5");
  expect(ledger.check(key, -10), "negative delta passes");
  expect(!ledger.set_limit(key, -4).ok, "negative limit rejected");

  auto errors = ledger.validate_change({project("p1")}, {{"vcpu", 4}});
  expect(errors.size() == 1, "one violation");
  expect(errors[0] == "vcpu quota limit: 5, requires: 7 (project:p1)", "violation message: " + errors[0]);
}

void test_ledger_clamps_at_zero() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  auto& stats = tally::global_engine_stats();
  const auto before = stats.clamped_adjustments.load();
  auto r = ledger.adjust(vcpu(project("p1")), -5);
  expect(r.ok && r.new_usage == 0 && r.clamped, "usage clamped at zero");
  expect(stats.clamped_adjustments.load() == before + 1, "clamp counted");
}

void test_ledger_batch_rollback_on_fault() {
  tally::QuotaLedger ledger;
  for (const auto& s : {project("p1"), group("g1"), customer("c1")}) ledger.register_scope(s);

  auto& chaos = tally::chaos::global_chaos();
  chaos.activate(tally::chaos::ChaosController::ACTIVATION_KEY);
  tally::chaos::FaultSpec spec;
  spec.type = tally::chaos::FaultType::ledger_commit_failure;
  spec.target = vcpu(customer("c1")).to_string();
  spec.max_inject_count = 1;
  chaos.register_fault(spec);

  std::vector<tally::Adjustment> batch{{vcpu(project("p1")), 2}, {vcpu(group("g1")), 2},
                                       {vcpu(customer("c1")), 2}};
  auto failed = ledger.apply_batch(batch);
  expect(!failed.ok && failed.error == tally::ErrorCode::fault_injected, "fault on last ancestor");
  expect(usage_of(ledger, vcpu(project("p1"))) == 0, "project rolled back");
  expect(usage_of(ledger, vcpu(group("g1"))) == 0, "group rolled back");
  expect(usage_of(ledger, vcpu(customer("c1"))) == 0, "customer untouched");

  auto retried = ledger.apply_batch(batch);
  chaos.deactivate();
  expect(retried.ok, "retry after fault commits");
  expect(usage_of(ledger, vcpu(customer("c1"))) == 2, "customer after retry");
  expect(usage_of(ledger, vcpu(project("p1"))) == 2, "project after retry");
}

void test_ledger_aborted_batch_publishes_ticket() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  const auto key = vcpu(project("p1"));

  auto& chaos = tally::chaos::global_chaos();
  chaos.activate(tally::chaos::ChaosController::ACTIVATION_KEY);
  tally::chaos::FaultSpec spec;
  spec.type = tally::chaos::FaultType::ledger_commit_failure;
  spec.target = key.to_string();
  spec.max_inject_count = 1;
  chaos.register_fault(spec);
  auto failed = ledger.adjust(key, 1);
  chaos.deactivate();
  expect(!failed.ok, "injected commit failure");
  const uint64_t after_fault = ledger.visible_ticket();
  expect(after_fault >= 1, "aborted ticket published");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&ledger, &key] {
      for (int i = 0; i < 500; ++i) ledger.adjust(key, 1);
    });
  }
  for (auto& th : threads) th.join();
  expect(ledger.visible_ticket() == after_fault + 2000, "every later ticket published");
  expect(usage_of(ledger, key) == 2000, "later commits visible");
}

void test_ledger_overwrite_cas() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  const auto key = vcpu(project("p1"));
  ledger.adjust(key, 4);
  auto stale = ledger.overwrite_usage(key, 3, 9);
  expect(stale.conflict && stale.observed == 4, "stale expectation conflicts");
  expect(usage_of(ledger, key) == 4, "conflict leaves usage");
  auto ok = ledger.overwrite_usage(key, 4, 9);
  expect(ok.ok && !ok.conflict, "matching expectation overwrites");
  expect(usage_of(ledger, key) == 9, "overwritten");
}

void test_ledger_concurrent_totals() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  ledger.register_scope(customer("c1"));
  constexpr int kThreads = 8;
  constexpr int kIters = 2000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&ledger, t] {
      for (int i = 0; i < kIters; ++i) {
        if (t % 2 == 0) {
          ledger.adjust(vcpu(project("p1")), 1);
        } else {
          ledger.apply_batch({{vcpu(project("p1")), 1}, {vcpu(customer("c1")), 1}});
        }
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(usage_of(ledger, vcpu(project("p1"))) == kThreads * kIters, "exact project total");
  expect(usage_of(ledger, vcpu(customer("c1"))) == (kThreads / 2) * kIters, "exact customer total");
}

void test_ledger_no_half_applied_batch() {
  tally::QuotaLedger ledger;
  ledger.register_scope(project("p1"));
  const std::vector<QuotaKey> keys{vcpu(project("p1")), ram(project("p1"))};
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread reader([&] {
    while (!done.load()) {
      auto snap = ledger.snapshot(keys);
      if (snap.get(keys[0]).usage != snap.get(keys[1]).usage) torn.fetch_add(1);
    }
  });
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&] {
      for (int i = 0; i < 3000; ++i) ledger.apply_batch({{keys[0], 1}, {keys[1], 1}});
    });
  }
  for (auto& w : writers) w.join();
  done.store(true);
  reader.join();
  expect(torn.load() == 0, "reader observed a half-applied batch");
  expect(usage_of(ledger, keys[0]) == 12000, "all batches applied");
}

void test_ledger_history() {
  g_now = 1000;
  tally::QuotaLedger ledger(fake_clock);
  ledger.register_scope(project("p1"));
  g_now = 2000;
  ledger.adjust(vcpu(project("p1")), 4);
  g_now = 3000;
  ledger.set_limit(vcpu(project("p1")), 8);

  auto h = ledger.history(vcpu(project("p1")), 1500, 5000);
  expect(h.baseline && h.baseline->usage == 0, "baseline is registration entry");
  expect(h.entries.size() == 2, "two changes in window");
  expect(h.entries[0].usage == 4 && !h.entries[0].limit, "usage change");
  expect(h.entries[1].limit && *h.entries[1].limit == 8, "limit change");
}

// ============================================================================
// Lifecycle Event Processor
// ============================================================================

void test_two_project_customer_scenario() {
  tally::Engine engine;
  seed_topology(engine);
  auto r1 = engine.apply_event(make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{1, 512, 10}));
  auto r2 = engine.apply_event(make_event("r2", "p2", 1, ResourceState::provisioning, {}, Figures{3, 2048, 20}));
  expect(r1.ok && r2.ok, "both provisioned");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 4, "customer usage 4");

  tally::QueryContext ctx;
  auto q = engine.stats().quota_statistics(tally::QuotaQuery{ScopeType::customer, std::string("c1")}, ctx);
  expect(q.ok && q.values.at("vcpu_usage") == 4, "aggregate=customer reports 4");
  expect(q.values.at("max_instances_usage") == 2, "two instances");

  auto del = engine.apply_event(make_event("r2", "p2", 2, ResourceState::deleted, Figures{3, 2048, 20}, {}));
  expect(del.ok, "delete applied");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 1, "customer usage drops to 1");
  expect(usage_of(engine.ledger(), vcpu(project("p2"))) == 0, "project p2 released");
  expect(usage_of(engine.ledger(), vcpu(group("g1"))) == 1, "group sees only p1");
}

void test_replay_idempotence() {
  tally::Engine engine;
  seed_topology(engine);
  auto ev = make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{2, 1024, 0});
  expect(engine.apply_event(ev).ok, "first apply");
  const auto before = usage_of(engine.ledger(), vcpu(customer("c1")));

  auto again = engine.apply_event(ev);
  expect(!again.ok && again.error == tally::ErrorCode::out_of_order_event, "replay rejected");
  expect(again.duplicate, "replay flagged duplicate");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == before, "replay changes nothing");

  auto del = make_event("r1", "p1", 2, ResourceState::deleted, Figures{2, 1024, 0}, {});
  expect(engine.apply_event(del).ok, "delete");
  expect(engine.apply_event(del).duplicate, "delete replay duplicate");
  auto erred = make_event("r1", "p1", 3, ResourceState::erred, {}, {});
  auto late = engine.apply_event(erred);
  expect(late.ok && late.applied.empty(), "terminal after terminal has zero delta");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 0, "released exactly once");

  auto forged = make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{9, 1, 1});
  auto conflict = engine.apply_event(forged);
  expect(!conflict.ok && conflict.error == tally::ErrorCode::validation_error,
         "same sequence, different content");
}

void test_out_of_order_park_and_drain() {
  tally::Engine engine;
  seed_topology(engine);
  auto& stats = tally::global_engine_stats();
  const auto drained_before = stats.events_drained.load();

  auto resize = make_event("r9", "p2", 2, ResourceState::resizing, Figures{1, 512, 0}, Figures{4, 512, 0});
  auto early = engine.apply_event(resize);
  expect(!early.ok && early.error == tally::ErrorCode::out_of_order_event, "gap rejected");
  expect(early.queued && early.retryable, "gap parked for retry");
  expect(engine.processor().pending_count() == 1, "one parked");
  expect(usage_of(engine.ledger(), vcpu(project("p2"))) == 0, "nothing applied yet");

  auto first = engine.apply_event(make_event("r9", "p2", 1, ResourceState::provisioning, {}, Figures{1, 512, 0}));
  expect(first.ok && first.drained == 1, "gap closed, successor drained");
  expect(engine.processor().pending_count() == 0, "queue empty");
  expect(usage_of(engine.ledger(), vcpu(project("p2"))) == 4, "resize applied after drain");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 4, "customer follows");
  expect(stats.events_drained.load() == drained_before + 1, "drain counted");
}

void test_event_validation() {
  tally::Engine engine;
  seed_topology(engine);
  auto zero = engine.apply_event(make_event("r1", "p1", 0, ResourceState::provisioning, {}, Figures{1, 1, 1}));
  expect(!zero.ok && zero.error == tally::ErrorCode::validation_error, "seq 0 invalid");

  auto unknown = engine.apply_event(make_event("r1", "nope", 1, ResourceState::provisioning, {}, Figures{1, 1, 1}));
  expect(!unknown.ok && unknown.error == tally::ErrorCode::quota_record_missing, "unknown project");
  expect(unknown.retryable, "unknown project retryable");

  // The rejected event did not consume the sequence number.
  auto ok = engine.apply_event(make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{1, 1, 1}));
  expect(ok.ok, "seq 1 still available");

  expect(engine.apply_event(make_event("r1", "p1", 2, ResourceState::deleted, Figures{1, 1, 1}, {})).ok, "delete");
  auto revive = engine.apply_event(make_event("r1", "p1", 3, ResourceState::active, {}, Figures{1, 1, 1}));
  expect(!revive.ok && revive.error == tally::ErrorCode::validation_error, "deleted cannot come back");
}

void test_event_json_roundtrip_fields() {
  auto obj = tally::jsonlite::parse(
      "{\"resource_id\":\"r1\",\"project\":\"p1\",\"kind\":\"instance\",\"transition\":\"active\","
      "\"seq\":3,\"timestamp\":100,\"before\":{\"vcpu\":1,\"ram_mb\":512,\"storage_mb\":0},"
      "\"after\":{\"vcpu\":2,\"ram_mb\":512,\"storage_mb\":0}}", nullptr);
  std::string why;
  auto ev = tally::event_from_object(obj, &why);
  expect(ev.has_value(), "event parses: " + why);
  expect(ev->sequence == 3 && ev->after.vcpu == 2, "event fields");
  expect(ev->transition == ResourceState::active, "transition parsed");

  auto bad = tally::event_from_object(tally::jsonlite::parse("{\"resource_id\":\"r1\"}", nullptr), &why);
  expect(!bad.has_value() && !why.empty(), "incomplete event rejected");
}

// ============================================================================
// Reconciliation
// ============================================================================

void test_reconciliation_corrects_drift() {
  tally::Engine engine;
  seed_topology(engine);
  engine.apply_event(make_event("r1", "p1", 1, ResourceState::provisioning, {}, Figures{2, 1024, 0}));
  engine.apply_event(make_event("r2", "p2", 1, ResourceState::active, {}, Figures{3, 512, 0}));

  // Simulate a missed event on the customer and a phantom one on the group.
  expect(engine.ledger().overwrite_usage(vcpu(customer("c1")), 5, 7).ok, "inject customer drift");
  expect(engine.ledger().overwrite_usage(ram(group("g1")), 1024, 0).ok, "inject group drift");

  auto& stats = tally::global_engine_stats();
  const auto corrections_before = stats.reconcile_corrections.load();
  auto report = engine.reconcile();
  expect(report.corrections.size() == 2, "two corrections");
  expect(report.drift_magnitude == 2u + 1024u, "drift magnitude");
  expect(stats.reconcile_corrections.load() == corrections_before + 2, "corrections counted");

  // Every key now equals the sum of live descendants.
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 5, "customer vcpu corrected");
  expect(usage_of(engine.ledger(), ram(group("g1"))) == 1024, "group ram corrected");
  expect(usage_of(engine.ledger(), vcpu(project("p2"))) == 3, "p2 untouched");

  auto second = engine.reconcile();
  expect(second.corrections.empty(), "second pass is clean");
  expect(second.pass == report.pass + 1, "passes numbered");
}

void test_reconciliation_concurrent_with_events() {
  tally::Engine engine;
  seed_topology(engine);
  constexpr int kWriters = 4;
  constexpr int kCycles = 300;
  std::atomic<int> writers_done{0};

  std::vector<std::thread> writers;
  for (int t = 0; t < kWriters; ++t) {
    writers.emplace_back([&engine, &writers_done, t] {
      const std::string proj = t % 2 ? "p2" : "p1";
      for (int i = 0; i < kCycles; ++i) {
        const std::string id = "w" + std::to_string(t) + "-" + std::to_string(i);
        engine.apply_event(make_event(id, proj, 1, ResourceState::active, {}, Figures{1, 256, 0}));
        engine.apply_event(make_event(id, proj, 2, ResourceState::resizing, Figures{1, 256, 0},
                                      Figures{2, 512, 10}));
        if (i % 2 == 1) {
          engine.apply_event(make_event(id, proj, 3, ResourceState::deleted, Figures{2, 512, 10}, {}));
        }
      }
      writers_done.fetch_add(1);
    });
  }
  int passes = 0;
  while (writers_done.load() < kWriters) {
    engine.reconcile();
    ++passes;
  }
  for (auto& w : writers) w.join();
  expect(passes > 0, "passes ran alongside events");

  engine.reconcile();
  expect(keys_off_truth(engine) == 0, "usage equals live resources on every key after a quiet pass");
  expect(engine.reconcile().corrections.empty(), "further pass finds nothing");
  const int64_t live = kWriters * kCycles / 2;
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 2 * live, "customer total");
}

void test_reconciliation_background() {
  tally::QuotaLedger ledger;
  tally::ResourceRegistry resources;
  tally::ReconciliationJob job(ledger, resources, std::chrono::milliseconds(5));
  job.start();
  expect(job.running(), "worker running");
  for (int i = 0; i < 200 && !job.last_report(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  job.stop();
  expect(!job.running(), "worker stopped");
  expect(job.last_report().has_value(), "background pass ran");
}

void test_background_purges_expired_samples() {
  g_now = 50'000;
  tally::EngineConfig cfg;
  cfg.sample_history_seconds = 600;
  cfg.reconcile_interval_ms = 5;
  tally::Engine engine(cfg, fake_clock);
  expect(engine.samples().append({{"r1", 49'900, tally::Item::cpu, 10.0},
                                  {"r1", 49'990, tally::Item::memory, 64.0}}) == 2,
         "samples stored");
  expect(engine.purge_expired_samples() == 0, "nothing expired yet");

  g_now = 50'560;
  engine.start_background();
  for (int i = 0; i < 400 && engine.samples().size() == 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  expect(engine.samples().size() == 1, "worker purged the expired sample");
  g_now = 51'000;
  for (int i = 0; i < 400 && engine.samples().size() != 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  engine.stop_background();
  expect(engine.samples().size() == 0, "worker purged the rest");
}

// ============================================================================
// Samples & bucketing
// ============================================================================

void test_bucketize_empty() {
  auto buckets = tally::bucketize({}, 0, 600, 6);
  expect(buckets.size() == 6, "exactly 6 buckets");
  for (size_t i = 0; i < buckets.size(); ++i) {
    expect(buckets[i].from == static_cast<int64_t>(i) * 100, "bucket from");
    expect(buckets[i].to == static_cast<int64_t>(i + 1) * 100, "bucket to");
    expect(buckets[i].value == 0.0, "zero fill");
  }
}

void test_bucketize_mean_and_edges() {
  std::vector<tally::UsageSample> samples{
      {"r1", 10, tally::Item::cpu, 2.0}, {"r1", 20, tally::Item::cpu, 4.0},
      {"r1", 150, tally::Item::cpu, 9.0}, {"r1", 300, tally::Item::cpu, 100.0}};
  auto b = tally::bucketize(samples, 0, 300, 3);
  expect(b.size() == 3, "3 buckets");
  expect(b[0].value == 3.0, "mean of bucket 0");
  expect(b[1].value == 9.0, "mean of bucket 1");
  expect(b[2].value == 0.0, "'to' is exclusive");

  auto uneven = tally::bucketize({}, 0, 10, 3);
  expect(uneven[0].to == uneven[1].from && uneven[1].to == uneven[2].from, "contiguous");
  expect(uneven.front().from == 0 && uneven.back().to == 10, "covers range");
  expect(tally::bucketize({}, 10, 10, 3).empty(), "empty range");
  expect(tally::bucketize({}, 0, 10, 0).empty(), "zero buckets");
}

void test_unit_normalization() {
  std::string why;
  expect(*tally::normalize_value(tally::Item::memory, 1048576, "B", &why) == 1.0, "bytes to MiB");
  expect(*tally::normalize_value(tally::Item::storage, 2, "GiB", &why) == 2048.0, "GiB to MiB");
  expect(*tally::normalize_value(tally::Item::memory, 2048, "KiB", &why) == 2.0, "KiB to MiB");
  expect(*tally::normalize_value(tally::Item::cpu, 0.25, "ratio", &why) == 25.0, "ratio to percent");
  expect(*tally::normalize_value(tally::Item::cpu, 150, "percent", &why) == 100.0, "clamped to 100");
  expect(!tally::normalize_value(tally::Item::cpu, 1, "B", &why).has_value(), "bytes invalid for cpu");
  expect(!tally::normalize_value(tally::Item::memory, 1, "furlongs", &why).has_value(), "unknown unit");
}

void test_sample_store_retention() {
  g_now = 10'000;
  tally::SampleStore store(3600, fake_clock);
  const size_t added = store.append({{"r1", 9000, tally::Item::cpu, 10.0},
                                     {"r1", 9000, tally::Item::cpu, 55.0},
                                     {"r1", 5000, tally::Item::cpu, 20.0},
                                     {"r1", 9500, tally::Item::memory, 512.0}});
  expect(added == 2, "duplicate and expired samples not stored");
  auto q = store.query("r1", tally::Item::cpu, 0, 20'000);
  expect(q.size() == 1 && q[0].value == 10.0, "first sample wins");

  g_now = 12'800;
  expect(store.purge_expired() == 1, "cpu sample expired");
  expect(store.size() == 1, "memory sample kept");
}

void test_sample_archive_roundtrip() {
  auto dir = scratch_dir("archive");
  const std::string path = (dir / "samples.arc").string();
  g_now = 10'000;
  tally::SampleStore store(1'000'000, fake_clock);
  store.append({{"r1", 9000, tally::Item::cpu, 12.5}, {"r1", 9060, tally::Item::cpu, 20.0},
                {"r2", 9000, tally::Item::storage, 4096.0}});
  auto exported = store.export_archive(path);
  expect(exported.ok && exported.samples == 3, "export: " + exported.detail);

  tally::SampleStore restored(1'000'000, fake_clock);
  auto imported = restored.import_archive(path);
  expect(imported.ok, "import: " + imported.detail);
  expect(imported.samples == 3, "all samples restored");
  expect(imported.digest == exported.digest, "digest preserved");
  auto q = restored.query("r1", tally::Item::cpu, 0, 20'000);
  expect(q.size() == 2 && q[1].value == 20.0, "series restored");

  // Corrupt the recorded digest.
  std::ifstream in(path, std::ios::binary);
  std::string header;
  std::getline(in, header);
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  in.close();
  const auto pos = header.find(exported.digest);
  expect(pos != std::string::npos, "header carries digest");
  header.replace(pos, exported.digest.size(), std::string(64, '0'));
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << header << '\n' << body;
  }
  tally::SampleStore tampered(1'000'000, fake_clock);
  auto bad = tampered.import_archive(path);
  expect(!bad.ok && tampered.size() == 0, "tampered archive rejected");
  fs::remove_all(dir);
}

void test_ingestor_partial_backend_failure() {
  g_now = 1'700'000'000;
  const int64_t to = g_now.load();
  const int64_t from = to - 3600;

  tally::Engine engine(tally::EngineConfig{}, fake_clock);
  seed_topology(engine);
  std::vector<tally::RawSample> raw;
  for (int r = 1; r <= 5; ++r) {
    const std::string id = "vm" + std::to_string(r);
    const std::string proj = r % 2 ? "p1" : "p2";
    expect(engine.apply_event(make_event(id, proj, 1, ResourceState::active, {}, Figures{1, 256, 0})).ok,
           "resource " + id);
    for (int b = 0; b < 6; ++b) raw.push_back(tally::RawSample{id, from + b * 600 + 10, tally::Item::cpu, 10, "percent"});
  }
  engine.attach_backend(std::make_unique<tally::NdjsonMonitoringBackend>(raw));

  auto& stats = tally::global_engine_stats();
  const auto failures_before = stats.backend_failures.load();
  auto& chaos = tally::chaos::global_chaos();
  chaos.activate(tally::chaos::ChaosController::ACTIVATION_KEY);
  tally::chaos::FaultSpec spec;
  spec.type = tally::chaos::FaultType::monitoring_timeout;
  spec.target = "vm3";
  chaos.register_fault(spec);

  tally::set_log_hook(capture_log);
  tally::UsageQuery q;
  q.aggregate = ScopeType::customer;
  q.scope_uuid = "c1";
  q.item = tally::Item::cpu;
  q.from = from;
  q.to = to;
  q.n_buckets = 6;
  tally::QueryContext ctx;
  auto r = engine.stats().usage_statistics(q, ctx);
  chaos.deactivate();
  tally::set_log_hook(nullptr);

  expect(r.ok, "silent-fail keeps the call successful: " + r.detail);
  expect(r.scopes.size() == 1, "one customer");
  expect(r.scopes[0].buckets.size() == 6, "6 buckets");
  for (const auto& b : r.scopes[0].buckets) expect(b.value == 40.0, "four resources contribute 10 each");
  expect(r.warnings.size() == 1, "one warning for the timed-out resource");
  expect(stats.backend_failures.load() == failures_before + 1, "backend failure counted");
  std::lock_guard<std::mutex> lk(g_log_mu);
  bool logged = false;
  for (const auto& rec : g_logs) logged = logged || rec.type == "samples.backend_failure";
  expect(logged, "backend failure logged as warning");
}

void test_ingestor_strict_mode() {
  tally::SampleStore store;
  tally::NdjsonMonitoringBackend backend(std::vector<tally::RawSample>{});
  tally::SampleIngestor strict(backend, store, false);
  auto& chaos = tally::chaos::global_chaos();
  chaos.activate(tally::chaos::ChaosController::ACTIVATION_KEY);
  tally::chaos::FaultSpec spec;
  spec.type = tally::chaos::FaultType::monitoring_timeout;
  chaos.register_fault(spec);
  auto report = strict.ingest({"a", "b"}, tally::Item::memory, 0, 100);
  chaos.deactivate();
  expect(!report.ok && report.error == tally::ErrorCode::backend_unavailable, "strict mode fails");
  expect(report.failed_resources.size() == 2, "both resources failed");
}

void test_slow_backend_respects_deadline() {
  g_now = 1'700'000'000;
  const int64_t to = g_now.load();
  const int64_t from = to - 3600;

  tally::Engine engine(tally::EngineConfig{}, fake_clock);
  seed_topology(engine);
  std::vector<tally::RawSample> raw;
  for (int r = 0; r < 10; ++r) {
    const std::string id = "slow" + std::to_string(r);
    expect(engine.apply_event(make_event(id, "p1", 1, ResourceState::active, {}, Figures{1, 256, 0})).ok,
           "resource " + id);
    raw.push_back(tally::RawSample{id, from + 60, tally::Item::cpu, 10, "percent"});
  }
  engine.attach_backend(std::make_unique<tally::NdjsonMonitoringBackend>(raw));

  // Every fetch stalls for 40 ms; all ten would take 400 ms.
  auto& chaos = tally::chaos::global_chaos();
  chaos.activate(tally::chaos::ChaosController::ACTIVATION_KEY);
  tally::chaos::FaultSpec spec;
  spec.type = tally::chaos::FaultType::monitoring_timeout;
  spec.duration_ms = 40;
  chaos.register_fault(spec);

  tally::UsageQuery q;
  q.aggregate = ScopeType::project;
  q.scope_uuid = "p1";
  q.item = tally::Item::cpu;
  q.from = from;
  q.to = to;
  q.n_buckets = 6;
  tally::QueryContext ctx(std::chrono::milliseconds(50));
  const auto started = std::chrono::steady_clock::now();
  auto r = engine.stats().usage_statistics(q, ctx);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  chaos.deactivate();

  expect(!r.ok && r.error == tally::ErrorCode::deadline_exceeded, "deadline reported: " + r.detail);
  expect(r.partial, "partial result");
  expect(elapsed < std::chrono::milliseconds(300), "fetch stopped near the deadline");
}

// ============================================================================
// Alerts
// ============================================================================

void test_quota_threshold_alerts() {
  tally::Engine engine;
  seed_topology(engine);
  expect(engine.set_limit(vcpu(project("p1")), 10).ok, "limit");
  engine.apply_event(make_event("r1", "p1", 1, ResourceState::active, {}, Figures{9, 512, 0}));

  auto open = engine.alerts().open_alert(project("p1"), tally::kQuotaThresholdAlert);
  expect(open.has_value(), "alert opened above 80%");
  expect(open->severity == tally::Severity::warning, "warning severity");
  expect(open->message == "Quota vcpu is over threshold. Limit: 10, usage: 9", "message: " + open->message);
  expect(!engine.alerts().open_alert(customer("c1"), tally::kQuotaThresholdAlert), "unlimited customer no alert");

  engine.apply_event(make_event("r1", "p1", 2, ResourceState::resizing, Figures{9, 512, 0}, Figures{2, 512, 0}));
  expect(!engine.alerts().open_alert(project("p1"), tally::kQuotaThresholdAlert), "alert closed after resize");

  auto all = engine.alerts().snapshot();
  expect(all.size() == 1 && all[0].closed_at.has_value(), "closed alert kept");
}

void test_alert_acknowledgement() {
  tally::AlertLog log;
  auto a = log.raise(project("p1"), "disk_full", "disk is full", tally::Severity::error);
  auto b = log.raise(project("p1"), "disk_full", "disk is still full", tally::Severity::error);
  expect(a.id == b.id, "one open alert per (scope, type)");
  expect(log.acknowledge(a.id).ok, "acknowledge");
  expect(log.snapshot()[0].acknowledged, "acknowledged flag");
  expect(log.cancel_acknowledgment(a.id).ok, "cancel acknowledgment");
  expect(!log.acknowledge(999).ok, "unknown alert");
  expect(log.close(project("p1"), "disk_full"), "close");
  expect(!log.close(project("p1"), "disk_full"), "already closed");
}

// ============================================================================
// Aggregation queries
// ============================================================================

void test_creation_time_statistics() {
  tally::Engine engine;
  for (auto [uuid, created] : std::vector<std::pair<std::string, int64_t>>{
           {"a", 100}, {"b", 150}, {"c", 450}, {"d", 700}}) {
    expect(engine.add_customer(tally::Customer{uuid, uuid, created}).ok, "customer " + uuid);
  }
  tally::CreationTimeQuery q;
  q.type = ScopeType::customer;
  q.from = 0;
  q.to = 600;
  q.n_buckets = 6;
  auto r = engine.stats().creation_time_statistics(q);
  expect(r.ok && r.buckets.size() == 6, "6 buckets");
  const std::vector<double> expected{0, 2, 0, 0, 1, 0};
  for (size_t i = 0; i < 6; ++i) expect(r.buckets[i].value == expected[i], "count in bucket " + std::to_string(i));
  for (size_t i = 1; i < 6; ++i) expect(r.buckets[i].from > r.buckets[i - 1].from, "ascending buckets");

  q.n_buckets = 0;
  expect(engine.stats().creation_time_statistics(q).error == tally::ErrorCode::validation_error, "zero buckets");
}

void test_quota_statistics_limits() {
  tally::Engine engine;
  engine.add_customer(tally::Customer{"c1", "A", 0});
  engine.add_customer(tally::Customer{"c2", "B", 0});
  engine.set_limit(vcpu(customer("c1")), 10);
  tally::QueryContext ctx;
  auto all = engine.stats().quota_statistics(tally::QuotaQuery{ScopeType::customer, std::nullopt}, ctx);
  expect(all.ok && all.scopes == 2, "both customers");
  expect(all.values.at("vcpu") == 10, "unlimited excluded from limit sum");
  expect(all.values.at("ram") == -1, "all unlimited gives -1");
  expect(all.values.at("vcpu_usage") == 0, "usage key present");

  auto missing = engine.stats().quota_statistics(tally::QuotaQuery{ScopeType::customer, std::string("zz")}, ctx);
  expect(!missing.ok && missing.error == tally::ErrorCode::validation_error, "unknown scope");
}

void test_quota_timeline_averaging() {
  g_now = 1000;
  tally::Engine engine(tally::EngineConfig{}, fake_clock);
  engine.add_customer(tally::Customer{"c1", "A", 0});
  tally::Project p;
  p.uuid = "p1";
  p.customer_uuid = "c1";
  engine.add_project(p);
  g_now = 1800;
  engine.apply_event(make_event("r1", "p1", 1, ResourceState::active, {}, Figures{4, 0, 0}));

  tally::TimelineQuery q;
  q.from = 0;
  q.to = 7200;
  q.interval = tally::TimelineInterval::hour;
  q.item = std::string("vcpu");
  q.aggregate = ScopeType::project;
  q.scope_uuid = std::string("p1");
  tally::QueryContext ctx;
  auto r = engine.stats().quota_timeline(q, ctx);
  expect(r.ok && r.points.size() == 2, "two hourly points");
  expect(r.points[0].values.at("vcpu_usage") == 2.0, "average of 0 and 4 within the first hour");
  expect(r.points[1].values.at("vcpu_usage") == 4.0, "value carried into the second hour");
  expect(r.points[0].values.at("vcpu") == -1, "unlimited");
  expect(r.points[0].to == r.points[1].from, "contiguous points");
}

void test_query_deadline_partial() {
  tally::Engine engine;
  seed_topology(engine);
  auto& stats = tally::global_engine_stats();
  const auto partial_before = stats.partial_results.load();

  tally::QueryContext cancelled;
  cancelled.cancel();
  auto r = engine.stats().quota_statistics(tally::QuotaQuery{ScopeType::project, std::nullopt}, cancelled);
  expect(!r.ok && r.error == tally::ErrorCode::deadline_exceeded, "cancelled query");
  expect(r.partial && r.scopes == 0, "partial result returned");

  tally::QueryContext expired(std::chrono::milliseconds(0));
  auto s = engine.stats().customer_summary(expired);
  expect(s.error == tally::ErrorCode::deadline_exceeded && s.partial, "deadline passed");
  expect(stats.partial_results.load() == partial_before + 2, "partial results counted");
}

void test_customer_and_resource_statistics() {
  tally::Engine engine;
  seed_topology(engine);
  engine.apply_event(make_event("r1", "p1", 1, ResourceState::active, {}, Figures{2, 512, 10}));
  engine.apply_event(make_event("r2", "p2", 1, ResourceState::active, {}, Figures{1, 256, 5}));
  engine.apply_event(make_event("r2", "p2", 2, ResourceState::deleting, Figures{1, 256, 5}, {}));

  tally::QueryContext ctx;
  auto summary = engine.stats().customer_summary(ctx);
  expect(summary.ok && summary.customers.size() == 1, "one customer");
  const auto& row = summary.customers[0];
  expect(row.projects == 2 && row.project_groups == 1, "counts");
  expect(row.resources == 1, "deleting resource not live");
  expect(row.usages.at("vcpu") == 2 && row.limits.at("vcpu") == -1, "quota figures");

  auto res = engine.stats().resource_statistics("openstack-1");
  expect(res.ok && res.resources == 2, "non-terminal resources of the backend");
  expect(res.by_state.at("active") == 1 && res.by_state.at("deleting") == 1, "by state");
  expect(res.vcpu == 2 && res.storage_mb == 10, "consumption of consuming resources");
}

void test_alert_statistics_filters() {
  g_now = 5000;
  tally::Engine engine(tally::EngineConfig{}, fake_clock);
  seed_topology(engine);
  auto& log = engine.alerts();
  log.raise(project("p1"), "cpu_high", "cpu", tally::Severity::warning);
  auto ack = log.raise(project("p2"), "cpu_high", "cpu", tally::Severity::error);
  log.acknowledge(ack.id);
  g_now = 6000;
  log.raise(customer("c1"), "billing", "card", tally::Severity::info);
  log.close(customer("c1"), "billing");

  const auto& stats = engine.stats();
  tally::AlertQuery all;
  auto r = stats.alert_statistics(all);
  expect(r.total == 3 && r.by_severity.at("debug") == 0, "all alerts, zero-filled severities");

  tally::AlertQuery scoped;
  scoped.scope = group("g1");
  expect(stats.alert_statistics(scoped).total == 1, "group subtree holds p1 only");

  tally::AlertQuery open_only;
  open_only.opened = true;
  expect(stats.alert_statistics(open_only).total == 2, "open alerts");

  tally::AlertQuery acked;
  acked.acknowledged = true;
  auto a = stats.alert_statistics(acked);
  expect(a.total == 1 && a.by_severity.at("error") == 1, "acknowledged filter");

  tally::AlertQuery window;
  window.from = 5500;
  window.types = {"billing"};
  expect(stats.alert_statistics(window).total == 1, "time and type filters");
}

// ============================================================================
// Engine topology
// ============================================================================

void test_group_membership_transfers_usage() {
  tally::Engine engine;
  seed_topology(engine);
  expect(engine.add_project_group(tally::ProjectGroup{"g2", "Ops", "c1", 0}).ok, "second group");
  engine.apply_event(make_event("r2", "p2", 1, ResourceState::active, {}, Figures{3, 1024, 0}));
  expect(usage_of(engine.ledger(), vcpu(group("g2"))) == 0, "not a member yet");

  expect(engine.add_project_to_group("p2", "g2").ok, "join group");
  expect(usage_of(engine.ledger(), vcpu(group("g2"))) == 3, "usage moved into group");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 3, "customer unchanged");

  // Later events follow the new ancestor list.
  engine.apply_event(make_event("r2", "p2", 2, ResourceState::deleted, Figures{3, 1024, 0}, {}));
  expect(usage_of(engine.ledger(), vcpu(group("g2"))) == 0, "release reaches the group");

  engine.apply_event(make_event("r3", "p2", 1, ResourceState::active, {}, Figures{5, 0, 0}));
  expect(engine.remove_project_from_group("p2", "g2").ok, "leave group");
  expect(usage_of(engine.ledger(), vcpu(group("g2"))) == 0, "usage moved out");
  expect(engine.reconcile().corrections.empty(), "transfers leave no drift");
}

void test_remove_project_releases_usage() {
  tally::Engine engine;
  seed_topology(engine);
  engine.apply_event(make_event("r1", "p1", 1, ResourceState::active, {}, Figures{2, 512, 0}));
  engine.apply_event(make_event("r2", "p2", 1, ResourceState::active, {}, Figures{1, 256, 0}));

  expect(engine.remove_project("p1").ok, "remove project");
  expect(!engine.ledger().has_scope(project("p1")), "quota records dropped");
  expect(usage_of(engine.ledger(), vcpu(group("g1"))) == 0, "group released");
  expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 1, "customer keeps p2");
  expect(engine.resources().by_project("p1").empty(), "resources dropped");
  expect(engine.reconcile().corrections.empty(), "no drift after removal");
  expect(!engine.remove_customer("c1").ok, "customer still has p2");
}

void test_group_join_concurrent_with_creates() {
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 16;
  for (int iter = 0; iter < 200; ++iter) {
    tally::Engine engine;
    seed_ungrouped(engine);
    std::atomic<bool> go{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < kWriters; ++t) {
      writers.emplace_back([&engine, &go, t] {
        while (!go.load()) std::this_thread::yield();
        for (int i = 0; i < kPerWriter; ++i) {
          const std::string id = "vm" + std::to_string(t) + "-" + std::to_string(i);
          engine.apply_event(make_event(id, "p1", 1, ResourceState::active, {}, Figures{1, 0, 0}));
        }
      });
    }
    go.store(true);
    expect(engine.add_project_to_group("p1", "g1").ok, "join group");
    for (auto& w : writers) w.join();

    const int64_t total = kWriters * kPerWriter;
    expect(usage_of(engine.ledger(), vcpu(group("g1"))) == total, "group counts every resource once");
    expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == total, "customer total");
    const auto records = engine.resources().by_project("p1");
    expect(records.size() == static_cast<size_t>(total), "all resources registered");
    for (const auto& r : records) expect(has_ancestor(r, group("g1")), "cached ancestors include the group");
    expect(engine.reconcile().corrections.empty(), "join leaves no drift");

    // Leave while half the resources are being deleted.
    go.store(false);
    writers.clear();
    for (int t = 0; t < kWriters; ++t) {
      writers.emplace_back([&engine, &go, t] {
        while (!go.load()) std::this_thread::yield();
        for (int i = 0; i < kPerWriter; i += 2) {
          const std::string id = "vm" + std::to_string(t) + "-" + std::to_string(i);
          engine.apply_event(make_event(id, "p1", 2, ResourceState::deleted, Figures{1, 0, 0}, {}));
        }
      });
    }
    go.store(true);
    expect(engine.remove_project_from_group("p1", "g1").ok, "leave group");
    for (auto& w : writers) w.join();

    expect(usage_of(engine.ledger(), vcpu(group("g1"))) == 0, "group released");
    expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == total / 2, "customer keeps live half");
    for (const auto& r : engine.resources().by_project("p1")) {
      expect(!has_ancestor(r, group("g1")), "cached ancestors drop the group");
    }
    expect(engine.reconcile().corrections.empty(), "leave leaves no drift");
  }
}

void test_remove_project_concurrent_with_creates() {
  for (int iter = 0; iter < 100; ++iter) {
    tally::Engine engine;
    seed_topology(engine);
    engine.apply_event(make_event("keep", "p2", 1, ResourceState::active, {}, Figures{1, 128, 0}));
    std::atomic<bool> go{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
      writers.emplace_back([&engine, &go, t] {
        while (!go.load()) std::this_thread::yield();
        for (int i = 0; i < 16; ++i) {
          const std::string id = "vm" + std::to_string(t) + "-" + std::to_string(i);
          engine.apply_event(make_event(id, "p1", 1, ResourceState::active, {}, Figures{1, 256, 0}));
        }
      });
    }
    go.store(true);
    expect(engine.remove_project("p1").ok, "remove project");
    for (auto& w : writers) w.join();

    expect(engine.resources().by_project("p1").empty(), "no resource outlives its project");
    expect(usage_of(engine.ledger(), vcpu(group("g1"))) == 0, "group released");
    expect(usage_of(engine.ledger(), vcpu(customer("c1"))) == 1, "customer keeps p2 only");
    expect(engine.reconcile().corrections.empty(), "removal leaves no drift");
  }
}

void test_load_topology() {
  const std::string doc =
      "{\"customers\":[{\"uuid\":\"c1\",\"name\":\"Acme\",\"created\":100}],"
      "\"project_groups\":[{\"uuid\":\"g1\",\"name\":\"Web\",\"customer\":\"c1\"}],"
      "\"projects\":[{\"uuid\":\"p1\",\"name\":\"fe\",\"customer\":\"c1\",\"groups\":[\"g1\"]}],"
      "\"limits\":[{\"scope\":\"customer\",\"uuid\":\"c1\",\"type\":\"vcpu\",\"limit\":16},"
      "{\"scope\":\"project\",\"uuid\":\"p1\",\"type\":\"ram\",\"limit\":null}]}";
  tally::Engine engine;
  auto r = engine.load_topology(tally::jsonlite::parse(doc, nullptr));
  expect(r.ok, "topology loads: " + r.detail);
  expect(r.customers == 1 && r.project_groups == 1 && r.projects == 1 && r.limits == 2, "counts");
  expect(engine.ledger().has_scope(group("g1")), "group registered");
  auto v = engine.ledger().get(vcpu(customer("c1")));
  expect(v && v->limit && *v->limit == 16, "limit applied");

  tally::Engine other;
  auto bad = other.load_topology(tally::jsonlite::parse(
      "{\"projects\":[{\"uuid\":\"p1\",\"customer\":\"missing\"}]}", nullptr));
  expect(!bad.ok && bad.error == tally::ErrorCode::validation_error, "dangling project rejected");
}

// ============================================================================
// CLI
// ============================================================================

void test_command_line_flags_anywhere() {
  const char* argv[] = {"tally", "--config", "x.json", "config", "check", "--json"};
  auto cl = tally::parse_command_line(6, argv);
  expect(cl.word(0) == "config" && cl.word(1) == "check", "command words skip flag values");
  expect(cl.word(2).empty(), "no third word");
  expect(cl.flag("config") == std::optional<std::string>("x.json"), "leading flag value");
  expect(cl.flag("json") == std::optional<std::string>("true"), "bare trailing flag");

  const char* mixed[] = {"tally", "audit", "--strict", "--path", "a.ndjson", "verify"};
  auto m = tally::parse_command_line(6, mixed);
  expect(m.word(0) == "audit" && m.word(1) == "verify", "flags between words");
  expect(m.flag("strict") == std::optional<std::string>("true"), "flag followed by a flag is bare");
  expect(m.flag("path") == std::optional<std::string>("a.ndjson"), "flag value");
  expect(!m.flag("missing"), "absent flag");
}

// ============================================================================
// Audit & versioning
// ============================================================================

void test_audit_chain() {
  auto dir = scratch_dir("audit");
  const std::string path = (dir / "audit.ndjson").string();
  {
    tally::ImmutableAuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      tally::AuditRecord rec;
      rec.action = "reconcile.correction";
      rec.quota_key = "customer:c1/vcpu";
      rec.before = i;
      rec.after = i + 1;
      expect(log.append(rec), "append");
      expect(rec.sequence == static_cast<uint64_t>(i + 1), "sequence assigned");
    }
    expect(log.entry_count() == 3 && log.failure_count() == 0, "counts");
  }
  auto ok = tally::verify_audit_chain(path);
  expect(ok.ok && ok.entries == 3, "chain verifies: " + ok.error);

  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string l; std::getline(in, l);) lines.push_back(l);
  in.close();
  const auto pos = lines[1].find("\"after\":2");
  expect(pos != std::string::npos, "second record readable");
  lines[1].replace(pos, 9, "\"after\":5");
  {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
  }
  auto bad = tally::verify_audit_chain(path);
  expect(!bad.ok && bad.first_bad_sequence == 3, "record after the tampered one breaks the chain");
  fs::remove_all(dir);
}

void test_audit_chain_restart_and_splice() {
  auto dir = scratch_dir("audit_restart");
  const std::string path = (dir / "audit.ndjson").string();
  auto write_two = [&path] {
    tally::ImmutableAuditLog log(path);
    for (int i = 0; i < 2; ++i) {
      tally::AuditRecord rec;
      rec.action = "scope.usage_reset";
      rec.quota_key = "project:p1/vcpu";
      rec.before = 4;
      expect(log.append(rec), "append");
      expect(rec.genesis == (i == 0), "only the first record of a log starts a chain");
    }
  };
  write_two();
  write_two();
  auto restarted = tally::verify_audit_chain(path);
  expect(restarted.ok && restarted.entries == 4, "restart at a genesis record verifies: " + restarted.error);

  // A first record lifted from some other chain, with its marker dropped.
  std::ifstream in(path);
  std::string first;
  std::getline(in, first);
  in.close();
  const std::string marker = "\"genesis\":true,";
  const auto pos = first.find(marker);
  expect(pos != std::string::npos, "genesis marker serialized");
  first.erase(pos, marker.size());
  {
    std::ofstream out(path, std::ios::app);
    out << first << "\n";
  }
  auto spliced = tally::verify_audit_chain(path);
  expect(!spliced.ok && spliced.first_bad_sequence == 1 && spliced.entries == 4,
         "unmarked sequence restart rejected");
  fs::remove_all(dir);
}

void test_audit_write_failure_keeps_chain() {
  tally::ImmutableAuditLog missing("/nonexistent-dir/tally/audit.ndjson");
  tally::AuditRecord rec;
  rec.action = "reconcile.correction";
  expect(!missing.append(rec), "append to unopenable path fails");
  expect(missing.failure_count() == 1 && missing.entry_count() == 0, "failure counted");
  expect(missing.last_digest() == std::string(64, '0'), "chain not advanced");

  if (!fs::exists("/dev/full")) return;
  tally::ImmutableAuditLog full("/dev/full");
  tally::AuditRecord a;
  a.action = "reconcile.correction";
  expect(!full.append(a), "append to full device fails");
  expect(full.last_digest() == std::string(64, '0'), "unwritten record not chained");
  tally::AuditRecord b;
  b.action = "reconcile.correction";
  expect(!full.append(b), "second append fails too");
  expect(b.sequence == 1 && b.genesis, "sequence not consumed by failed write");
  expect(full.failure_count() == 2 && full.entry_count() == 0, "failures counted");
}

void test_version_manifest() {
  auto m = tally::version::current_manifest();
  expect(m.engine_semver == tally::version::ENGINE_SEMVER, "semver");
  expect(m.archive_format == tally::version::ARCHIVE_FORMAT_VERSION, "archive version");
  const auto json = tally::version::manifest_to_json(m);
  expect(json.find("\"engine_semver\"") != std::string::npos, "manifest JSON");
}

void test_stats_json() {
  auto& stats = tally::global_engine_stats();
  const auto json = stats.to_json();
  std::optional<tally::jsonlite::JsonError> err;
  auto obj = tally::jsonlite::parse(json, &err);
  expect(!err, "stats JSON parses");
  expect(tally::jsonlite::has_key(obj, "events_applied"), "events_applied exported");
}

}  // namespace

int main() {
  std::cout << "=== Tally Test Suite ===\n";

  std::cout << "\n[Vocabulary] Hashing, JSON, errors\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("event digest stable", test_event_digest_stable);
  run_test("quota contribution", test_quota_contribution);
  run_test("jsonlite parse", test_jsonlite_parse);
  run_test("error taxonomy", test_error_taxonomy);

  std::cout << "\n[Config]\n";
  run_test("defaults", test_config_defaults);
  run_test("from JSON", test_config_from_json);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Hierarchy]\n";
  run_test("ancestor chain", test_hierarchy_ancestors);

  std::cout << "\n[Ledger]\n";
  run_test("missing scope", test_ledger_missing_scope);
  run_test("quota check", test_ledger_check);
  run_test("clamp at zero", test_ledger_clamps_at_zero);
  run_test("batch rollback on fault", test_ledger_batch_rollback_on_fault);
  run_test("aborted batch publishes its ticket", test_ledger_aborted_batch_publishes_ticket);
  run_test("overwrite compare-and-set", test_ledger_overwrite_cas);
  run_test("concurrent totals (8 threads)", test_ledger_concurrent_totals);
  run_test("no half-applied batch", test_ledger_no_half_applied_batch);
  run_test("quota history", test_ledger_history);

  std::cout << "\n[Events]\n";
  run_test("two-project customer scenario", test_two_project_customer_scenario);
  run_test("replay idempotence", test_replay_idempotence);
  run_test("out-of-order park and drain", test_out_of_order_park_and_drain);
  run_test("event validation", test_event_validation);
  run_test("event JSON fields", test_event_json_roundtrip_fields);

  std::cout << "\n[Reconciliation]\n";
  run_test("drift correction", test_reconciliation_corrects_drift);
  run_test("concurrent with events (4 writers)", test_reconciliation_concurrent_with_events);
  run_test("background worker", test_reconciliation_background);
  run_test("background worker purges expired samples", test_background_purges_expired_samples);

  std::cout << "\n[Samples]\n";
  run_test("bucketize empty range", test_bucketize_empty);
  run_test("bucketize mean and edges", test_bucketize_mean_and_edges);
  run_test("unit normalization", test_unit_normalization);
  run_test("store retention", test_sample_store_retention);
  run_test("archive round trip", test_sample_archive_roundtrip);
  run_test("one of five backends times out", test_ingestor_partial_backend_failure);
  run_test("strict ingestion", test_ingestor_strict_mode);
  run_test("slow backend stops at the deadline", test_slow_backend_respects_deadline);

  std::cout << "\n[Alerts]\n";
  run_test("quota threshold open/close", test_quota_threshold_alerts);
  run_test("acknowledgement", test_alert_acknowledgement);

  std::cout << "\n[Queries]\n";
  run_test("creation-time statistics", test_creation_time_statistics);
  run_test("quota statistics limits", test_quota_statistics_limits);
  run_test("quota timeline averaging", test_quota_timeline_averaging);
  run_test("deadline partial result", test_query_deadline_partial);
  run_test("customer and resource statistics", test_customer_and_resource_statistics);
  run_test("alert statistics filters", test_alert_statistics_filters);

  std::cout << "\n[Engine]\n";
  run_test("group membership transfers usage", test_group_membership_transfers_usage);
  run_test("remove project releases usage", test_remove_project_releases_usage);
  run_test("group join/leave during creates (4 writers)", test_group_join_concurrent_with_creates);
  run_test("remove project during creates (4 writers)", test_remove_project_concurrent_with_creates);
  run_test("load topology", test_load_topology);

  std::cout << "\n[CLI]\n";
  run_test("flags anywhere on the command line", test_command_line_flags_anywhere);

  std::cout << "\n[Audit & Versioning]\n";
  run_test("audit chain", test_audit_chain);
  run_test("audit chain restart and splice", test_audit_chain_restart_and_splice);
  run_test("audit write failure keeps chain", test_audit_write_failure_keeps_chain);
  run_test("version manifest", test_version_manifest);
  run_test("stats JSON", test_stats_json);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
