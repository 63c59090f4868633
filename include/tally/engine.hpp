#pragma once

// tally/engine.hpp - Facade wiring hierarchy, ledger, event processor,
// reconciliation, samples, alerts and statistics into one engine.
//
// TOPOLOGY:
//   Creating a scope registers its quota records in the ledger. Adding a
//   project to a group moves the project's live usage into the group's
//   counters in one batch, removing it moves it out. Removing a project
//   releases its usage from every ancestor, audits the reset and drops its
//   quota records and resources.
//
//   Membership and removal changes run with every event lock held
//   (LifecycleEventProcessor::quiesce), so the hierarchy change, the usage
//   transfer and the rewrite of cached ancestor lists are atomic with respect
//   to lifecycle events. The transfer is computed from each record's cached
//   ancestors, never from the hierarchy alone.
//
//   Topology mutations are serialized by one mutex; lifecycle events,
//   reconciliation and queries do not take it.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "tally/alerts.hpp"
#include "tally/config.hpp"
#include "tally/events.hpp"
#include "tally/hierarchy.hpp"
#include "tally/jsonlite.hpp"
#include "tally/ledger.hpp"
#include "tally/reconcile.hpp"
#include "tally/resources.hpp"
#include "tally/samples.hpp"
#include "tally/stats.hpp"

namespace tally {

struct TopologyResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  size_t customers{0};
  size_t project_groups{0};
  size_t projects{0};
  size_t limits{0};
};

class Engine {
 public:
  using Clock = std::function<int64_t()>;   // epoch seconds

  explicit Engine(EngineConfig config = {}, Clock clock = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Topology
  HierarchyResult add_customer(const Customer& c);
  HierarchyResult add_project_group(const ProjectGroup& g);
  HierarchyResult add_project(const Project& p);
  HierarchyResult add_project_to_group(const std::string& project_uuid, const std::string& group_uuid);
  HierarchyResult remove_project_from_group(const std::string& project_uuid,
                                            const std::string& group_uuid);
  HierarchyResult remove_project(const std::string& uuid);
  HierarchyResult remove_project_group(const std::string& uuid);
  HierarchyResult remove_customer(const std::string& uuid);

  // {"customers":[...], "project_groups":[...], "projects":[...], "limits":[...]}
  TopologyResult load_topology(const jsonlite::Object& doc);

  // Limits; quota-threshold alerts of the scope are re-evaluated.
  LedgerResult set_limit(const QuotaKey& key, std::optional<int64_t> limit);

  EventOutcome apply_event(const LifecycleEvent& ev);

  ReconciliationReport reconcile();
  void start_background();
  void stop_background();

  // Takes ownership of the monitoring backend. Usage statistics ingest from
  // it before reading the sample store. Not safe against concurrent queries.
  void attach_backend(std::unique_ptr<MonitoringBackend> backend);
  // Drops samples past the retention window. The background worker calls it
  // after every reconciliation pass.
  size_t purge_expired_samples();

  std::chrono::milliseconds query_timeout() const {
    return std::chrono::milliseconds(config_.query_timeout_ms);
  }

  const EngineConfig& config() const { return config_; }
  const Hierarchy& hierarchy() const { return hierarchy_; }
  QuotaLedger& ledger() { return ledger_; }
  const QuotaLedger& ledger() const { return ledger_; }
  const ResourceRegistry& resources() const { return resources_; }
  AlertLog& alerts() { return alerts_; }
  const AlertLog& alerts() const { return alerts_; }
  SampleStore& samples() { return samples_; }
  LifecycleEventProcessor& processor() { return processor_; }
  const StatsEngine& stats() const { return *stats_; }

  // Version manifest, hash runtime, counters and chaos status as one object.
  std::string health_json() const;

 private:
  HierarchyResult transfer_project_usage(const std::string& project_uuid, const ScopeRef& group,
                                         bool joining);
  void reset_scope(const ScopeRef& scope, const std::string& reason);
  void rebuild_stats();
  int64_t now() const;

  EngineConfig config_;
  Clock clock_;

  Hierarchy hierarchy_;
  QuotaLedger ledger_;
  ResourceRegistry resources_;
  AlertLog alerts_;
  LifecycleEventProcessor processor_;
  ReconciliationJob reconciler_;
  SampleStore samples_;
  std::unique_ptr<MonitoringBackend> backend_;
  std::unique_ptr<SampleIngestor> ingestor_;
  std::unique_ptr<StatsEngine> stats_;

  std::mutex topology_mu_;
};

}  // namespace tally
