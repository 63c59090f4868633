#pragma once

// tally/events.hpp - Lifecycle Event Processor.
//
// CONTRACT:
//   Every lifecycle event is applied to the ledger exactly once. Per resource
//   the first sequence number is 1 and each next event must be last + 1.
//
//   seq == last + 1   applied as one ledger batch over the cached ancestor
//                     list; parked successors are then drained in order.
//   seq >  last + 1   out_of_order_event, parked in a bounded queue (or
//                     rejected unparked when the queue is full).
//   seq <= last       out_of_order_event flagged duplicate when the digest
//                     matches the event applied at that sequence, otherwise
//                     validation_error. seq == 0 is a validation_error.
//
// DELTAS:
//   delta = contribution(after state) - contribution(before state), where a
//   resource contributes only while provisioning, active or resizing. A
//   deleting/deleted/erred transition therefore releases the old figures once
//   and every later terminal event has a zero delta.
//
// THREAD SAFETY:
//   Events of one resource are serialized by a striped mutex keyed by the
//   resource id. Different resources proceed in parallel and only meet in the
//   ledger.

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tally/alerts.hpp"
#include "tally/hierarchy.hpp"
#include "tally/jsonlite.hpp"
#include "tally/ledger.hpp"
#include "tally/resources.hpp"
#include "tally/types.hpp"

namespace tally {

struct LifecycleEvent {
  std::string resource_id;
  std::string project_uuid;
  std::string kind{kInstanceKind};
  std::string backend_ref;
  Figures before;
  Figures after;
  ResourceState transition{ResourceState::provisioning};
  uint64_t sequence{0};
  int64_t timestamp{0};
};

// Sorted-key JSON; the input of the "evt:" digest.
std::string canonicalize_event(const LifecycleEvent& ev);
std::string lifecycle_event_digest(const LifecycleEvent& ev);

jsonlite::Object event_to_object(const LifecycleEvent& ev);
std::optional<LifecycleEvent> event_from_object(const jsonlite::Object& obj, std::string* error);

struct EventOutcome {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
  bool retryable{false};
  bool duplicate{false};
  bool queued{false};
  uint64_t ticket{0};
  QuotaAmounts applied;         // net delta per quota resource type
  size_t drained{0};            // parked successors applied after this event

  std::string to_json() const;
};

struct EventProcessorOptions {
  size_t pending_capacity{1024};
  double alert_threshold{0.8};
};

class LifecycleEventProcessor {
 public:
  LifecycleEventProcessor(QuotaLedger& ledger, ResourceRegistry& resources,
                          const Hierarchy& hierarchy, AlertLog* alerts,
                          EventProcessorOptions options = {});

  EventOutcome apply(const LifecycleEvent& ev);

  size_t pending_count() const;

  // Serializes with apply() for one resource.
  std::mutex& resource_lock(const std::string& resource_id);

  // Every resource lock, taken in stripe order. While held, no event sits
  // between reading a project's ancestors and storing its record, so a
  // topology change sees every resource of the project, including ones
  // being created.
  std::vector<std::unique_lock<std::mutex>> quiesce();

 private:
  static constexpr size_t kStripes = 64;

  EventOutcome apply_in_order(const LifecycleEvent& ev, const std::string& digest,
                              const std::optional<ResourceRecord>& rec);
  EventOutcome reject(ErrorCode code, std::string detail);
  bool park(const LifecycleEvent& ev, const std::string& digest, bool* already_parked);
  std::optional<std::pair<LifecycleEvent, std::string>> take_parked(const std::string& resource_id,
                                                                    uint64_t seq);

  QuotaLedger& ledger_;
  ResourceRegistry& resources_;
  const Hierarchy& hierarchy_;
  AlertLog* alerts_;
  EventProcessorOptions options_;

  std::array<std::mutex, kStripes> stripes_;

  mutable std::mutex pending_mu_;
  std::map<std::string, std::map<uint64_t, std::pair<LifecycleEvent, std::string>>> pending_;
  size_t pending_size_{0};
};

}  // namespace tally
