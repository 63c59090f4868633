#pragma once

// tally/types.hpp - Core vocabulary for the Tally quota ledger.
//
// SCOPES:
//   A scope is a hierarchy node usage and quota figures are reported against:
//   customer, project_group or project. Scopes are addressed by ScopeRef
//   (type + uuid). Customer -> Project is a tree; ProjectGroup membership is
//   a many-to-many overlay used only for aggregation.
//
// QUOTA RESOURCE TYPES:
//   Quota resource types are plain strings so that new counters can be added
//   without touching the ledger. The standard set is vcpu, ram (MiB),
//   storage (MiB) and max_instances.
//
// ERRORS:
//   Every fallible operation returns a value-type result carrying
//   {ok, error, detail}. Nothing throws across module boundaries.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tally {

enum class ErrorCode {
  none,
  validation_error,       // malformed parameters, bad transition, non-monotonic sequence
  quota_record_missing,   // scope not registered in the ledger (retryable)
  out_of_order_event,     // sequence gap or duplicate replay (retryable)
  backend_unavailable,    // monitoring store unreachable (retryable)
  deadline_exceeded,      // query deadline passed or cancelled; partial result attached
  fault_injected,         // chaos fault fired during a commit (retryable)
  config_invalid,
  json_parse_error,
};

std::string to_string(ErrorCode code);

// Retryable conditions are surfaced to the caller for backoff-and-retry.
bool is_retryable(ErrorCode code);

// ---------------------------------------------------------------------------
// Scopes
// ---------------------------------------------------------------------------
enum class ScopeType { customer, project_group, project };

std::string to_string(ScopeType type);
std::optional<ScopeType> parse_scope_type(const std::string& s);

struct ScopeRef {
  ScopeType type{ScopeType::customer};
  std::string uuid;

  // "customer:<uuid>"
  std::string to_string() const;

  bool operator==(const ScopeRef& o) const { return type == o.type && uuid == o.uuid; }
  bool operator!=(const ScopeRef& o) const { return !(*this == o); }
  bool operator<(const ScopeRef& o) const {
    if (type != o.type) return type < o.type;
    return uuid < o.uuid;
  }
};

namespace quota_names {
inline constexpr const char* kVcpu         = "vcpu";
inline constexpr const char* kRam          = "ram";
inline constexpr const char* kStorage      = "storage";
inline constexpr const char* kMaxInstances = "max_instances";
}  // namespace quota_names

// vcpu, ram, storage, max_instances - the records created for every scope.
const std::vector<std::string>& standard_quota_names();

struct QuotaKey {
  ScopeRef scope;
  std::string resource_type;

  // "project:<uuid>/vcpu"
  std::string to_string() const;

  bool operator==(const QuotaKey& o) const {
    return scope == o.scope && resource_type == o.resource_type;
  }
  bool operator<(const QuotaKey& o) const {
    if (scope != o.scope) return scope < o.scope;
    return resource_type < o.resource_type;
  }
};

// ---------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------
enum class ResourceState { provisioning, active, resizing, deleting, deleted, erred };

std::string to_string(ResourceState s);
std::optional<ResourceState> parse_resource_state(const std::string& s);

// deleted and erred are terminal.
bool is_terminal(ResourceState s);

// A resource contributes to usage only in provisioning, active or resizing.
// The deleting transition releases usage, so deleting does not consume.
bool consumes_quota(ResourceState s);

struct Figures {
  int64_t vcpu{0};
  int64_t ram_mb{0};
  int64_t storage_mb{0};

  bool operator==(const Figures& o) const {
    return vcpu == o.vcpu && ram_mb == o.ram_mb && storage_mb == o.storage_mb;
  }
  bool operator!=(const Figures& o) const { return !(*this == o); }
};

inline constexpr const char* kInstanceKind = "instance";

using QuotaAmounts = std::map<std::string, int64_t>;

// Quota contribution of one consuming resource: vcpu, ram, storage and
// max_instances (1 for kind "instance"). Zero entries are omitted.
QuotaAmounts quota_contribution(const std::string& kind, const Figures& f);

// after - before per quota resource type, zero entries omitted.
QuotaAmounts quota_delta(const QuotaAmounts& before, const QuotaAmounts& after);

// ---------------------------------------------------------------------------
// Monitoring items
// ---------------------------------------------------------------------------
enum class Item { cpu, memory, storage };

std::string to_string(Item item);
std::optional<Item> parse_item(const std::string& s);

}  // namespace tally
