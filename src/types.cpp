#include "tally/types.hpp"

namespace tally {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::quota_record_missing: return "quota_record_missing";
    case ErrorCode::out_of_order_event: return "out_of_order_event";
    case ErrorCode::backend_unavailable: return "backend_unavailable";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::fault_injected: return "fault_injected";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::json_parse_error: return "json_parse_error";
  }
  return "";
}

bool is_retryable(ErrorCode code) {
  switch (code) {
    case ErrorCode::quota_record_missing:
    case ErrorCode::out_of_order_event:
    case ErrorCode::backend_unavailable:
    case ErrorCode::fault_injected:
      return true;
    default:
      return false;
  }
}

std::string to_string(ScopeType type) {
  switch (type) {
    case ScopeType::customer: return "customer";
    case ScopeType::project_group: return "project_group";
    case ScopeType::project: return "project";
  }
  return "customer";
}

std::optional<ScopeType> parse_scope_type(const std::string& s) {
  if (s == "customer") return ScopeType::customer;
  if (s == "project_group") return ScopeType::project_group;
  if (s == "project") return ScopeType::project;
  return std::nullopt;
}

std::string ScopeRef::to_string() const {
  return tally::to_string(type) + ":" + uuid;
}

std::string QuotaKey::to_string() const {
  return scope.to_string() + "/" + resource_type;
}

const std::vector<std::string>& standard_quota_names() {
  static const std::vector<std::string> names{
      quota_names::kVcpu, quota_names::kRam, quota_names::kStorage, quota_names::kMaxInstances};
  return names;
}

std::string to_string(ResourceState s) {
  switch (s) {
    case ResourceState::provisioning: return "provisioning";
    case ResourceState::active: return "active";
    case ResourceState::resizing: return "resizing";
    case ResourceState::deleting: return "deleting";
    case ResourceState::deleted: return "deleted";
    case ResourceState::erred: return "erred";
  }
  return "erred";
}

std::optional<ResourceState> parse_resource_state(const std::string& s) {
  if (s == "provisioning") return ResourceState::provisioning;
  if (s == "active") return ResourceState::active;
  if (s == "resizing") return ResourceState::resizing;
  if (s == "deleting") return ResourceState::deleting;
  if (s == "deleted") return ResourceState::deleted;
  if (s == "erred") return ResourceState::erred;
  return std::nullopt;
}

bool is_terminal(ResourceState s) {
  return s == ResourceState::deleted || s == ResourceState::erred;
}

bool consumes_quota(ResourceState s) {
  return s == ResourceState::provisioning || s == ResourceState::active ||
         s == ResourceState::resizing;
}

QuotaAmounts quota_contribution(const std::string& kind, const Figures& f) {
  QuotaAmounts out;
  if (f.vcpu != 0) out[quota_names::kVcpu] = f.vcpu;
  if (f.ram_mb != 0) out[quota_names::kRam] = f.ram_mb;
  if (f.storage_mb != 0) out[quota_names::kStorage] = f.storage_mb;
  if (kind == kInstanceKind) out[quota_names::kMaxInstances] = 1;
  return out;
}

QuotaAmounts quota_delta(const QuotaAmounts& before, const QuotaAmounts& after) {
  QuotaAmounts out;
  for (const auto& [name, value] : after) {
    auto it = before.find(name);
    const int64_t d = value - (it == before.end() ? 0 : it->second);
    if (d != 0) out[name] = d;
  }
  for (const auto& [name, value] : before) {
    if (after.count(name) == 0 && value != 0) out[name] = -value;
  }
  return out;
}

std::string to_string(Item item) {
  switch (item) {
    case Item::cpu: return "cpu";
    case Item::memory: return "memory";
    case Item::storage: return "storage";
  }
  return "cpu";
}

std::optional<Item> parse_item(const std::string& s) {
  if (s == "cpu") return Item::cpu;
  if (s == "memory") return Item::memory;
  if (s == "storage") return Item::storage;
  return std::nullopt;
}

}  // namespace tally
