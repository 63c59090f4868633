#pragma once

// tally/resources.hpp - Registry of resources known to the event processor.
//
// Each record caches the resource's ancestor scope list so that an event
// never walks the hierarchy. The list is refreshed by
// set_ancestors_for_project() when a project's group membership changes.
//
// Records in terminal states stay in the registry so replays and late
// terminal events are still recognized by sequence number.

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tally/types.hpp"

namespace tally {

struct ResourceRecord {
  std::string resource_id;
  std::string project_uuid;
  std::string kind;
  std::string backend_ref;
  ResourceState state{ResourceState::provisioning};
  Figures figures;
  std::vector<ScopeRef> ancestors;   // [project, groups..., customer]
  uint64_t last_seq{0};
  std::vector<std::string> digests;  // digests[i] = digest of the event with seq i + 1
  int64_t created{0};
  int64_t updated{0};

  // Empty unless the state consumes quota.
  QuotaAmounts contribution() const;
};

class ResourceRegistry {
 public:
  std::optional<ResourceRecord> get(const std::string& resource_id) const;
  void upsert(const ResourceRecord& record);

  std::vector<ResourceRecord> snapshot() const;
  // Consuming resources only, taken under one lock.
  std::vector<ResourceRecord> live_snapshot() const;
  std::vector<ResourceRecord> by_project(const std::string& project_uuid) const;

  // Returns the number of records updated.
  size_t set_ancestors_for_project(const std::string& project_uuid,
                                   const std::vector<ScopeRef>& ancestors);
  // Returns the number of records erased.
  size_t remove_project(const std::string& project_uuid);

  size_t size() const;

 private:
  mutable std::shared_mutex mu_;
  std::map<std::string, ResourceRecord> records_;
};

}  // namespace tally
