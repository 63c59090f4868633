#include "tally/resources.hpp"

#include <mutex>

namespace tally {

QuotaAmounts ResourceRecord::contribution() const {
  if (!consumes_quota(state)) return {};
  return quota_contribution(kind, figures);
}

std::optional<ResourceRecord> ResourceRegistry::get(const std::string& resource_id) const {
  std::shared_lock lk(mu_);
  auto it = records_.find(resource_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

void ResourceRegistry::upsert(const ResourceRecord& record) {
  std::unique_lock lk(mu_);
  records_[record.resource_id] = record;
}

std::vector<ResourceRecord> ResourceRegistry::snapshot() const {
  std::shared_lock lk(mu_);
  std::vector<ResourceRecord> out;
  out.reserve(records_.size());
  for (const auto& [_, r] : records_) out.push_back(r);
  return out;
}

std::vector<ResourceRecord> ResourceRegistry::live_snapshot() const {
  std::shared_lock lk(mu_);
  std::vector<ResourceRecord> out;
  for (const auto& [_, r] : records_) {
    if (consumes_quota(r.state)) out.push_back(r);
  }
  return out;
}

std::vector<ResourceRecord> ResourceRegistry::by_project(const std::string& project_uuid) const {
  std::shared_lock lk(mu_);
  std::vector<ResourceRecord> out;
  for (const auto& [_, r] : records_) {
    if (r.project_uuid == project_uuid) out.push_back(r);
  }
  return out;
}

size_t ResourceRegistry::set_ancestors_for_project(const std::string& project_uuid,
                                                   const std::vector<ScopeRef>& ancestors) {
  std::unique_lock lk(mu_);
  size_t n = 0;
  for (auto& [_, r] : records_) {
    if (r.project_uuid != project_uuid) continue;
    r.ancestors = ancestors;
    ++n;
  }
  return n;
}

size_t ResourceRegistry::remove_project(const std::string& project_uuid) {
  std::unique_lock lk(mu_);
  size_t n = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.project_uuid == project_uuid) {
      it = records_.erase(it);
      ++n;
    } else {
      ++it;
    }
  }
  return n;
}

size_t ResourceRegistry::size() const {
  std::shared_lock lk(mu_);
  return records_.size();
}

}  // namespace tally
