#include "tally/hierarchy.hpp"

#include <mutex>

namespace tally {

namespace {

HierarchyResult fail(ErrorCode code, std::string detail) {
  HierarchyResult r;
  r.ok = false;
  r.error = code;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

HierarchyResult Hierarchy::add_customer(const Customer& c) {
  if (c.uuid.empty()) return fail(ErrorCode::validation_error, "customer uuid is empty");
  std::unique_lock lk(mu_);
  if (customers_.count(c.uuid) != 0) return fail(ErrorCode::validation_error, "duplicate customer " + c.uuid);
  customers_[c.uuid] = c;
  return {};
}

HierarchyResult Hierarchy::add_project_group(const ProjectGroup& g) {
  if (g.uuid.empty()) return fail(ErrorCode::validation_error, "project group uuid is empty");
  std::unique_lock lk(mu_);
  if (groups_.count(g.uuid) != 0) return fail(ErrorCode::validation_error, "duplicate project group " + g.uuid);
  if (customers_.count(g.customer_uuid) == 0) {
    return fail(ErrorCode::validation_error, "unknown customer " + g.customer_uuid);
  }
  groups_[g.uuid] = g;
  return {};
}

HierarchyResult Hierarchy::add_project(const Project& p) {
  if (p.uuid.empty()) return fail(ErrorCode::validation_error, "project uuid is empty");
  std::unique_lock lk(mu_);
  if (projects_.count(p.uuid) != 0) return fail(ErrorCode::validation_error, "duplicate project " + p.uuid);
  if (customers_.count(p.customer_uuid) == 0) {
    return fail(ErrorCode::validation_error, "unknown customer " + p.customer_uuid);
  }
  for (const auto& g : p.groups) {
    auto it = groups_.find(g);
    if (it == groups_.end()) return fail(ErrorCode::validation_error, "unknown project group " + g);
    if (it->second.customer_uuid != p.customer_uuid) {
      return fail(ErrorCode::validation_error, "project group " + g + " belongs to another customer");
    }
  }
  projects_[p.uuid] = p;
  return {};
}

HierarchyResult Hierarchy::add_project_to_group(const std::string& project_uuid,
                                                const std::string& group_uuid) {
  std::unique_lock lk(mu_);
  auto p = projects_.find(project_uuid);
  if (p == projects_.end()) return fail(ErrorCode::validation_error, "unknown project " + project_uuid);
  auto g = groups_.find(group_uuid);
  if (g == groups_.end()) return fail(ErrorCode::validation_error, "unknown project group " + group_uuid);
  if (g->second.customer_uuid != p->second.customer_uuid) {
    return fail(ErrorCode::validation_error, "project group " + group_uuid + " belongs to another customer");
  }
  if (!p->second.groups.insert(group_uuid).second) {
    return fail(ErrorCode::validation_error, "project already in group " + group_uuid);
  }
  return {};
}

HierarchyResult Hierarchy::remove_project_from_group(const std::string& project_uuid,
                                                     const std::string& group_uuid) {
  std::unique_lock lk(mu_);
  auto p = projects_.find(project_uuid);
  if (p == projects_.end()) return fail(ErrorCode::validation_error, "unknown project " + project_uuid);
  if (p->second.groups.erase(group_uuid) == 0) {
    return fail(ErrorCode::validation_error, "project is not in group " + group_uuid);
  }
  return {};
}

HierarchyResult Hierarchy::remove_project(const std::string& uuid) {
  std::unique_lock lk(mu_);
  if (projects_.erase(uuid) == 0) return fail(ErrorCode::validation_error, "unknown project " + uuid);
  return {};
}

HierarchyResult Hierarchy::remove_project_group(const std::string& uuid) {
  std::unique_lock lk(mu_);
  if (groups_.erase(uuid) == 0) return fail(ErrorCode::validation_error, "unknown project group " + uuid);
  for (auto& [_, p] : projects_) p.groups.erase(uuid);
  return {};
}

HierarchyResult Hierarchy::remove_customer(const std::string& uuid) {
  std::unique_lock lk(mu_);
  if (customers_.count(uuid) == 0) return fail(ErrorCode::validation_error, "unknown customer " + uuid);
  for (const auto& [_, p] : projects_) {
    if (p.customer_uuid == uuid) return fail(ErrorCode::validation_error, "customer still has projects");
  }
  for (const auto& [_, g] : groups_) {
    if (g.customer_uuid == uuid) return fail(ErrorCode::validation_error, "customer still has project groups");
  }
  customers_.erase(uuid);
  return {};
}

std::optional<Customer> Hierarchy::customer(const std::string& uuid) const {
  std::shared_lock lk(mu_);
  auto it = customers_.find(uuid);
  if (it == customers_.end()) return std::nullopt;
  return it->second;
}

std::optional<ProjectGroup> Hierarchy::project_group(const std::string& uuid) const {
  std::shared_lock lk(mu_);
  auto it = groups_.find(uuid);
  if (it == groups_.end()) return std::nullopt;
  return it->second;
}

std::optional<Project> Hierarchy::project(const std::string& uuid) const {
  std::shared_lock lk(mu_);
  auto it = projects_.find(uuid);
  if (it == projects_.end()) return std::nullopt;
  return it->second;
}

bool Hierarchy::exists(const ScopeRef& scope) const {
  std::shared_lock lk(mu_);
  switch (scope.type) {
    case ScopeType::customer: return customers_.count(scope.uuid) != 0;
    case ScopeType::project_group: return groups_.count(scope.uuid) != 0;
    case ScopeType::project: return projects_.count(scope.uuid) != 0;
  }
  return false;
}

std::string Hierarchy::name_of(const ScopeRef& scope) const {
  std::shared_lock lk(mu_);
  switch (scope.type) {
    case ScopeType::customer: {
      auto it = customers_.find(scope.uuid);
      return it == customers_.end() ? std::string() : it->second.name;
    }
    case ScopeType::project_group: {
      auto it = groups_.find(scope.uuid);
      return it == groups_.end() ? std::string() : it->second.name;
    }
    case ScopeType::project: {
      auto it = projects_.find(scope.uuid);
      return it == projects_.end() ? std::string() : it->second.name;
    }
  }
  return {};
}

std::vector<ScopeRef> Hierarchy::ancestors_locked(const Project& p) const {
  std::vector<ScopeRef> out;
  out.push_back(ScopeRef{ScopeType::project, p.uuid});
  for (const auto& g : p.groups) out.push_back(ScopeRef{ScopeType::project_group, g});
  out.push_back(ScopeRef{ScopeType::customer, p.customer_uuid});
  return out;
}

std::vector<ScopeRef> Hierarchy::ancestors_of_project(const std::string& project_uuid) const {
  std::shared_lock lk(mu_);
  auto it = projects_.find(project_uuid);
  if (it == projects_.end()) return {};
  return ancestors_locked(it->second);
}

std::vector<ScopeRef> Hierarchy::scopes_of_type(ScopeType type) const {
  std::shared_lock lk(mu_);
  std::vector<ScopeRef> out;
  switch (type) {
    case ScopeType::customer:
      for (const auto& [uuid, _] : customers_) out.push_back(ScopeRef{type, uuid});
      break;
    case ScopeType::project_group:
      for (const auto& [uuid, _] : groups_) out.push_back(ScopeRef{type, uuid});
      break;
    case ScopeType::project:
      for (const auto& [uuid, _] : projects_) out.push_back(ScopeRef{type, uuid});
      break;
  }
  return out;
}

std::vector<std::string> Hierarchy::projects_under(const ScopeRef& scope) const {
  std::shared_lock lk(mu_);
  std::vector<std::string> out;
  for (const auto& [uuid, p] : projects_) {
    switch (scope.type) {
      case ScopeType::customer:
        if (p.customer_uuid == scope.uuid) out.push_back(uuid);
        break;
      case ScopeType::project_group:
        if (p.groups.count(scope.uuid) != 0) out.push_back(uuid);
        break;
      case ScopeType::project:
        if (uuid == scope.uuid) out.push_back(uuid);
        break;
    }
  }
  return out;
}

std::vector<ScopeRef> Hierarchy::subtree(const ScopeRef& scope) const {
  std::vector<ScopeRef> out{scope};
  if (scope.type == ScopeType::customer) {
    std::shared_lock lk(mu_);
    for (const auto& [uuid, g] : groups_) {
      if (g.customer_uuid == scope.uuid) out.push_back(ScopeRef{ScopeType::project_group, uuid});
    }
  }
  if (scope.type != ScopeType::project) {
    for (const auto& p : projects_under(scope)) out.push_back(ScopeRef{ScopeType::project, p});
  }
  return out;
}

std::vector<int64_t> Hierarchy::creation_times(ScopeType type) const {
  std::shared_lock lk(mu_);
  std::vector<int64_t> out;
  switch (type) {
    case ScopeType::customer:
      for (const auto& [_, c] : customers_) out.push_back(c.created);
      break;
    case ScopeType::project_group:
      for (const auto& [_, g] : groups_) out.push_back(g.created);
      break;
    case ScopeType::project:
      for (const auto& [_, p] : projects_) out.push_back(p.created);
      break;
  }
  return out;
}

size_t Hierarchy::group_count(const std::string& customer_uuid) const {
  std::shared_lock lk(mu_);
  size_t n = 0;
  for (const auto& [_, g] : groups_) n += (g.customer_uuid == customer_uuid) ? 1 : 0;
  return n;
}

}  // namespace tally
