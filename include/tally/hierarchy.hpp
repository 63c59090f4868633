#pragma once

// tally/hierarchy.hpp - Customer / ProjectGroup / Project registry.
//
// STRUCTURE:
//   Customer -> Project is a tree (a project has exactly one customer).
//   ProjectGroup belongs to one customer; project membership in groups is a
//   many-to-many overlay of the same customer, used only for aggregation.
//
// ANCESTOR LISTS:
//   ancestors_of_project() returns [project, groups (sorted)..., customer].
//   The order is the order in which a lifecycle batch adjusts scopes, so the
//   customer is always the last ancestor.
//
// THREAD SAFETY:
//   Reads take a shared lock; mutations take it exclusively. Mutations are
//   rare (topology changes) compared to reads (every event, every query).

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tally/types.hpp"

namespace tally {

struct Customer {
  std::string uuid;
  std::string name;
  int64_t created{0};
};

struct ProjectGroup {
  std::string uuid;
  std::string name;
  std::string customer_uuid;
  int64_t created{0};
};

struct Project {
  std::string uuid;
  std::string name;
  std::string customer_uuid;
  std::set<std::string> groups;
  int64_t created{0};
};

struct HierarchyResult {
  bool ok{true};
  ErrorCode error{ErrorCode::none};
  std::string detail;
};

class Hierarchy {
 public:
  HierarchyResult add_customer(const Customer& c);
  HierarchyResult add_project_group(const ProjectGroup& g);
  // Every listed group must exist and belong to the project's customer.
  HierarchyResult add_project(const Project& p);

  HierarchyResult add_project_to_group(const std::string& project_uuid, const std::string& group_uuid);
  HierarchyResult remove_project_from_group(const std::string& project_uuid, const std::string& group_uuid);

  HierarchyResult remove_project(const std::string& uuid);
  // Drops the group from every member project.
  HierarchyResult remove_project_group(const std::string& uuid);
  // Only an empty customer (no projects, no groups) can be removed.
  HierarchyResult remove_customer(const std::string& uuid);

  std::optional<Customer> customer(const std::string& uuid) const;
  std::optional<ProjectGroup> project_group(const std::string& uuid) const;
  std::optional<Project> project(const std::string& uuid) const;

  bool exists(const ScopeRef& scope) const;
  std::string name_of(const ScopeRef& scope) const;

  // Empty when the project is unknown.
  std::vector<ScopeRef> ancestors_of_project(const std::string& project_uuid) const;

  // Sorted by uuid.
  std::vector<ScopeRef> scopes_of_type(ScopeType type) const;

  // Project uuids transitively under the scope (a project is under itself).
  std::vector<std::string> projects_under(const ScopeRef& scope) const;

  // The scope itself plus every group and project beneath it.
  std::vector<ScopeRef> subtree(const ScopeRef& scope) const;

  std::vector<int64_t> creation_times(ScopeType type) const;

  size_t group_count(const std::string& customer_uuid) const;

 private:
  std::vector<ScopeRef> ancestors_locked(const Project& p) const;

  mutable std::shared_mutex mu_;
  std::map<std::string, Customer> customers_;
  std::map<std::string, ProjectGroup> groups_;
  std::map<std::string, Project> projects_;
};

}  // namespace tally
