#include "service_store.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace rdash::store {

using model::ServiceRecord;

bool PriorityOrder(const ServiceRecord& a, const ServiceRecord& b) {
  if (a.priority != b.priority) return a.priority < b.priority;

  const auto name_a = util::ToLower(a.name);
  const auto name_b = util::ToLower(b.name);
  if (name_a != name_b) return name_a < name_b;

  return a.id < b.id;
}

ServiceStore::ServiceStore(std::vector<ServiceRecord> records) : records_(std::move(records)) {
  if (records_.empty()) {
    throw util::ConfigError("No services configured. Add at least one service to the 'services' list");
  }

  std::unordered_set<std::string>              ids;
  std::unordered_map<std::string, std::string> alias_owner;

  for (size_t i = 0; i < records_.size(); ++i) {
    const auto& record = records_[i];

    if (record.id.empty()) {
      throw util::ConfigError("Service at index " + std::to_string(i) + " missing required 'id' field");
    }
    if (!ids.insert(record.id).second) {
      throw util::ConfigError("Duplicate service id '" + record.id + "'");
    }
    if (record.aliases.empty()) {
      throw util::ConfigError("Service " + record.id + ": at least one alias is required");
    }

    for (const auto& alias : record.aliases) {
      if (alias.empty()) {
        throw util::ConfigError("Service " + record.id + ": aliases must not be empty");
      }

      const auto key      = util::ToLower(alias);
      auto [it, inserted] = alias_owner.emplace(key, record.id);
      if (!inserted) {
        throw util::ConfigError("Alias '" + alias + "' is used by both " + it->second + " and " + record.id);
      }
    }
  }
}

const ServiceRecord* ServiceStore::FindById(const std::string& id) const {
  auto it = std::find_if(records_.begin(), records_.end(), [&](const ServiceRecord& r) { return r.id == id; });
  return it == records_.end() ? nullptr : &*it;
}

std::vector<std::string> ServiceStore::Ids() const {
  std::vector<std::string> ids;
  ids.reserve(records_.size());
  for (const auto& record : records_) ids.push_back(record.id);
  return ids;
}

std::vector<ServiceRecord> ServiceStore::ByPriority() const {
  auto sorted = records_;
  std::stable_sort(sorted.begin(), sorted.end(), PriorityOrder);
  return sorted;
}

} // namespace rdash::store
