#pragma once

#include <string>
#include <vector>

#include "internal/model/service_record.hpp"

namespace rdash::store {

/*
  ServiceStore

  Immutable, ordered list of configured services. The constructor
  validates the records and throws util::ConfigError on:
    - an empty list
    - an empty or duplicate id
    - a record without aliases, or with an empty alias
    - an alias used twice (compared case-insensitively)

  Read-only after construction; safe to share between threads.
*/
class ServiceStore {
 public:
  explicit ServiceStore(std::vector<model::ServiceRecord> records);

  const std::vector<model::ServiceRecord>& Records() const {
    return records_;
  }

  const model::ServiceRecord* FindById(const std::string& id) const;

  std::vector<std::string> Ids() const;

  // Records ordered by ascending priority, then case-insensitive name.
  std::vector<model::ServiceRecord> ByPriority() const;

  size_t size() const {
    return records_.size();
  }

 private:
  std::vector<model::ServiceRecord> records_;
};

// Display ordering shared by the store, the resolver and the dashboard.
bool PriorityOrder(const model::ServiceRecord& a, const model::ServiceRecord& b);

} // namespace rdash::store
