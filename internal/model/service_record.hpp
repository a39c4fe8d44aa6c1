#pragma once

#include <string>
#include <vector>

namespace rdash::model {

constexpr int kDefaultPriority = 1;

/*
  One configured service. Built once from configuration, never mutated.
*/
struct ServiceRecord {
  std::string              id;
  std::string              name;
  std::vector<std::string> aliases;
  int                      priority = kDefaultPriority;
};

} // namespace rdash::model
