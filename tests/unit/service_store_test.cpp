#include "internal/store/service_store.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using rdash::model::ServiceRecord;
using rdash::store::ServiceStore;

ServiceRecord Make(std::string id, std::string name, std::vector<std::string> aliases, int priority = 1) {
  return ServiceRecord{std::move(id), std::move(name), std::move(aliases), priority};
}

bool ThrowsConfigError(std::vector<ServiceRecord> records) {
  try {
    ServiceStore store(std::move(records));
  } catch (const rdash::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestKeepsConfigurationOrder() {
  ServiceStore store({Make("srv-b", "Beta", {"b"}), Make("srv-a", "Alpha", {"a"})});

  assert(store.size() == 2);
  assert(store.Records()[0].id == "srv-b");
  assert(store.Ids() == (std::vector<std::string>{"srv-b", "srv-a"}));
  assert(store.FindById("srv-a") != nullptr);
  assert(store.FindById("srv-a")->name == "Alpha");
  assert(store.FindById("srv-missing") == nullptr);
}

void TestByPriorityThenNameThenId() {
  ServiceStore store({
      Make("srv-3", "zeta", {"z"}, 2),
      Make("srv-2", "Beta", {"b2"}, 1),
      Make("srv-1", "beta", {"b1"}, 1),
      Make("srv-0", "Alpha", {"a"}, 5),
  });

  const auto sorted = store.ByPriority();
  assert(sorted[0].id == "srv-1");
  assert(sorted[1].id == "srv-2");
  assert(sorted[2].id == "srv-3");
  assert(sorted[3].id == "srv-0");
}

void TestRejectsInvalidRecords() {
  assert(ThrowsConfigError({}));
  assert(ThrowsConfigError({Make("", "x", {"x"})}));
  assert(ThrowsConfigError({Make("srv-1", "a", {"a"}), Make("srv-1", "b", {"b"})}));
  assert(ThrowsConfigError({Make("srv-1", "a", {})}));
  assert(ThrowsConfigError({Make("srv-1", "a", {""})}));
  assert(ThrowsConfigError({Make("srv-1", "a", {"Chat"}), Make("srv-2", "b", {"chat"})}));
  assert(ThrowsConfigError({Make("srv-1", "a", {"dup", "DUP"})}));
}

} // namespace

int main() {
  TestKeepsConfigurationOrder();
  TestByPriorityThenNameThenId();
  TestRejectsInvalidRecords();

  std::cout << "rdash_unit_service_store: pass\n";
  return 0;
}
