#include "service_resolver.hpp"

#include <algorithm>
#include <functional>
#include <string>

#include "internal/store/service_store.hpp"
#include "internal/util/strings.hpp"

namespace rdash::resolver {

using model::ServiceRecord;

namespace {

using Predicate = std::function<bool(const ServiceRecord&)>;

std::vector<ServiceRecord> Collect(const std::vector<ServiceRecord>& records, const Predicate& matches) {
  std::vector<ServiceRecord> out;
  for (const auto& record : records) {
    if (matches(record)) out.push_back(record);
  }
  return out;
}

MatchResult ToResult(std::vector<ServiceRecord> candidates) {
  MatchResult result;
  if (candidates.empty()) {
    result.kind = MatchKind::kNoMatch;
    return result;
  }

  result.kind = candidates.size() == 1 ? MatchKind::kUnique : MatchKind::kAmbiguous;
  std::stable_sort(candidates.begin(), candidates.end(), store::PriorityOrder);
  result.candidates = std::move(candidates);
  return result;
}

} // namespace

MatchResult Resolve(std::string_view token, const std::vector<ServiceRecord>& records) {
  const auto needle = util::ToLower(token);
  if (needle.empty()) return {};

  const std::vector<Predicate> tiers = {
      // exact alias
      [&](const ServiceRecord& r) {
        return std::any_of(r.aliases.begin(), r.aliases.end(), [&](const std::string& a) { return util::ToLower(a) == needle; });
      },
      // alias prefix
      [&](const ServiceRecord& r) {
        return std::any_of(r.aliases.begin(), r.aliases.end(),
                           [&](const std::string& a) { return util::StartsWith(util::ToLower(a), needle); });
      },
      // name prefix
      [&](const ServiceRecord& r) { return util::StartsWith(util::ToLower(r.name), needle); },
  };

  for (const auto& tier : tiers) {
    auto candidates = Collect(records, tier);
    if (!candidates.empty()) return ToResult(std::move(candidates));
  }

  return {};
}

} // namespace rdash::resolver
