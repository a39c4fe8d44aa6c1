#pragma once

#include <string_view>
#include <vector>

#include "internal/model/service_record.hpp"

namespace rdash::resolver {

enum class MatchKind {
  kUnique,
  kNoMatch,
  kAmbiguous,
};

/*
  Outcome of resolving a user token. NoMatch and Ambiguous are normal
  results, not errors.

  kUnique    -> candidates holds exactly the matched record
  kNoMatch   -> candidates is empty
  kAmbiguous -> candidates ordered by priority, then name, then id
*/
struct MatchResult {
  MatchKind                         kind = MatchKind::kNoMatch;
  std::vector<model::ServiceRecord> candidates;

  bool unique() const {
    return kind == MatchKind::kUnique;
  }

  const model::ServiceRecord& record() const {
    return candidates.front();
  }
};

/*
  Resolve a token against the configured services. Case-insensitive,
  first tier with a candidate wins:

    1. exact alias
    2. alias prefix
    3. name prefix

  Partial matching is prefix-only: "api" does not match "chat-api".
  Pure function of its inputs.
*/
MatchResult Resolve(std::string_view token, const std::vector<model::ServiceRecord>& records);

} // namespace rdash::resolver
