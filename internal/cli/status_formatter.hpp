#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/service_record.hpp"
#include "internal/model/status_snapshot.hpp"
#include "internal/util/time.hpp"

namespace rdash::cli {

struct FormatOptions {
  bool            color = false;
  util::TimePoint now   = util::Now();
};

// Multi-line status block for `rdash <token> status`.
std::string FormatStatus(const model::ServiceRecord& record, const model::StatusSnapshot& snapshot, const FormatOptions& options);

// "Multiple services match ..." with a numbered list in resolver order.
std::string FormatAmbiguous(const std::string& token, const std::vector<model::ServiceRecord>& candidates);

std::string FormatNoMatch(const std::string& token, const std::vector<model::ServiceRecord>& records);

// `rdash service list`, sorted by priority.
std::string FormatServiceList(const std::vector<model::ServiceRecord>& records);

std::string JoinAliases(const model::ServiceRecord& record);

// "build_failed" style words -> "Build Failed"
std::string TitleCase(std::string_view value);

} // namespace rdash::cli
