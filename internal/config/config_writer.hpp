#pragma once

#include <filesystem>
#include <string>

#include "internal/model/service_record.hpp"

namespace rdash::config {

/*
  Edits the services list of a YAML config file in place. Other keys are
  preserved (comments are not). A missing file is created with a render
  section that reads the key from ${RENDER_API_KEY}.
*/
class ConfigWriter {
 public:
  explicit ConfigWriter(std::filesystem::path path);

  // Throws util::ConfigError if the id or one of the aliases is already configured.
  void AddService(const model::ServiceRecord& record);

  // Throws util::NotFound if no entry has this id.
  void RemoveService(const std::string& service_id);

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace rdash::config
