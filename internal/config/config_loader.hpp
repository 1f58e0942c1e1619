#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset scalars get the documented defaults.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static ledger::runtime::config::RuntimeConfig Defaults();

  // Fills unset scalars; throws std::runtime_error on invalid values.
  static void Normalize(ledger::runtime::config::RuntimeConfig& config);
};

} // namespace ledger::config
