#pragma once

#include <string>

#include "common/Policy.hpp"
#include "common/TomlReader.hpp"

namespace gov::common {

/// Builds a Policy from check.toml.
/// Class abbreviation: pl
class PolicyLoader {
 public:
  /// Throws ConfigError when the file is missing, malformed or holds a value
  /// of the wrong type.
  static Policy loadFile(const std::string& sPath);

  static Policy fromDocument(const TomlDocument& tdDoc);
};

}  // namespace gov::common
