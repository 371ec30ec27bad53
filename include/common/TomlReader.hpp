#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gov::common {

/// Reader for the subset of TOML used by check.toml: [tables] with dotted
/// names, key = value pairs with strings, integers, booleans and string
/// arrays (possibly spanning lines), and # comments. Values of other kinds
/// (floats, inline tables, arrays of tables) are kept as raw text so that
/// unrelated sections do not break loading.
/// Class abbreviation: td
class TomlDocument {
 public:
  /// Unparsed value kept for keys this reader does not interpret.
  struct Raw {
    std::string sText;
  };
  using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>, Raw>;

  /// Throws ConfigError with the line number on malformed input.
  static TomlDocument parse(const std::string& sText);

  /// Throws ConfigError if the file cannot be read or parsed.
  static TomlDocument parseFile(const std::string& sPath);

  bool hasTable(const std::string& sTable) const;
  bool has(const std::string& sKey) const;

  // Getters take fully qualified keys ("process.repo.enabled") and throw
  // ConfigError when the key holds a different type.
  std::optional<std::string> getString(const std::string& sKey) const;
  std::optional<int64_t> getInt(const std::string& sKey) const;
  std::optional<bool> getBool(const std::string& sKey) const;
  std::optional<std::vector<std::string>> getStringArray(const std::string& sKey) const;

 private:
  std::map<std::string, Value> _mValues;
  std::vector<std::string> _vTables;
};

}  // namespace gov::common
