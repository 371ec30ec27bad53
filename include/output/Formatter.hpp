#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/ProtectionCleanup.hpp"

namespace gov::output {

enum class OutputFormat { Text, Json };

/// "text" or "json"; throws ConfigError otherwise.
OutputFormat parseOutputFormat(const std::string& sFormat);

/// Renders governor results for stdout.
/// Class abbreviation: fmt
class Formatter {
 public:
  explicit Formatter(OutputFormat ofFormat);

  std::string diff(const common::SyncDiffResult& sdr) const;
  std::string tagDiff(const common::TagProtectionDiffResult& tdr) const;
  std::string sync(const common::SyncResult& sr) const;
  std::string scan(const common::ScanResult& scr) const;
  std::string tier(const common::TierValidationResult& tvr) const;
  std::string cleanup(const core::CleanupOutcome& co) const;

  // ── JSON representations ──────────────────────────────────────────────
  static nlohmann::json toJson(const common::SettingDiff& sd);
  static nlohmann::json toJson(const common::SyncDiffResult& sdr);
  static nlohmann::json toJson(const common::TagProtectionDiffResult& tdr);
  static nlohmann::json toJson(const common::SyncResult& sr);
  static nlohmann::json toJson(const common::CheckResult& cr);
  static nlohmann::json toJson(const common::ScanResult& scr);
  static nlohmann::json toJson(const common::TierValidationResult& tvr);
  static nlohmann::json toJson(const core::CleanupOutcome& co);

  /// Text listing of rulesets, classic rules, conflicts and orphans.
  static std::string formatProtectionPlan(const common::ProtectionPlan& pp);

 private:
  OutputFormat _ofFormat;
};

}  // namespace gov::output
