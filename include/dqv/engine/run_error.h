#pragma once

#include <string>
#include <string_view>

namespace dqv::engine {

// Fatal run errors. None of them produces a Report.
enum class RunErrorKind {
  kConfiguration,         // malformed rule set
  kReferenceUnavailable,  // a reference set could not be resolved
  kDatasetUnavailable,    // the substrate failed to materialize a partition
  kCancelled,             // stop requested
};

struct RunError {
  RunErrorKind kind{RunErrorKind::kConfiguration};  // NOLINT(readability-identifier-naming)
  std::string message;                              // NOLINT(readability-identifier-naming)
  std::string rule_name;                            // empty when not tied to one rule
};

[[nodiscard]] inline std::string_view to_string(const RunErrorKind kind) noexcept {
  switch (kind) {
    case RunErrorKind::kConfiguration:
      return "configuration";
    case RunErrorKind::kReferenceUnavailable:
      return "reference_unavailable";
    case RunErrorKind::kDatasetUnavailable:
      return "dataset_unavailable";
    case RunErrorKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace dqv::engine
