#pragma once

#include "dqv/engine/report.h"

#include <cstddef>
#include <string>

namespace dqv::engine {

// format_summary renders a console table, one row per rule:
//   name | severity | passed | failures | errors | total | pass rate
// followed by "Rule failed: <name> - <failures>/<total> failures" and up to
// max_sample_lines sampled failures for each failing rule, then the overall verdict.
[[nodiscard]] std::string format_summary(const Report& report, std::size_t max_sample_lines = 10);

}  // namespace dqv::engine
