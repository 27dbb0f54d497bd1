#pragma once

namespace dqv::core {

// kBuildVersion is the current software version string, recorded in every
// ValidationRunStarted audit event and printed by dqv_cli --version.
constexpr const char* kBuildVersion = "1.0.0";

}  // namespace dqv::core
