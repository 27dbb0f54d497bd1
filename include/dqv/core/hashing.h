#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace dqv::core {

// FNV-1a 64-bit, stable across platforms and runs. Rule set fingerprints are the hex form.
// Not a cryptographic hash.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

}  // namespace dqv::core
