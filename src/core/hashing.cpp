#include "dqv/core/hashing.h"

namespace dqv::core {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ull;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ull;
constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::uint64_t stable_hash64(const std::string_view input) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const unsigned char byte : input) {
    hash ^= byte;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string stable_hash64_hex(const std::string_view input) {
  std::uint64_t hash = stable_hash64(input);
  std::string hex(16, '0');
  for (auto it = hex.rbegin(); it != hex.rend(); ++it) {
    *it = kHexDigits[hash & 0xfu];
    hash >>= 4;
  }
  return hex;
}

}  // namespace dqv::core
