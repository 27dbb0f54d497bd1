#include "dqv/core/id_generator.h"

#include <chrono>

namespace dqv::core {

namespace {

std::string join_id(std::string_view prefix, std::string_view middle, unsigned long long seq) {
  std::string id(prefix);
  id += '-';
  if (!middle.empty()) {
    id += middle;
    id += '-';
  }
  id += std::to_string(seq);
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);
  const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
  return join_id(prefix, std::to_string(epoch_ms), seq);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return join_id(prefix, {}, counter_.fetch_add(1, std::memory_order_relaxed));
}

}  // namespace dqv::core
