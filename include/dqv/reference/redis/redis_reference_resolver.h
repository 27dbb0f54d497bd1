#pragma once

#include "dqv/reference/reference_resolver.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace dqv::reference::redis {

// RedisReferenceResolver reads reference key sets published in Redis.
//
// Redis data model:
// - dqv:reference:{reference_id} (set of canonical key strings)
//
// A missing key is an unavailable reference, not an empty one. Members are read once
// with SMEMBERS and held in memory for the rest of the run.
class RedisReferenceResolver final : public IReferenceResolver {
 public:
  // Construct with Redis connection string (e.g., "tcp://127.0.0.1:6379")
  // Throws std::runtime_error if connection fails
  explicit RedisReferenceResolver(const std::string& redis_uri);

  ~RedisReferenceResolver() override;

  RedisReferenceResolver(const RedisReferenceResolver&) = delete;
  RedisReferenceResolver& operator=(const RedisReferenceResolver&) = delete;
  RedisReferenceResolver(RedisReferenceResolver&&) = delete;
  RedisReferenceResolver& operator=(RedisReferenceResolver&&) = delete;

  [[nodiscard]] LookupResult resolve(const std::string& reference_id) const override;

  // Key holding the set for reference_id.
  [[nodiscard]] static std::string set_key(const std::string& reference_id);

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace dqv::reference::redis
