#include "dqv/reference/redis/redis_reference_resolver.h"

#include <sw/redis++/redis++.h>

#include <iterator>
#include <stdexcept>
#include <unordered_set>

namespace dqv::reference::redis {

RedisReferenceResolver::RedisReferenceResolver(const std::string& redis_uri) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_uri);
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisReferenceResolver::~RedisReferenceResolver() = default;

std::string RedisReferenceResolver::set_key(const std::string& reference_id) {
  return "dqv:reference:" + reference_id;
}

LookupResult RedisReferenceResolver::resolve(const std::string& reference_id) const {
  const std::string key = set_key(reference_id);
  try {
    if (redis_->exists(key) == 0) {
      return LookupResult::err("no Redis reference set at '" + key + "'");
    }
    std::unordered_set<std::string> members;
    redis_->smembers(key, std::inserter(members, members.begin()));
    return LookupResult::ok(std::make_shared<HashSetReferenceLookup>(std::move(members)));
  } catch (const sw::redis::Error& e) {
    return LookupResult::err("Redis error reading '" + key + "': " + e.what());
  }
}

}  // namespace dqv::reference::redis
