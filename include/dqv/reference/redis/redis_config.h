#pragma once

#include <optional>
#include <string>

namespace dqv::reference::redis {

// RedisConfig holds a parsed and validated Redis URI.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host          (port defaults to 6379)
//   redis://host:port/N (N = database index, redis:// scheme only)
struct RedisConfig {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{6379};    // NOLINT(readability-identifier-naming)
  int redis_db{0};   // NOLINT(readability-identifier-naming)
};

// parse_redis_uri returns nullopt for an empty string, an unknown scheme, a missing
// host, a non-numeric or out-of-range port, or a malformed database index.
// Pure string parsing; does not touch the network.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// "host:port/db" for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace dqv::reference::redis
