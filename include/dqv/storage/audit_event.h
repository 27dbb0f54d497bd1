#pragma once

#include <string>
#include <vector>

namespace dqv::storage {

// AuditEvent is one structured entry of the append-only run history.
// payload is a JSON object serialized with nlohmann::json; refs lists related ids
// (report id, rule names, reference ids).
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace dqv::storage
