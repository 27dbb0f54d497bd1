#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace dqv::data {

// Value is a single cell of a tabular record.
// std::monostate is the domain's null / absent marker.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const Value& value) noexcept {
  return std::holds_alternative<std::monostate>(value);
}

// Returns the numeric value for integer and double cells; nullopt for every other type.
// Booleans are not numeric.
[[nodiscard]] std::optional<double> as_number(const Value& value) noexcept;

// Returns a pointer to the string payload, or nullptr for non-string cells.
[[nodiscard]] const std::string* as_string(const Value& value) noexcept;

// Human-readable rendering for failure diagnostics: null, true/false, 42, 3.5, text.
[[nodiscard]] std::string value_to_string(const Value& value);

// Canonical key text used for uniqueness and reference lookups.
// Integral doubles collapse to their integer spelling so 5 and 5.0 compare equal, and
// numbers and their decimal string spelling share a key ("5" matches 5).
// Precondition: value is not null.
[[nodiscard]] std::string value_to_key(const Value& value);

}  // namespace dqv::data
