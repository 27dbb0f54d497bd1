#include "dqv/data/value.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace dqv::data {

namespace {

std::string format_double(const double d, const int precision) {
  std::ostringstream oss;
  oss << std::setprecision(precision) << d;
  return oss.str();
}

// 2^63 as a double; integral doubles at or beyond it do not fit std::int64_t.
constexpr double kInt64Limit = 9223372036854775808.0;

}  // namespace

std::optional<double> as_number(const Value& value) noexcept {
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    return *d;
  }
  return std::nullopt;
}

const std::string* as_string(const Value& value) noexcept {
  return std::get_if<std::string>(&value);
}

std::string value_to_string(const Value& value) {
  struct Visitor {
    std::string operator()(std::monostate) const { return "null"; }
    std::string operator()(bool b) const { return b ? "true" : "false"; }
    std::string operator()(std::int64_t i) const { return std::to_string(i); }
    std::string operator()(double d) const { return format_double(d, 15); }
    std::string operator()(const std::string& s) const { return s; }
  };
  return std::visit(Visitor{}, value);
}

std::string value_to_key(const Value& value) {
  if (const auto* d = std::get_if<double>(&value)) {
    if (std::isfinite(*d) && std::trunc(*d) == *d && std::fabs(*d) < kInt64Limit) {
      return std::to_string(static_cast<std::int64_t>(*d));
    }
    return format_double(*d, 17);
  }
  return value_to_string(value);
}

}  // namespace dqv::data
