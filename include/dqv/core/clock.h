#pragma once

#include <string>
#include <utility>

namespace dqv::core {

// Abstract clock interface for timestamp injection.
// Production runs use system time; tests use fixed timestamps so audit trails are reproducible.
class IClock {
 public:
  virtual ~IClock() = default;

  // UTC, ISO 8601 with millisecond precision for SystemClock.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Fixed clock: returns a constant timestamp.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace dqv::core
