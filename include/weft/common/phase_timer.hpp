#pragma once

#include <chrono>
#include <string>

namespace weft::common {

// RAII helper for timing phases. Logs begin on construction and done (with
// duration) on destruction, at info level.
class PhaseTimer {
 public:
  explicit PhaseTimer(std::string phase_name);
  ~PhaseTimer();

  // Non-copyable, non-movable (RAII resource)
  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

  [[nodiscard]] auto ElapsedSeconds() const -> double;

 private:
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace weft::common
