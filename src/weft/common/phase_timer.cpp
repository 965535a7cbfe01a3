#include "weft/common/phase_timer.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace weft::common {

PhaseTimer::PhaseTimer(std::string phase_name)
    : phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()) {
  spdlog::info("[phase] {}: begin", phase_name_);
}

PhaseTimer::~PhaseTimer() {
  spdlog::info("[phase] {}: done ({:.3f}s)", phase_name_, ElapsedSeconds());
}

auto PhaseTimer::ElapsedSeconds() const -> double {
  auto elapsed = std::chrono::steady_clock::now() - start_;
  return std::chrono::duration<double>(elapsed).count();
}

}  // namespace weft::common
