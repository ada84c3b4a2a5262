#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>

namespace cd {

using Clock = std::chrono::system_clock;

// Copy of the shared state taken under one lock.
struct StateSnapshot {
  std::uint64_t counter = 0;
  Clock::time_point last_updated{};
  std::uint64_t version = 1;
};

// Process-wide demo data (counter, lastUpdated, version).
// Owned by the server and handed to handlers by reference.
class ServerState {
public:
  explicit ServerState(Clock::time_point started = Clock::now());

  StateSnapshot snapshot() const;

  // Bumps counter and version and stamps lastUpdated in one critical section.
  StateSnapshot update(Clock::time_point now = Clock::now());

  // Seconds since construction.
  double uptime_seconds(Clock::time_point now = Clock::now()) const;

private:
  const Clock::time_point started_;
  mutable std::mutex mu_;
  StateSnapshot cur_;
};

}
