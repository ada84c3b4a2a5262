#include "cache_demo/server_state.hpp"

namespace cd {

ServerState::ServerState(Clock::time_point started) : started_(started) {
  cur_.last_updated = started;
}

StateSnapshot ServerState::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cur_;
}

StateSnapshot ServerState::update(Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  ++cur_.counter;
  ++cur_.version;
  cur_.last_updated = now;
  return cur_;
}

double ServerState::uptime_seconds(Clock::time_point now) const {
  return std::chrono::duration<double>(now - started_).count();
}

}
