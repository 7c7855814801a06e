#include "converge/core/trace.hpp"
#include "converge/core/platform_utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace converge::core {

namespace {

// -1 = not yet resolved from the environment
std::atomic<int> g_trace_state{-1};
std::mutex g_trace_mutex;

} // namespace

auto trace_enabled() noexcept -> bool {
  int state = g_trace_state.load(std::memory_order_acquire);
  if (state < 0) {
    const int resolved = env_flag("CONVERGE_TRACE") ? 1 : 0;
    // A concurrent set_trace_enabled() wins over the environment.
    g_trace_state.compare_exchange_strong(state, resolved, std::memory_order_acq_rel);
    state = g_trace_state.load(std::memory_order_acquire);
  }
  return state == 1;
}

auto set_trace_enabled(bool enabled) noexcept -> void {
  g_trace_state.store(enabled ? 1 : 0, std::memory_order_release);
}

auto trace(std::string_view component, std::string_view message) -> void {
  if (!trace_enabled()) return;
  std::lock_guard<std::mutex> lock(g_trace_mutex);
  std::cerr << "[converge][" << component << "] " << message << std::endl;
}

} // namespace converge::core
