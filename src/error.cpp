#include "converge/error.hpp"

namespace converge::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::check_failed: return "check_failed";
    case error_code::action_failed: return "action_failed";
    case error_code::internal: return "internal";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::string out;
  if (!e.component.empty()) {
    out += e.component;
    out += ": ";
  }
  out += e.message.empty() ? std::string("error") : e.message;
  out += " (";
  out += to_string(e.code);
  if (e.os_error) {
    out += ": ";
    out += e.os_error.message();
  }
  out += ")";
  return out;
}

} // namespace converge::core
