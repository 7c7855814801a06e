#include "converge/converge.hpp"
#include "converge/core/platform_utils.hpp"
#include "converge/core/trace.hpp"
#include <iostream>

int main() {
  auto check = []() -> converge::check_outcome<int, converge::action<int>> { return converge::met(1); };
  auto r = converge::ensure(check); (void)r;
  (void)converge::core::trace_enabled();
  (void)converge::core::to_string(converge::core::error_code::ok);
  std::cout << "Headers compile" << std::endl;
  return 0;
}
