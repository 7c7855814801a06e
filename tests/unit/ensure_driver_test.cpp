#include <catch2/catch_test_macros.hpp>
#include <converge/ensure.hpp>
#include <converge/error.hpp>
#include <tests/support/counting_checks.hpp>

#include <expected>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

using namespace converge;
using counting_checks::action_error;
using counting_checks::call_counts;
using counting_checks::probe_error;
using counting_checks::promise;

TEST_CASE("fallible check and action: all four branches", "[ensure]") {
  using result_t = std::expected<meet_result<std::uint8_t, std::uint16_t>, action_error>;

  SECTION("met") {
    call_counts c;
    auto r = ensure(promise(c, true, false));
    STATIC_REQUIRE(std::is_same_v<decltype(r), result_t>);
    REQUIRE(r.has_value());
    REQUIRE(r->is_nothing_to_do());
    REQUIRE(r->nothing_to_do_value() == 1);
    REQUIRE(c.checks == 1);
    REQUIRE(c.actions == 0);
  }
  SECTION("check fails") {
    call_counts c;
    auto r = ensure(promise(c, true, true));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == 2);
    REQUIRE(c.checks == 1);
    REQUIRE(c.actions == 0);
  }
  SECTION("unmet, action succeeds") {
    call_counts c;
    auto r = ensure(promise(c, false, false));
    REQUIRE(r.has_value());
    REQUIRE(r->is_now_met());
    REQUIRE(r->now_met_value() == 3);
    REQUIRE(c.checks == 1);
    REQUIRE(c.actions == 1);
  }
  SECTION("unmet, action fails") {
    call_counts c;
    auto r = ensure(promise(c, false, true));
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == 4);
    REQUIRE(c.checks == 1);
    REQUIRE(c.actions == 1);
  }
}

TEST_CASE("infallible check and action yield a bare meet_result", "[ensure]") {
  int actions = 0;
  bool present = false;
  auto check = [&]() -> check_outcome<std::string, action<std::string>> {
    if (present) return met(std::string("already"));
    return unmet(action<std::string>([&] { ++actions; present = true; return std::string("created"); }));
  };

  auto first = ensure(check);
  STATIC_REQUIRE(std::is_same_v<decltype(first), meet_result<std::string, std::string>>);
  REQUIRE(first.is_now_met());
  REQUIRE(first.value() == "created");

  auto second = ensure(check);
  REQUIRE(second.is_nothing_to_do());
  REQUIRE(second.value() == "already");
  REQUIRE(actions == 1);
}

TEST_CASE("void action maps to a unit result", "[ensure]") {
  int actions = 0;
  auto check = [&]() -> check_outcome<std::monostate, action<void>> {
    return unmet(action<void>([&] { ++actions; }));
  };
  auto r = ensure(check);
  STATIC_REQUIRE(std::is_same_v<decltype(r), meet_result<std::monostate, std::monostate>>);
  REQUIRE(r.is_now_met());
  REQUIRE(actions == 1);
}

TEST_CASE("only the check is fallible: error type comes from the check", "[ensure]") {
  using check_result = std::expected<check_outcome<int, action<int>>, std::string>;
  int actions = 0;

  auto failing = [&]() -> check_result { return std::unexpected(std::string("probe refused")); };
  auto r = ensure(failing);
  STATIC_REQUIRE(std::is_same_v<decltype(r), std::expected<meet_result<int, int>, std::string>>);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error() == "probe refused");

  auto unmet_check = [&]() -> check_result {
    return unmet(action<int>([&] { ++actions; return 11; }));
  };
  auto ok = ensure(unmet_check);
  REQUIRE(ok.has_value());
  REQUIRE(ok->value() == 11);
  REQUIRE(actions == 1);
}

TEST_CASE("only the action is fallible: error type comes from the action", "[ensure]") {
  using fallible_action = action<std::expected<void, core::error>>;
  auto check = []() -> check_outcome<std::monostate, fallible_action> {
    return unmet(fallible_action([]() -> std::expected<void, core::error> {
      return std::unexpected(core::error{core::error_code::action_failed, "write failed", "test"});
    }));
  };
  auto r = ensure(check);
  STATIC_REQUIRE(std::is_same_v<decltype(r),
                                std::expected<meet_result<std::monostate, std::monostate>, core::error>>);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::action_failed);
  REQUIRE(r.error().message == "write failed");
}

TEST_CASE("check error is converted into the action error type", "[ensure]") {
  call_counts c;
  auto r = ensure(promise(c, true, true));
  STATIC_REQUIRE(std::is_same_v<decltype(r)::error_type, action_error>);
  REQUIRE(r.error().code == 2);
}

TEST_CASE("exceptions thrown by the check propagate and skip the action", "[ensure]") {
  int actions = 0;
  auto check = [&]() -> check_outcome<int, action<int>> {
    throw std::runtime_error("probe crashed");
  };
  REQUIRE_THROWS_AS(ensure(check), std::runtime_error);
  REQUIRE(actions == 0);
}

TEST_CASE("ensure_or_throw unwraps success", "[ensure]") {
  call_counts c;
  auto r = ensure_or_throw(promise(c, false, false));
  STATIC_REQUIRE(std::is_same_v<decltype(r), meet_result<std::uint8_t, std::uint16_t>>);
  REQUIRE(r.now_met_value() == 3);
}

TEST_CASE("ensure_or_throw escalates failure", "[ensure]") {
  call_counts c;
  REQUIRE_THROWS_AS(ensure_or_throw(promise(c, false, true)), std::bad_expected_access<action_error>);
  REQUIRE(c.actions == 1);

  try {
    (void)ensure_or_throw(promise(c, true, true));
    FAIL("expected an exception");
  } catch (const std::bad_expected_access<action_error>& e) {
    REQUIRE(e.error().code == 2);
  }
}

TEST_CASE("ensure_or_throw passes infallible results through", "[ensure]") {
  auto check = []() -> check_outcome<int, action<int>> { return met(5); };
  auto r = ensure_or_throw(check);
  STATIC_REQUIRE(std::is_same_v<decltype(r), meet_result<int, int>>);
  REQUIRE(r.value() == 5);
}
