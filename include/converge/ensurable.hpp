#pragma once

/** \file ensurable.hpp
 *  \brief Capability contract: "can be ensured into its target state".
 *
 * - ensurable<Result> is the runtime interface: one operation, ensure(), taking
 *   no input (the entity captures what it needs) and returning the unified result.
 * - ensure_traits<F> derives that result type from a check callable F.
 * - closure_adapter<F> makes any check callable satisfy ensurable<>.
 *
 * Result derivation for a check F returning check_outcome<M, A> (optionally
 * wrapped in std::expected<..., E1>) whose action A returns R (optionally
 * std::expected<R, E2>):
 *   now_met_type = R, or std::monostate when R is void
 *   error_type   = E2 if the action is fallible, else E1 if the check is, else void
 *   result_type  = meet_result<M, now_met_type>, wrapped in
 *                  std::expected<..., error_type> unless error_type is void
 * When both steps are fallible E1 must convert to E2.
 */

#include <expected>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

#include "converge/core/trace.hpp"
#include "converge/outcome.hpp"

namespace converge {

template <class T> struct is_expected : std::false_type {};
template <class T, class E> struct is_expected<std::expected<T, E>> : std::true_type {};
template <class T>
inline constexpr bool is_expected_v = is_expected<std::remove_cvref_t<T>>::value;

namespace detail {

template <class R>
struct check_result_traits {
  static constexpr bool valid = false;
};

template <class M, class A>
struct check_result_traits<check_outcome<M, A>> {
  static constexpr bool valid = true;
  static constexpr bool fallible = false;
  using outcome_type = check_outcome<M, A>;
  using error_type = void;
};

template <class M, class A, class E>
struct check_result_traits<std::expected<check_outcome<M, A>, E>> {
  static constexpr bool valid = true;
  static constexpr bool fallible = true;
  using outcome_type = check_outcome<M, A>;
  using error_type = E;
};

template <class R>
struct action_result_traits {
  static constexpr bool fallible = false;
  using value_type = R;
  using error_type = void;
};

template <>
struct action_result_traits<void> {
  static constexpr bool fallible = false;
  using value_type = std::monostate;
  using error_type = void;
};

template <class T, class E>
struct action_result_traits<std::expected<T, E>> {
  static constexpr bool fallible = true;
  using value_type = T;
  using error_type = E;
};

template <class E>
struct action_result_traits<std::expected<void, E>> {
  static constexpr bool fallible = true;
  using value_type = std::monostate;
  using error_type = E;
};

template <class CheckError, class ActionError>
struct unified_error { using type = ActionError; };

template <class CheckError>
struct unified_error<CheckError, void> { using type = CheckError; };

template <class U, class E>
struct wrap_result { using type = std::expected<U, E>; };

template <class U>
struct wrap_result<U, void> { using type = U; };

template <class T, class = void>
struct has_member_ensure : std::false_type {};
template <class T>
struct has_member_ensure<T, std::void_t<decltype(std::declval<T&>().ensure())>> : std::true_type {};

template <class T, class = void>
struct has_member_check : std::false_type {};
template <class T>
struct has_member_check<T, std::void_t<decltype(std::declval<T&>().check())>> : std::true_type {};

} // namespace detail

/** \brief True when F is callable with no arguments and returns a (possibly fallible) check_outcome. */
template <class F, class = void>
struct is_check_callable : std::false_type {};

template <class F>
struct is_check_callable<F, std::enable_if_t<std::is_invocable_v<F&>>>
    : std::bool_constant<
          detail::check_result_traits<std::remove_cvref_t<std::invoke_result_t<F&>>>::valid> {};

template <class F>
inline constexpr bool is_check_callable_v = is_check_callable<std::remove_reference_t<F>>::value;

/** \brief Types involved in ensuring through check callable F. */
template <class F>
struct ensure_traits {
  static_assert(is_check_callable_v<F>,
                "a check must be callable with no arguments and return check_outcome<M, A> "
                "or std::expected<check_outcome<M, A>, E>");

  using check_result_type = std::remove_cvref_t<std::invoke_result_t<F&>>;
  using check_traits = detail::check_result_traits<check_result_type>;
  using outcome_type = typename check_traits::outcome_type;
  using met_type = typename outcome_type::met_type;
  using action_type = typename outcome_type::action_type;
  using action_result_type = std::invoke_result_t<action_type&&>;
  using action_traits = detail::action_result_traits<std::remove_cvref_t<action_result_type>>;
  using now_met_type = typename action_traits::value_type;

  static constexpr bool check_fallible = check_traits::fallible;
  static constexpr bool action_fallible = action_traits::fallible;

  using check_error_type = typename check_traits::error_type;
  using action_error_type = typename action_traits::error_type;
  using error_type = typename detail::unified_error<check_error_type, action_error_type>::type;

  static_assert(!(check_fallible && action_fallible) ||
                    std::is_convertible_v<check_error_type, action_error_type>,
                "the check's error type must convert to the action's error type");

  using unified_type = meet_result<met_type, now_met_type>;
  using result_type = typename detail::wrap_result<unified_type, error_type>::type;
};

template <class F>
using ensure_result_t = typename ensure_traits<F>::result_type;

namespace detail {

/** \brief Converging half of an ensure: branch on the outcome, run the action at most once. */
template <class Traits, class Outcome>
auto converge_outcome(Outcome&& outcome) -> typename Traits::result_type {
  using unified = typename Traits::unified_type;
  using result = typename Traits::result_type;

  if (outcome.is_met()) {
    core::trace("ensure", "check reported met; nothing to do");
    return result(unified::nothing_to_do(std::move(outcome).witness()));
  }

  core::trace("ensure", "check reported unmet; running action");
  auto convergence = std::move(outcome).take_action();

  if constexpr (Traits::action_fallible) {
    auto done = std::invoke(std::move(convergence));
    if (!done) {
      core::trace("ensure", "action failed");
      return std::unexpected<typename Traits::error_type>(std::move(done).error());
    }
    core::trace("ensure", "action succeeded; now met");
    if constexpr (std::is_void_v<typename decltype(done)::value_type>) {
      return result(unified::now_met(std::monostate{}));
    } else {
      return result(unified::now_met(std::move(*done)));
    }
  } else if constexpr (std::is_void_v<typename Traits::action_result_type>) {
    std::invoke(std::move(convergence));
    core::trace("ensure", "action completed; now met");
    return result(unified::now_met(std::monostate{}));
  } else {
    auto done = std::invoke(std::move(convergence));
    core::trace("ensure", "action completed; now met");
    return result(unified::now_met(std::move(done)));
  }
}

/** \brief Evaluating half of an ensure: invoke the check exactly once. */
template <class F>
auto run_check(F& check) -> ensure_result_t<F> {
  using traits = ensure_traits<F>;

  core::trace("ensure", "evaluating check");
  auto checked = std::invoke(check);

  if constexpr (traits::check_fallible) {
    if (!checked) {
      core::trace("ensure", "check failed; action not run");
      return std::unexpected<typename traits::error_type>(std::move(checked).error());
    }
    return converge_outcome<traits>(std::move(*checked));
  } else {
    return converge_outcome<traits>(std::move(checked));
  }
}

} // namespace detail

/** \brief Runtime capability interface. */
template <class Result>
class ensurable {
public:
  using result_type = Result;

  virtual ~ensurable() = default;

  /** Check the target state once and, only if unmet, converge once. */
  virtual auto ensure() -> Result = 0;
};

/** \brief Adapts a check callable to ensurable<>. Each ensure() call invokes the check once. */
template <class F>
class closure_adapter final : public ensurable<ensure_result_t<F>> {
public:
  explicit closure_adapter(F check) : check_(std::move(check)) {}

  auto ensure() -> ensure_result_t<F> override { return detail::run_check(check_); }

private:
  F check_;
};

template <class F>
[[nodiscard]] auto make_ensurable(F check) -> closure_adapter<F> {
  return closure_adapter<F>(std::move(check));
}

/** \brief Heap-allocated adapter behind the interface, for heterogeneous collections. */
template <class F>
[[nodiscard]] auto make_unique_ensurable(F check) -> std::unique_ptr<ensurable<ensure_result_t<F>>> {
  return std::make_unique<closure_adapter<F>>(std::move(check));
}

} // namespace converge
