#pragma once

/** \file outcome.hpp
 *  \brief Result model: the outcome of a state check and the unified result of an ensure.
 *
 * A check produces a check_outcome<M, A> in one of two shapes:
 * - met:   the target state already holds; carries a witness of type M.
 * - unmet: the target state does not hold; carries a zero-argument action A
 *          that performs the convergence.
 * A fallible check returns std::expected<check_outcome<M, A>, E> instead.
 *
 * The action inside an unmet outcome is invoked at most once, by the driver
 * (see ensure.hpp), never by the check that produced it.
 *
 * meet_result<N, M> is what ensure() hands back: nothing_to_do(N) when the
 * check reported met, now_met(M) when the action ran.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace converge {

/** \brief Nameable type for a deferred convergence action producing R. */
template <class R>
using action = std::function<R()>;

/** \brief Payload of the met branch. */
template <class M>
struct met_t {
  M value;
};

/** \brief Payload of the unmet branch. */
template <class A>
struct unmet_t {
  A action;
};

template <class M>
[[nodiscard]] auto met(M value) -> met_t<M> {
  return met_t<M>{std::move(value)};
}

/** \brief Met with a unit witness. */
[[nodiscard]] inline auto met() -> met_t<std::monostate> {
  return met_t<std::monostate>{};
}

template <class A>
[[nodiscard]] auto unmet(A convergence) -> unmet_t<A> {
  static_assert(std::is_invocable_v<A&&>, "unmet() requires a zero-argument callable");
  return unmet_t<A>{std::move(convergence)};
}

/** \brief Outcome of a single state check. */
template <class M, class A>
class check_outcome {
public:
  using met_type = M;
  using action_type = A;

  template <class U, std::enable_if_t<std::is_constructible_v<M, U&&>, int> = 0>
  check_outcome(met_t<U> m)
      : state_(std::in_place_index<0>, std::move(m.value)) {}

  template <class B, std::enable_if_t<std::is_constructible_v<A, B&&>, int> = 0>
  check_outcome(unmet_t<B> u)
      : state_(std::in_place_index<1>, std::move(u.action)) {}

  [[nodiscard]] auto is_met() const noexcept -> bool { return state_.index() == 0; }
  [[nodiscard]] auto is_unmet() const noexcept -> bool { return state_.index() == 1; }

  /** \brief Witness of the met branch. Throws std::bad_variant_access when unmet. */
  [[nodiscard]] auto witness() const& -> const M& { return std::get<0>(state_); }
  [[nodiscard]] auto witness() && -> M { return std::get<0>(std::move(state_)); }

  /** \brief Move the convergence action out. Throws std::bad_variant_access when met. */
  [[nodiscard]] auto take_action() && -> A { return std::get<1>(std::move(state_)); }

private:
  std::variant<M, A> state_;
};

/** \brief Which branch an ensure took. */
enum class meet_kind : std::uint8_t { nothing_to_do, now_met };

/** \brief Unified result of an ensure: the witness or the action's result. */
template <class N, class M>
class meet_result {
public:
  using witness_type = N;
  using now_met_type = M;

  [[nodiscard]] static auto nothing_to_do(N witness) -> meet_result {
    return meet_result(std::in_place_index<0>, std::move(witness));
  }
  [[nodiscard]] static auto now_met(M result) -> meet_result {
    return meet_result(std::in_place_index<1>, std::move(result));
  }

  [[nodiscard]] auto kind() const noexcept -> meet_kind {
    return state_.index() == 0 ? meet_kind::nothing_to_do : meet_kind::now_met;
  }
  [[nodiscard]] auto is_nothing_to_do() const noexcept -> bool { return state_.index() == 0; }
  [[nodiscard]] auto is_now_met() const noexcept -> bool { return state_.index() == 1; }

  [[nodiscard]] auto nothing_to_do_value() const& -> const N& { return std::get<0>(state_); }
  [[nodiscard]] auto nothing_to_do_value() && -> N { return std::get<0>(std::move(state_)); }
  [[nodiscard]] auto now_met_value() const& -> const M& { return std::get<1>(state_); }
  [[nodiscard]] auto now_met_value() && -> M { return std::get<1>(std::move(state_)); }

  /** \brief Either branch as std::common_type_t<N, M>; ill-formed when N and M have none. */
  template <class N2 = N, class M2 = M>
  [[nodiscard]] auto value() const& -> std::common_type_t<N2, M2> {
    using common = std::common_type_t<N2, M2>;
    if (state_.index() == 0) return static_cast<common>(std::get<0>(state_));
    return static_cast<common>(std::get<1>(state_));
  }
  template <class N2 = N, class M2 = M>
  [[nodiscard]] auto value() && -> std::common_type_t<N2, M2> {
    using common = std::common_type_t<N2, M2>;
    if (state_.index() == 0) return static_cast<common>(std::get<0>(std::move(state_)));
    return static_cast<common>(std::get<1>(std::move(state_)));
  }

private:
  template <std::size_t I, class T>
  meet_result(std::in_place_index_t<I> tag, T&& v) : state_(tag, std::forward<T>(v)) {}

  std::variant<N, M> state_;
};

/** \brief A value known to refer to something that exists. */
template <class T>
struct existing {
  T value;
  friend auto operator==(const existing&, const existing&) -> bool = default;
};

/** \brief A value known to refer to something that does not exist. */
template <class T>
struct non_existing {
  T value;
  friend auto operator==(const non_existing&, const non_existing&) -> bool = default;
};

template <class T>
[[nodiscard]] auto assume_existing(T value) -> existing<T> {
  return existing<T>{std::move(value)};
}

template <class T>
[[nodiscard]] auto assume_non_existing(T value) -> non_existing<T> {
  return non_existing<T>{std::move(value)};
}

} // namespace converge
