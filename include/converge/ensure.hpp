#pragma once

/** \file ensure.hpp
 *  \brief Driver: ensure(entity) and the unwrap-or-throw policy.
 *
 * ensure() accepts, in order of preference:
 *  1. anything with a member ensure() (every ensurable<R>, every closure_adapter);
 *  2. anything with a member check() returning a (possibly fallible) check_outcome;
 *  3. a bare check callable.
 * The result is returned unchanged; nothing is retried or recovered.
 */

#include <expected>
#include <type_traits>
#include <utility>

#include "converge/core/trace.hpp"
#include "converge/ensurable.hpp"

namespace converge {

template <class Entity>
[[nodiscard]] auto ensure(Entity&& entity) {
  using entity_type = std::remove_reference_t<Entity>;
  if constexpr (detail::has_member_ensure<entity_type>::value) {
    return entity.ensure();
  } else if constexpr (detail::has_member_check<entity_type>::value) {
    auto check = [&entity]() { return entity.check(); };
    return detail::run_check(check);
  } else {
    static_assert(is_check_callable_v<entity_type>,
                  "ensure() needs an ensurable, an entity with check(), or a check callable");
    return detail::run_check(entity);
  }
}

/**
 * \brief ensure() for callers that treat failure as fatal.
 *
 * Returns the meet_result directly. A failure is traced and rethrown as
 * std::bad_expected_access<E> carrying the error.
 */
template <class Entity>
[[nodiscard]] auto ensure_or_throw(Entity&& entity) {
  auto result = ensure(std::forward<Entity>(entity));
  if constexpr (is_expected_v<decltype(result)>) {
    if (!result) core::trace("ensure", "failure escalated by ensure_or_throw");
    return std::move(result).value();
  } else {
    return result;
  }
}

} // namespace converge
