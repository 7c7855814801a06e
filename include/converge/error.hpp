#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - check_failed / action_failed separate a probe that could not complete from
 *   a convergence step that did not succeed.
 * - Human-readable message, originating component and the OS error (if any)
 *   for diagnostics.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace converge::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  precondition_failed = 4001,
  check_failed = 4101,
  action_failed = 4102,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "fs.file_present" */
  std::error_code os_error{};              /**< OS-level cause; empty when not applicable */
};

/** \brief Stable lowercase name of a code, e.g. "check_failed". */
[[nodiscard]] auto to_string(error_code code) noexcept -> std::string_view;

/** \brief One-line rendering: "<component>: <message> (<code>[: <os message>])". */
[[nodiscard]] auto describe(const error& e) -> std::string;

} // namespace converge::core
