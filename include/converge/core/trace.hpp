#pragma once

/** \file trace.hpp
 *  \brief Opt-in diagnostic trace of ensure stages, written to std::cerr.
 *
 * Enabled when CONVERGE_TRACE is set, non-empty and does not start with '0'.
 * The variable is read once, on the first query; set_trace_enabled() overrides it.
 * Lines have the form "[converge][<component>] <message>".
 */

#include <string_view>

namespace converge::core {

[[nodiscard]] auto trace_enabled() noexcept -> bool;

auto set_trace_enabled(bool enabled) noexcept -> void;

/** \brief Write one trace line if tracing is enabled. Serialized across threads. */
auto trace(std::string_view component, std::string_view message) -> void;

} // namespace converge::core
