#pragma once

/** \file path_ensurers.hpp
 *  \brief Ready-made checks for filesystem paths.
 *
 * Each factory returns a check callable; each ensure_* helper runs it through
 * converge::ensure(). Checks and actions are fallible and report core::error:
 * - the status probe failing (permission denied, symlink loop, ...) is check_failed;
 * - the path existing with the wrong type is precondition_failed;
 * - the convergence step failing is action_failed.
 * The OS error, when there is one, is kept in error::os_error.
 *
 * Nothing here locks the path: another process may change it between the
 * check and the action.
 */

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

#include "converge/error.hpp"
#include "converge/outcome.hpp"

namespace converge::fs {

using present_path = existing<std::filesystem::path>;
using absent_path = non_existing<std::filesystem::path>;

template <class Witness>
using path_action = action<std::expected<Witness, core::error>>;

template <class Witness>
using path_check_result = std::expected<check_outcome<Witness, path_action<Witness>>, core::error>;

template <class Witness>
using path_check = std::function<path_check_result<Witness>()>;

template <class Witness>
using path_ensure_result = std::expected<meet_result<Witness, Witness>, core::error>;

/** \brief Met when `path` is a regular file; otherwise creates it holding `contents`. */
[[nodiscard]] auto file_present(std::filesystem::path path, std::string contents = {})
    -> path_check<present_path>;

/** \brief Met when `path` is a directory; otherwise creates it and any missing parents. */
[[nodiscard]] auto directory_present(std::filesystem::path path) -> path_check<present_path>;

/** \brief Met when nothing exists at `path` (a dangling symlink counts as existing); otherwise removes it recursively. */
[[nodiscard]] auto path_absent(std::filesystem::path path) -> path_check<absent_path>;

auto ensure_file(const std::filesystem::path& path, std::string contents = {})
    -> path_ensure_result<present_path>;

auto ensure_directory(const std::filesystem::path& path) -> path_ensure_result<present_path>;

auto ensure_absent(const std::filesystem::path& path) -> path_ensure_result<absent_path>;

} // namespace converge::fs
