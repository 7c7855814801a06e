#include "converge/fs/path_ensurers.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

#include "converge/core/trace.hpp"
#include "converge/ensure.hpp"

namespace converge::fs {

namespace {

using core::error;
using core::error_code;
namespace stdfs = std::filesystem;

constexpr const char* kFileComponent = "fs.file_present";
constexpr const char* kDirectoryComponent = "fs.directory_present";
constexpr const char* kAbsentComponent = "fs.path_absent";

auto last_os_error() -> std::error_code {
  const int e = errno;
  return e != 0 ? std::error_code(e, std::generic_category()) : std::error_code{};
}

auto probe_failed(const char* component, const stdfs::path& p, std::error_code ec) -> error {
  return error{error_code::check_failed, "status probe failed: " + p.string(), component, ec};
}

auto wrong_type(const char* component, const stdfs::path& p, const char* expected_kind) -> error {
  return error{error_code::precondition_failed,
               "path exists but is not a " + std::string(expected_kind) + ": " + p.string(),
               component, {}};
}

// status() also reports a missing path (ENOENT/ENOTDIR) through ec; only
// other errors mean the state could not be determined.
auto probe_status(const stdfs::path& p, bool follow_symlinks)
    -> std::expected<stdfs::file_status, std::error_code> {
  std::error_code ec;
  const auto st = follow_symlinks ? stdfs::status(p, ec) : stdfs::symlink_status(p, ec);
  if (ec && st.type() != stdfs::file_type::not_found) return std::unexpected(ec);
  return st;
}

auto trace_path(const char* component, const char* what, const stdfs::path& p) -> void {
  if (core::trace_enabled()) core::trace(component, std::string(what) + " " + p.string());
}

auto create_file(const stdfs::path& p, const std::string& contents)
    -> std::expected<present_path, error> {
  trace_path(kFileComponent, "creating", p);
  errno = 0;
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out.good()) {
    return std::unexpected(error{error_code::action_failed, "file create failed: " + p.string(),
                                 kFileComponent, last_os_error()});
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  out.flush();
  if (!out.good()) {
    return std::unexpected(error{error_code::action_failed, "file write failed: " + p.string(),
                                 kFileComponent, last_os_error()});
  }
  return assume_existing(p);
}

auto make_directory(const stdfs::path& p) -> std::expected<present_path, error> {
  trace_path(kDirectoryComponent, "creating", p);
  std::error_code ec;
  stdfs::create_directories(p, ec);
  if (ec) {
    return std::unexpected(error{error_code::action_failed, "directory create failed: " + p.string(),
                                 kDirectoryComponent, ec});
  }
  return assume_existing(p);
}

auto remove_path(const stdfs::path& p) -> std::expected<absent_path, error> {
  trace_path(kAbsentComponent, "removing", p);
  std::error_code ec;
  stdfs::remove_all(p, ec);
  if (ec) {
    return std::unexpected(error{error_code::action_failed, "remove failed: " + p.string(),
                                 kAbsentComponent, ec});
  }
  return assume_non_existing(p);
}

} // namespace

auto file_present(stdfs::path path, std::string contents) -> path_check<present_path> {
  return [path = std::move(path), contents = std::move(contents)]() -> path_check_result<present_path> {
    const auto st = probe_status(path, true);
    if (!st) return std::unexpected(probe_failed(kFileComponent, path, st.error()));
    if (stdfs::is_regular_file(*st)) return met(assume_existing(path));
    if (stdfs::exists(*st)) return std::unexpected(wrong_type(kFileComponent, path, "regular file"));
    return unmet(path_action<present_path>([path, contents]() { return create_file(path, contents); }));
  };
}

auto directory_present(stdfs::path path) -> path_check<present_path> {
  return [path = std::move(path)]() -> path_check_result<present_path> {
    const auto st = probe_status(path, true);
    if (!st) return std::unexpected(probe_failed(kDirectoryComponent, path, st.error()));
    if (stdfs::is_directory(*st)) return met(assume_existing(path));
    if (stdfs::exists(*st)) return std::unexpected(wrong_type(kDirectoryComponent, path, "directory"));
    return unmet(path_action<present_path>([path]() { return make_directory(path); }));
  };
}

auto path_absent(stdfs::path path) -> path_check<absent_path> {
  return [path = std::move(path)]() -> path_check_result<absent_path> {
    const auto st = probe_status(path, false);
    if (!st) return std::unexpected(probe_failed(kAbsentComponent, path, st.error()));
    if (!stdfs::exists(*st)) return met(assume_non_existing(path));
    return unmet(path_action<absent_path>([path]() { return remove_path(path); }));
  };
}

auto ensure_file(const stdfs::path& path, std::string contents) -> path_ensure_result<present_path> {
  return converge::ensure(file_present(path, std::move(contents)));
}

auto ensure_directory(const stdfs::path& path) -> path_ensure_result<present_path> {
  return converge::ensure(directory_present(path));
}

auto ensure_absent(const stdfs::path& path) -> path_ensure_result<absent_path> {
  return converge::ensure(path_absent(path));
}

} // namespace converge::fs
