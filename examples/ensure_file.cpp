/**
 * Ensure-a-file example using converge
 *
 * This example demonstrates:
 * - Using a ready-made filesystem check (file_present)
 * - Writing a custom check closure with a fallible probe and action
 * - Reading the unified result: nothing to do vs. now met vs. failure
 *
 * Usage: converge_example_ensure_file <path> [contents]
 * Set CONVERGE_TRACE=1 to see each stage on stderr.
 */

#include <converge/converge.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace converge;

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <path> [contents]" << std::endl;
        return 2;
    }
    const std::filesystem::path target = argv[1];
    const std::string contents = argc > 2 ? argv[2] : "";

    // 1) The parent directory, through a ready-made check
    if (target.has_parent_path()) {
        auto dir = fs::ensure_directory(target.parent_path());
        if (!dir) {
            std::cerr << "Error: " << core::describe(dir.error()) << std::endl;
            return 1;
        }
    }

    // 2) The file itself
    auto file = fs::ensure_file(target, contents);
    if (!file) {
        std::cerr << "Error: " << core::describe(file.error()) << std::endl;
        return 1;
    }
    std::cout << target.string()
              << (file->is_nothing_to_do() ? ": already present" : ": created") << std::endl;

    // 3) A custom check: the file must not be empty when contents were given
    auto non_empty = [&]() -> std::expected<check_outcome<std::uintmax_t, action<std::expected<std::uintmax_t, core::error>>>, core::error> {
        std::error_code ec;
        const auto size = std::filesystem::file_size(target, ec);
        if (ec) return std::unexpected(core::error{core::error_code::check_failed, "file_size failed", "example", ec});
        if (size > 0 || contents.empty()) return met(size);
        return unmet(action<std::expected<std::uintmax_t, core::error>>([&]() -> std::expected<std::uintmax_t, core::error> {
            auto refreshed = ensure(fs::path_absent(target));
            if (!refreshed) return std::unexpected(refreshed.error());
            auto rewritten = fs::ensure_file(target, contents);
            if (!rewritten) return std::unexpected(rewritten.error());
            return static_cast<std::uintmax_t>(contents.size());
        }));
    };

    auto sized = ensure(non_empty);
    if (!sized) {
        std::cerr << "Error: " << core::describe(sized.error()) << std::endl;
        return 1;
    }
    std::cout << "size: " << sized->value() << " bytes"
              << (sized->is_now_met() ? " (rewritten)" : "") << std::endl;
    return 0;
}
