#pragma once

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace converge::core {

// Environment lookup used for configuration switches (CONVERGE_TRACE).
// Returns std::nullopt if the variable is not set; an engaged empty string if
// it is set but empty. On Windows the _dupenv_s buffer is owned by a
// unique_ptr and released on every path.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&raw, &len, name);
    std::unique_ptr<char, decltype(&std::free)> owned(raw, &std::free);
    if (err != 0 || !owned) return std::nullopt;
    return std::string(owned.get());
#else
    const char* v = std::getenv(name);
    return v ? std::optional<std::string>(v) : std::nullopt;
#endif
}

// Boolean switch: set, non-empty and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    const auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

} // namespace converge::core
