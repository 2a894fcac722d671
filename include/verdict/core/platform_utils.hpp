#pragma once

/** \file platform_utils.hpp
 *  \brief Environment access used for diagnostic switches.
 */

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace verdict::core {

/**
 * \brief Value of environment variable \p name.
 *
 * nullopt when unset or when \p name is null/empty. A variable set to the
 * empty string yields an engaged, empty optional. On Windows the CRT copy is
 * owned and released here; elsewhere std::getenv is only read.
 */
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || name[0] == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    std::size_t len = 0;
    if (_dupenv_s(&raw, &len, name) != 0) {
        std::free(raw);
        return std::nullopt;
    }
    const std::unique_ptr<char, decltype(&std::free)> owned(raw, &std::free);
    if (!owned) return std::nullopt;
    return std::string(owned.get());
#else
    if (const char* v = std::getenv(name)) return std::string(v);
    return std::nullopt;
#endif
}

// Set, non-empty and not starting with '0'. Drives VERDICT_BUILD_DEBUG.
inline bool env_flag(const char* name) noexcept {
    const auto v = safe_getenv(name);
    return v && !v->empty() && v->front() != '0';
}

} // namespace verdict::core
