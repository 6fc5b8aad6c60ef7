#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "revive/core/errors.hpp"
#include "revive/core/types.hpp"

namespace revive::paths {
    using u8 = revive::core::u8;

    enum class PathConvention : u8 {
        Posix = 0,
        Windows = 1,
    };

#if defined(_WIN32)
    inline constexpr PathConvention kNativeConvention = PathConvention::Windows;
#else
    inline constexpr PathConvention kNativeConvention = PathConvention::Posix;
#endif

    // Strips one pair of matching surrounding quotes ('...' or "...").
    [[nodiscard]] std::string dequote(const std::string& s);

    // Expands a leading "~" / "~/" to $HOME, then $VAR and ${VAR}.
    // Unknown variables are left untouched.
    [[nodiscard]] std::string expand_user_and_vars(const std::string& s);

    // Absolute, symlink-resolved where the path exists, lexically normal otherwise.
    [[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path& p);

    // dequote + expand + normalize. Invalid for an empty argument.
    [[nodiscard]] revive::core::Status resolve_user_path(const std::string& raw, std::filesystem::path* out);

    // Converts a history "resource" locator (file:///home/u/x.py, file:///c%3A/x.py,
    // vscode-remote://host/x.py, or a bare path) into a filesystem path string.
    // Pure: no filesystem access, no normalization.
    [[nodiscard]] revive::core::Status locator_to_path(const std::string& locator,
        PathConvention convention,
        std::string* out);

    [[nodiscard]] std::string percent_decode(const std::string& s);

    // Component names below the root, in order: "/a/b/c.py" -> {"a", "b", "c.py"}.
    [[nodiscard]] std::vector<std::string> path_segments(const std::filesystem::path& p);

    // True when p equals root or lies below it (both expected normalized).
    [[nodiscard]] bool path_is_within(const std::filesystem::path& p, const std::filesystem::path& root);

} // namespace revive::paths
