#pragma once

#include <filesystem>
#include <string>

#include "revive/core/errors.hpp"

namespace revive::io {

    // Reads the whole file as raw bytes. NotFound when it cannot be opened,
    // Io (aux = errno) on a short read.
    [[nodiscard]] revive::core::Status read_file(const std::filesystem::path& path, std::string* out);

    // Truncates and writes `data`. PermissionDenied when the file cannot be
    // opened for writing, Io (aux = errno) on a short write or close failure.
    [[nodiscard]] revive::core::Status write_file(const std::filesystem::path& path, const std::string& data);

    // create_directories that tolerates an existing directory.
    [[nodiscard]] revive::core::Status ensure_directory(const std::filesystem::path& dir);

    // Decodes UTF-8, replacing each maximal invalid subsequence with U+FFFD.
    // Valid input is returned unchanged.
    [[nodiscard]] std::string utf8_sanitize(const std::string& bytes);

} // namespace revive::io
