#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "revive/core/errors.hpp"
#include "revive/core/types.hpp"

namespace revive::placement {
    using u64 = revive::core::u64;

    // Base filename -> every path under the indexed root carrying that name.
    // A snapshot of the tree at build() time; later writes are not seen.
    class DestinationIndex {
    public:
        DestinationIndex() = default;

        // Walks `root` (missing root -> empty index). Stops after `max_files`
        // entries and marks the index truncated. Replaces any previous contents.
        [[nodiscard]] revive::core::Status build(const std::filesystem::path& root, u64 max_files);

        // Empty vector when nothing carries `filename`.
        [[nodiscard]] const std::vector<std::filesystem::path>& candidates(const std::string& filename) const;

        [[nodiscard]] bool built() const noexcept { return built_; }
        [[nodiscard]] bool truncated() const noexcept { return truncated_; }
        [[nodiscard]] u64 file_count() const noexcept { return file_count_; }

        void clear() noexcept;

    private:
        std::unordered_map<std::string, std::vector<std::filesystem::path>> by_name_;
        u64 file_count_{0};
        bool built_{false};
        bool truncated_{false};
    };

} // namespace revive::placement
