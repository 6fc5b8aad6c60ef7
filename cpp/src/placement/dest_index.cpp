#include "revive/placement/dest_index.hpp"

#include <system_error>

namespace revive::placement {
    namespace fs = std::filesystem;

    namespace {
        const std::vector<fs::path> kNoCandidates{};
    } // namespace

    revive::core::Status DestinationIndex::build(const fs::path& root, u64 max_files) {
        clear();
        built_ = true;

        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            return revive::core::ok_status();
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return revive::core::make_status(revive::core::StatusDomain::Placement,
                revive::core::StatusCode::Io,
                static_cast<revive::core::u32>(ec.value()));
        }

        fs::recursive_directory_iterator end;
        for (; it != end; it.increment(ec)) {
            if (ec) {
                ec.clear();
                continue;
            }
            const fs::directory_entry& de = *it;
            if (de.is_directory(ec)) {
                continue;
            }
            ec.clear();

            if (file_count_ >= max_files) {
                truncated_ = true;
                break;
            }
            by_name_[de.path().filename().string()].push_back(de.path());
            ++file_count_;
        }
        return revive::core::ok_status();
    }

    const std::vector<fs::path>& DestinationIndex::candidates(const std::string& filename) const {
        const auto it = by_name_.find(filename);
        if (it == by_name_.end()) {
            return kNoCandidates;
        }
        return it->second;
    }

    void DestinationIndex::clear() noexcept {
        by_name_.clear();
        file_count_ = 0;
        built_ = false;
        truncated_ = false;
    }
} // namespace revive::placement
