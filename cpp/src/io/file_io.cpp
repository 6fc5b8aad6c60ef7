#include "revive/io/file_io.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>

namespace revive::io {
    using revive::core::make_status;
    using revive::core::ok_status;
    using revive::core::Status;
    using revive::core::StatusCode;
    using revive::core::StatusDomain;
    using revive::core::u32;

    namespace {
        constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

        [[nodiscard]] StatusCode open_error_code(int err) noexcept {
            switch (err) {
                case ENOENT:
                case ENOTDIR: return StatusCode::NotFound;
                case EACCES:
                case EPERM:
                case EROFS: return StatusCode::PermissionDenied;
                default: return StatusCode::Io;
            }
        }

        [[nodiscard]] bool in_range(unsigned char c, unsigned char lo, unsigned char hi) noexcept {
            return c >= lo && c <= hi;
        }
    } // namespace

    Status read_file(const std::filesystem::path& path, std::string* out) {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        out->clear();

        const std::string p = path.string();
        FILE* f = std::fopen(p.c_str(), "rb");
        if (!f) {
            const int err = errno;
            return make_status(StatusDomain::Core, open_error_code(err), static_cast<u32>(err));
        }

        char buf[64 * 1024];
        for (;;) {
            const size_t n = std::fread(buf, 1, sizeof(buf), f);
            if (n > 0) {
                out->append(buf, n);
            }
            if (n < sizeof(buf)) {
                break;
            }
        }

        const bool failed = std::ferror(f) != 0;
        const int err = errno;
        std::fclose(f);
        if (failed) {
            out->clear();
            return make_status(StatusDomain::Core, StatusCode::Io, static_cast<u32>(err));
        }
        return ok_status();
    }

    Status write_file(const std::filesystem::path& path, const std::string& data) {
        const std::string p = path.string();
        FILE* f = std::fopen(p.c_str(), "wb");
        if (!f) {
            const int err = errno;
            return make_status(StatusDomain::Core, open_error_code(err), static_cast<u32>(err));
        }

        const size_t written = data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), f);
        const int write_err = errno;
        if (written != data.size()) {
            std::fclose(f);
            return make_status(StatusDomain::Core, StatusCode::Io, static_cast<u32>(write_err));
        }
        if (std::fclose(f) != 0) {
            return make_status(StatusDomain::Core, StatusCode::Io, static_cast<u32>(errno));
        }
        return ok_status();
    }

    Status ensure_directory(const std::filesystem::path& dir) {
        std::error_code ec;
        if (std::filesystem::is_directory(dir, ec)) {
            return ok_status();
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return make_status(StatusDomain::Core, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        return ok_status();
    }

    std::string utf8_sanitize(const std::string& bytes) {
        std::string out;
        out.reserve(bytes.size());

        const size_t n = bytes.size();
        size_t i = 0;
        while (i < n) {
            const unsigned char c = static_cast<unsigned char>(bytes[i]);
            if (c < 0x80) {
                out.push_back(static_cast<char>(c));
                ++i;
                continue;
            }

            size_t len = 0;
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;
            if (in_range(c, 0xC2, 0xDF)) {
                len = 2;
            } else if (c == 0xE0) {
                len = 3;
                lo = 0xA0;
            } else if (in_range(c, 0xE1, 0xEC) || in_range(c, 0xEE, 0xEF)) {
                len = 3;
            } else if (c == 0xED) {
                len = 3;
                hi = 0x9F;
            } else if (c == 0xF0) {
                len = 4;
                lo = 0x90;
            } else if (in_range(c, 0xF1, 0xF3)) {
                len = 4;
            } else if (c == 0xF4) {
                len = 4;
                hi = 0x8F;
            } else {
                out += kReplacementChar;
                ++i;
                continue;
            }

            // Consume the longest valid prefix; a broken sequence becomes one U+FFFD.
            size_t k = 1;
            while (k < len && i + k < n) {
                const unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
                const bool ok = (k == 1) ? in_range(cc, lo, hi) : in_range(cc, 0x80, 0xBF);
                if (!ok) {
                    break;
                }
                ++k;
            }

            if (k == len) {
                out.append(bytes, i, len);
            } else {
                out += kReplacementChar;
            }
            i += k;
        }
        return out;
    }
} // namespace revive::io
