#include "revive/paths/resolver.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace revive::paths {
    namespace fs = std::filesystem;

    namespace {
        [[nodiscard]] bool is_var_char(char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        // A URI scheme is at least two characters so "C:/x" stays a drive path.
        [[nodiscard]] size_t scheme_length(const std::string& s) noexcept {
            const size_t colon = s.find(':');
            if (colon == std::string::npos || colon < 2) {
                return 0;
            }
            if (std::isalpha(static_cast<unsigned char>(s[0])) == 0) {
                return 0;
            }
            for (size_t i = 1; i < colon; ++i) {
                const char c = s[i];
                if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '+' && c != '-' && c != '.') {
                    return 0;
                }
            }
            return colon;
        }
    } // namespace

    std::string dequote(const std::string& s) {
        if (s.size() >= 2) {
            const char first = s.front();
            const char last = s.back();
            if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
                return s.substr(1, s.size() - 2);
            }
        }
        return s;
    }

    std::string expand_user_and_vars(const std::string& s) {
        std::string in = s;
        if (!in.empty() && in[0] == '~' && (in.size() == 1 || in[1] == '/' || in[1] == '\\')) {
            const char* home = std::getenv("HOME");
#if defined(_WIN32)
            if (home == nullptr) {
                home = std::getenv("USERPROFILE");
            }
#endif
            if (home != nullptr) {
                in = std::string(home) + in.substr(1);
            }
        }

        std::string out;
        out.reserve(in.size());
        size_t i = 0;
        while (i < in.size()) {
            if (in[i] != '$' || i + 1 >= in.size()) {
                out.push_back(in[i++]);
                continue;
            }

            size_t name_begin = 0;
            size_t name_end = 0;
            size_t next = 0;
            if (in[i + 1] == '{') {
                const size_t close = in.find('}', i + 2);
                if (close == std::string::npos) {
                    out.push_back(in[i++]);
                    continue;
                }
                name_begin = i + 2;
                name_end = close;
                next = close + 1;
            } else {
                name_begin = i + 1;
                name_end = name_begin;
                while (name_end < in.size() && is_var_char(in[name_end])) {
                    ++name_end;
                }
                next = name_end;
            }

            if (name_end == name_begin) {
                out.push_back(in[i++]);
                continue;
            }

            const std::string name = in.substr(name_begin, name_end - name_begin);
            const char* value = std::getenv(name.c_str());
            if (value != nullptr) {
                out += value;
            } else {
                out.append(in, i, next - i);
            }
            i = next;
        }
        return out;
    }

    fs::path normalize_path(const fs::path& p) {
        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        if (ec) {
            abs = p;
        }
        fs::path out = fs::weakly_canonical(abs, ec);
        if (ec) {
            out = abs.lexically_normal();
        }
        // "/a/b/" -> "/a/b"
        if (out.has_relative_path() && out.filename().empty()) {
            out = out.parent_path();
        }
        return out;
    }

    revive::core::Status resolve_user_path(const std::string& raw, fs::path* out) {
        if (out == nullptr) {
            return revive::core::make_status(revive::core::StatusDomain::Paths, revive::core::StatusCode::Invalid);
        }
        const std::string expanded = expand_user_and_vars(dequote(raw));
        if (expanded.empty()) {
            return revive::core::make_status(revive::core::StatusDomain::Paths, revive::core::StatusCode::Invalid);
        }
        *out = normalize_path(fs::path(expanded));
        return revive::core::ok_status();
    }

    std::string percent_decode(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size()) {
                const int hi = hex_value(s[i + 1]);
                const int lo = hex_value(s[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(s[i]);
        }
        return out;
    }

    revive::core::Status locator_to_path(const std::string& locator, PathConvention convention, std::string* out) {
        if (out == nullptr || locator.empty()) {
            return revive::core::make_status(revive::core::StatusDomain::Paths, revive::core::StatusCode::Invalid);
        }

        std::string rest = locator;
        const size_t scheme_len = scheme_length(rest);
        if (scheme_len > 0) {
            rest.erase(0, scheme_len + 1);

            const size_t cut = rest.find_first_of("?#");
            if (cut != std::string::npos) {
                rest.erase(cut);
            }

            // Authority (host) is dropped; only the path names a local file.
            if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
                const size_t slash = rest.find('/', 2);
                if (slash == std::string::npos) {
                    return revive::core::make_status(revive::core::StatusDomain::Paths, revive::core::StatusCode::Invalid);
                }
                rest.erase(0, slash);
            }
        }

        std::string path = percent_decode(rest);
        if (convention == PathConvention::Windows && path.size() >= 3 && path[0] == '/' && path[2] == ':') {
            path.erase(0, 1);
        }
        if (path.empty()) {
            return revive::core::make_status(revive::core::StatusDomain::Paths, revive::core::StatusCode::Invalid);
        }

        *out = std::move(path);
        return revive::core::ok_status();
    }

    std::vector<std::string> path_segments(const fs::path& p) {
        std::vector<std::string> out;
        for (const fs::path& part : p.relative_path()) {
            const std::string name = part.string();
            if (name.empty() || name == ".") {
                continue;
            }
            out.push_back(name);
        }
        return out;
    }

    bool path_is_within(const fs::path& p, const fs::path& root) {
        const fs::path rel = p.lexically_relative(root);
        if (rel.empty()) {
            return false;
        }
        if (rel == fs::path(".")) {
            return true;
        }
        return *rel.begin() != fs::path("..");
    }
} // namespace revive::paths
