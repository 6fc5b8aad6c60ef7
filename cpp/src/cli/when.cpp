#include "revive/cli/when.hpp"

#include <cctype>
#include <ctime>

namespace revive::cli {
    namespace {
        struct Cursor {
            const std::string& s;
            size_t pos{0};

            [[nodiscard]] bool done() const noexcept { return pos >= s.size(); }
            [[nodiscard]] char peek() const noexcept { return done() ? '\0' : s[pos]; }
        };

        // Reads between min_digits and max_digits decimal digits.
        [[nodiscard]] bool read_number(Cursor* c, size_t min_digits, size_t max_digits, int* out) noexcept {
            size_t n = 0;
            int v = 0;
            while (n < max_digits && !c->done() && std::isdigit(static_cast<unsigned char>(c->peek())) != 0) {
                v = v * 10 + (c->peek() - '0');
                ++c->pos;
                ++n;
            }
            if (n < min_digits) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool expect(Cursor* c, char ch) noexcept {
            if (c->peek() != ch) {
                return false;
            }
            ++c->pos;
            return true;
        }

        [[nodiscard]] bool is_leap(int y) noexcept {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        [[nodiscard]] int days_in_month(int y, int m) noexcept {
            static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && is_leap(y)) {
                return 29;
            }
            return kDays[m - 1];
        }

        [[nodiscard]] std::string trim(const std::string& s) {
            size_t b = 0;
            size_t e = s.size();
            while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
            while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
            return s.substr(b, e - b);
        }
    } // namespace

    revive::core::Status parse_when(const std::string& s, revive::core::TimestampMs* out_ms) {
        const auto invalid = revive::core::make_status(revive::core::StatusDomain::Cli, revive::core::StatusCode::Invalid);
        if (out_ms == nullptr) {
            return invalid;
        }

        const std::string text = trim(s);
        if (text.empty()) {
            return invalid;
        }

        Cursor c{text};
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!read_number(&c, 4, 4, &year)) {
            return invalid;
        }
        const char sep = c.peek();
        if (sep != '-' && sep != '/') {
            return invalid;
        }
        if (!expect(&c, sep) || !read_number(&c, 1, 2, &month) || !expect(&c, sep) || !read_number(&c, 1, 2, &day)) {
            return invalid;
        }

        if (!c.done()) {
            if (std::isspace(static_cast<unsigned char>(c.peek())) == 0) {
                return invalid;
            }
            while (std::isspace(static_cast<unsigned char>(c.peek())) != 0) {
                ++c.pos;
            }
            if (!read_number(&c, 1, 2, &hour) || !expect(&c, ':') || !read_number(&c, 1, 2, &minute)) {
                return invalid;
            }
            if (!c.done()) {
                if (!expect(&c, ':') || !read_number(&c, 1, 2, &second)) {
                    return invalid;
                }
            }
            if (!c.done()) {
                return invalid;
            }
        }

        if (year < 1 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
            return invalid;
        }
        if (hour > 23 || minute > 59 || second > 61) {
            return invalid;
        }

        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        tm.tm_isdst = -1;

        const std::time_t t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            return revive::core::make_status(revive::core::StatusDomain::Cli, revive::core::StatusCode::Unsupported);
        }
        *out_ms = static_cast<revive::core::TimestampMs>(t) * 1000;
        return revive::core::ok_status();
    }
} // namespace revive::cli
