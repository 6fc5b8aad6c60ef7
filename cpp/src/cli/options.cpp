#include "revive/cli/options.hpp"

#include <charconv>
#include <cstring>
#include <system_error>

namespace revive::cli {
    namespace {
        [[nodiscard]] constexpr revive::core::Status invalid() noexcept {
            return revive::core::make_status(revive::core::StatusDomain::Cli, revive::core::StatusCode::Invalid);
        }

        [[nodiscard]] bool is_option_token(const char* tok) noexcept {
            return tok != nullptr && tok[0] == '-' && tok[1] != '\0';
        }

        [[nodiscard]] bool is_terminator(const char* tok) noexcept {
            return tok != nullptr && std::strcmp(tok, "--") == 0;
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] revive::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return revive::core::ok_status();
        }

        [[nodiscard]] revive::core::Status assign_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            if (spec.type == OptionType::String) {
                opt->value.str = value;
                return revive::core::ok_status();
            }
            if (spec.type == OptionType::I64) {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return invalid();
                }
                opt->value.i64v = v;
                return revive::core::ok_status();
            }
            return invalid();
        }

        // Parses the option token at args.argv[*i] and advances *i past it
        // and its value, if any.
        [[nodiscard]] revive::core::Status parse_one(const CliArgs& args,
            const OptionSpec* specs,
            u32 spec_count,
            ParsedOptions* out,
            u32* i) noexcept {
            const char* tok = args.argv[*i];
            const OptionSpec* spec = nullptr;
            const char* value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name_buf[name_len] = '\0';
                    name = name_buf;
                    value = eq + 1;
                }
                spec = find_long(specs, spec_count, name);
                if (spec == nullptr) {
                    return invalid();
                }
                if (spec->type == OptionType::Flag && value != nullptr) {
                    return invalid();
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return invalid();
                }
                if (tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return invalid();
                    }
                    value = tok + 2;
                }
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (spec->type == OptionType::Flag) {
                opt.value.boolv = 1;
                *i += 1;
                return push_option(out, opt);
            }

            if (value == nullptr) {
                if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                    return invalid();
                }
                value = args.argv[*i + 1];
                *i += 2;
            } else {
                *i += 1;
            }

            const revive::core::Status s = assign_value(*spec, value, &opt);
            if (!revive::core::is_ok(s)) {
                return s;
            }
            return push_option(out, opt);
        }

        [[nodiscard]] bool inputs_valid(const CliArgs& args, const OptionSpec* specs, u32 spec_count) noexcept {
            if (args.argc > 0 && args.argv == nullptr) {
                return false;
            }
            return spec_count == 0 || specs != nullptr;
        }
    } // namespace

    revive::core::Status parse_arguments(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        Positionals* positionals) noexcept {
        if (out == nullptr || positionals == nullptr) {
            return invalid();
        }
        out->len = 0;
        positionals->len = 0;
        if (!inputs_valid(args, specs, spec_count)) {
            return invalid();
        }

        bool only_positionals = false;
        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (!only_positionals && is_terminator(tok)) {
                only_positionals = true;
                ++i;
                continue;
            }
            if (only_positionals || !is_option_token(tok)) {
                if (positionals->data == nullptr || positionals->len >= positionals->cap) {
                    return invalid();
                }
                positionals->data[positionals->len++] = tok;
                ++i;
                continue;
            }
            const revive::core::Status s = parse_one(args, specs, spec_count, out, &i);
            if (!revive::core::is_ok(s)) {
                return s;
            }
        }
        return revive::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace revive::cli
