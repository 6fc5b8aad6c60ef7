#include <cstdlib>
#include <cstdio>
#include <array>
#include <filesystem>
#include <string>
#include <system_error>

#include "revive/cli/options.hpp"
#include "revive/cli/when.hpp"
#include "revive/core/errors.hpp"
#include "revive/core/models.hpp"
#include "revive/paths/resolver.hpp"
#include "revive/restore/orchestrator.hpp"

namespace {

// ========================================================================
// Exit Codes
// ========================================================================

constexpr int kExitOk = EXIT_SUCCESS;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string restore_from;
    std::string history;
    std::string restore_to;
    const char* before{nullptr};
    const char* after{nullptr};
    bool dry_run{false};
    revive::core::i64 max_index_files{static_cast<revive::core::i64>(revive::core::kDefaultMaxIndexFiles)};
    bool refresh_index{false};
    bool strict_suffix{false};
    bool help{false};
};

constexpr std::array<revive::cli::OptionSpec, 7> g_options = {{
    {revive::cli::OptionId::Before, revive::cli::OptionType::String, "before", '\0'},
    {revive::cli::OptionId::After, revive::cli::OptionType::String, "after", '\0'},
    {revive::cli::OptionId::DryRun, revive::cli::OptionType::Flag, "dry-run", 'n'},
    {revive::cli::OptionId::MaxIndexFiles, revive::cli::OptionType::I64, "max-index-files", '\0'},
    {revive::cli::OptionId::RefreshIndex, revive::cli::OptionType::Flag, "refresh-index", '\0'},
    {revive::cli::OptionId::StrictSuffix, revive::cli::OptionType::Flag, "strict-suffix", '\0'},
    {revive::cli::OptionId::Help, revive::cli::OptionType::Flag, "help", 'h'},
}};

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    std::fprintf(stderr, "error: %s\n", msg);
}

void print_status_error_detailed(const char* context, revive::core::Status s) {
    std::fprintf(stderr,
        "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
        context,
        revive::core::status_code_name(s.code),
        static_cast<unsigned>(s.code),
        revive::core::status_domain_name(s.domain),
        static_cast<unsigned>(s.domain),
        s.aux);
    if (s.aux != 0) {
        std::fprintf(stderr, "error: %s: %s\n", context, revive::core::status_reason(s).c_str());
    }
}

// ========================================================================
// Usage
// ========================================================================

void print_usage(FILE* out) {
    std::fprintf(out, "usage: revive [options] <restore_from> <history> <restore_to>\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "Restore each file to its newest local-history save inside a time window and\n");
    std::fprintf(out, "place it at the matching spot of an existing destination tree.\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "  restore_from          Original project root named in the history records\n");
    std::fprintf(out, "  history               History root (e.g. ~/.config/Code/User/History)\n");
    std::fprintf(out, "  restore_to            Destination project root, fixed in place\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "  --before <when>       Upper bound (exclusive): newest save strictly before this time\n");
    std::fprintf(out, "  --after <when>        Lower bound (inclusive): newest save at or after this time\n");
    std::fprintf(out, "  -n, --dry-run         Plan only; don't write files\n");
    std::fprintf(out, "  --max-index-files <n> Safety limit for indexing destination files (default: %llu)\n",
        static_cast<unsigned long long>(revive::core::kDefaultMaxIndexFiles));
    std::fprintf(out, "  --refresh-index       Re-index the destination before every filename lookup\n");
    std::fprintf(out, "  --strict-suffix       Filename matches must also agree on the parent folder\n");
    std::fprintf(out, "  -h, --help            Show this help\n");
    std::fprintf(out, "\n");
    std::fprintf(out, "<when>: 'YYYY-MM-DD HH:MM[:SS]' or 'YYYY-MM-DD' ('/' also accepted), local time.\n");
}

// ========================================================================
// Argument Parsing
// ========================================================================

bool parse_cli(int argc, char** argv, CliConfig* cfg) {
    std::array<revive::cli::ParsedOption, 32> opt_buf{};
    revive::cli::ParsedOptions opts{opt_buf.data(), 0, static_cast<revive::cli::u32>(opt_buf.size())};
    std::array<const char*, 8> pos_buf{};
    revive::cli::Positionals positionals{pos_buf.data(), 0, static_cast<revive::cli::u32>(pos_buf.size())};

    const revive::cli::CliArgs args{argv + 1, static_cast<revive::cli::u32>(argc > 0 ? argc - 1 : 0)};
    const revive::core::Status s = revive::cli::parse_arguments(
        args, g_options.data(), static_cast<revive::cli::u32>(g_options.size()), &opts, &positionals);
    if (!revive::core::is_ok(s)) {
        print_error("invalid arguments (unknown option, missing value or bad number)");
        return false;
    }

    using revive::cli::OptionId;
    if (revive::cli::find_option(opts, OptionId::Help)) {
        cfg->help = true;
        return true;
    }
    if (const auto* o = revive::cli::find_option(opts, OptionId::Before)) cfg->before = o->value.str;
    if (const auto* o = revive::cli::find_option(opts, OptionId::After)) cfg->after = o->value.str;
    if (const auto* o = revive::cli::find_option(opts, OptionId::MaxIndexFiles)) cfg->max_index_files = o->value.i64v;
    cfg->dry_run = revive::cli::find_option(opts, OptionId::DryRun) != nullptr;
    cfg->refresh_index = revive::cli::find_option(opts, OptionId::RefreshIndex) != nullptr;
    cfg->strict_suffix = revive::cli::find_option(opts, OptionId::StrictSuffix) != nullptr;

    if (positionals.len != 3) {
        print_error("expected exactly three arguments: <restore_from> <history> <restore_to>");
        return false;
    }
    if (cfg->max_index_files <= 0) {
        print_error("--max-index-files must be a positive integer");
        return false;
    }

    cfg->restore_from = positionals.data[0];
    cfg->history = positionals.data[1];
    cfg->restore_to = positionals.data[2];
    return true;
}

bool parse_bound(const char* flag, const char* text, revive::core::TimestampMs* out) {
    const revive::core::Status s = revive::cli::parse_when(text, out);
    if (!revive::core::is_ok(s)) {
        std::fprintf(stderr, "error: %s: could not parse date/time: %s. Try 'YYYY-MM-DD HH:MM[:SS]'.\n", flag, text);
        return false;
    }
    return true;
}

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    CliConfig cli;
    if (!parse_cli(argc, argv, &cli)) {
        print_usage(stderr);
        return kExitUsage;
    }
    if (cli.help) {
        print_usage(stdout);
        return kExitOk;
    }

    revive::restore::RestoreConfig cfg;
    if (!revive::core::is_ok(revive::paths::resolve_user_path(cli.history, &cfg.history_root)) ||
        !revive::core::is_ok(revive::paths::resolve_user_path(cli.restore_from, &cfg.source_root)) ||
        !revive::core::is_ok(revive::paths::resolve_user_path(cli.restore_to, &cfg.dest_root))) {
        print_error("paths must not be empty");
        return kExitUsage;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(cfg.history_root, ec)) {
        std::fprintf(stderr, "error: history directory not found: %s\n", cfg.history_root.string().c_str());
        return kExitFatal;
    }

    if (cli.before == nullptr && cli.after == nullptr) {
        print_error("Provide at least one bound: --before, --after, or both.");
        return kExitFatal;
    }
    if (cli.before != nullptr) {
        if (!parse_bound("--before", cli.before, &cfg.window.before_ms)) {
            return kExitFatal;
        }
        cfg.window.has_before = true;
    }
    if (cli.after != nullptr) {
        if (!parse_bound("--after", cli.after, &cfg.window.after_ms)) {
            return kExitFatal;
        }
        cfg.window.has_after = true;
    }
    if (!revive::core::window_is_valid(cfg.window)) {
        print_error("--after must be earlier than --before.");
        return kExitFatal;
    }

    cfg.dry_run = cli.dry_run;
    cfg.placer.max_index_files = static_cast<revive::core::u64>(cli.max_index_files);
    cfg.placer.refresh_each_lookup = cli.refresh_index;
    cfg.placer.min_suffix_segments = cli.strict_suffix ? 2 : 1;

    revive::restore::RestoreReport report;
    const revive::restore::RestoreSink sink{stdout, stderr};
    const revive::core::Status s = revive::restore::run_restore(cfg, sink, &report);
    if (!revive::core::is_ok(s)) {
        print_status_error_detailed("restore", s);
        return kExitFatal;
    }
    return kExitOk;
}
