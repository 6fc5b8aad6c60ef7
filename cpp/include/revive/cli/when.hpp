#pragma once

#include <string>

#include "revive/core/errors.hpp"
#include "revive/core/types.hpp"

namespace revive::cli {

    // Parses a local date/time into epoch milliseconds. Accepted forms
    // (either '-' or '/' between date fields, used consistently):
    //   YYYY-MM-DD HH:MM:SS
    //   YYYY-MM-DD HH:MM
    //   YYYY-MM-DD
    // Surrounding whitespace is ignored. Invalid for anything else,
    // including out-of-range fields such as 2025-02-30.
    [[nodiscard]] revive::core::Status parse_when(const std::string& s, revive::core::TimestampMs* out_ms);

} // namespace revive::cli
