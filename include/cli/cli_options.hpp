#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

inline constexpr std::string_view kVersion = "0.4.0";

/**
 * @brief Parsed command line
 *
 * Unset optionals fall back to the configuration file.
 */
struct CliOptions {
    bool help = false;
    bool version = false;
    bool clipboard = false;
    bool no_header = false;
    bool no_dotenv = false;
    bool verbose = false;
    bool quiet = false;
    std::optional<std::string> config_path;
    std::optional<size_t> jobs;
    std::vector<std::string> files;
};

/**
 * @brief Parse argv (argv[0] is skipped)
 *
 * Supports "--" to end option parsing, "-j4" / "--jobs=4" forms, and a
 * lone "-" as a file meaning stdin. Unknown options are USAGE_ERROR.
 */
[[nodiscard]] Result<CliOptions> parse_args(int argc, const char* const* argv);

[[nodiscard]] std::string help_text();

} // namespace biip
