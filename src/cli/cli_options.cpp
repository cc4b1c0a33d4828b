#include "cli/cli_options.hpp"
#include "core/utils.hpp"

#include <format>

namespace biip {

namespace {

Result<size_t> parse_jobs(std::string_view value) {
    const auto jobs = utils::try_parse_int<size_t>(value);
    if (!jobs) {
        return Result<size_t>::error(ErrorCategory::USAGE_ERROR,
            std::format("invalid value for --jobs: '{}'", value));
    }
    return Result<size_t>::ok(*jobs);
}

} // anonymous namespace

Result<CliOptions> parse_args(int argc, const char* const* argv) {
    CliOptions opts;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with('-')) {
            opts.files.emplace_back(arg);
            continue;
        }

        // Options that take a value: "-c PATH", "--config PATH", "--config=PATH"
        auto take_value = [&](std::string_view name) -> std::optional<std::string> {
            if (arg.size() > name.size() && arg.starts_with(name)) {
                const auto rest = arg.substr(name.size());
                if (name.starts_with("--")) {
                    if (rest.front() == '=') return std::string(rest.substr(1));
                    return std::nullopt;
                }
                return std::string(rest);
            }
            if (arg == name && i + 1 < argc) {
                return std::string(argv[++i]);
            }
            return std::nullopt;
        };

        if (arg == "--") {
            options_done = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-V" || arg == "--version") {
            opts.version = true;
        } else if (arg == "--clipboard") {
            opts.clipboard = true;
        } else if (arg == "--no-header") {
            opts.no_header = true;
        } else if (arg == "--no-dotenv") {
            opts.no_dotenv = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg.starts_with("-c") || arg.starts_with("--config")) {
            auto value = arg.starts_with("--") ? take_value("--config") : take_value("-c");
            if (!value) {
                return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                    std::format("option '{}' requires a path", arg));
            }
            opts.config_path = std::move(*value);
        } else if (arg.starts_with("-j") || arg.starts_with("--jobs")) {
            auto value = arg.starts_with("--") ? take_value("--jobs") : take_value("-j");
            if (!value) {
                return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                    std::format("option '{}' requires a number", arg));
            }
            auto jobs = parse_jobs(*value);
            if (jobs.is_error()) {
                return Result<CliOptions>::error(jobs.error_category(), jobs.error_message());
            }
            opts.jobs = jobs.value();
        } else {
            return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                std::format("unknown option '{}'", arg));
        }
    }

    if (opts.verbose && opts.quiet) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
            "--verbose and --quiet are mutually exclusive");
    }
    if (opts.clipboard && !opts.files.empty()) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
            "--clipboard cannot be combined with file arguments");
    }

    return Result<CliOptions>::ok(std::move(opts));
}

std::string help_text() {
    return std::format(
        "biip {} - redact personal data and secrets from text\n"
        "\n"
        "Usage:\n"
        "  cat file | biip\n"
        "  biip [OPTIONS] [FILE ...]   # read and redact one or more files\n"
        "  biip                        # interactive paste; press Ctrl-D to finish\n"
        "  biip --clipboard            # redact the clipboard in place\n"
        "\n"
        "Options:\n"
        "  -c, --config PATH   configuration file (default: $XDG_CONFIG_HOME/biip/config.toml)\n"
        "      --clipboard     read the clipboard, redact, write the result back\n"
        "      --no-header     do not print a header before each file\n"
        "      --no-dotenv     ignore .env in the working directory\n"
        "  -j, --jobs N        worker threads for file arguments (0 = all cores)\n"
        "  -v, --verbose       debug logging on stderr\n"
        "  -q, --quiet         errors only on stderr\n"
        "  -h, --help          show this help\n"
        "  -V, --version       show version\n",
        kVersion);
}

} // namespace biip
