#include "cli/cli_options.hpp"
#include "cli/clipboard.hpp"
#include "cli/environment.hpp"
#include "cli/file_processor.hpp"
#include "config/config_loader.hpp"
#include "context/context.hpp"
#include "engine/redaction_engine.hpp"
#include "core/utils.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>

extern char** environ;

using namespace biip;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIoFailure = 1;
constexpr int kExitUsage = 2;

// Explicit --config must exist; the default location is optional.
Result<BiipConfig> load_config(const CliOptions& opts,
                               const std::map<std::string, std::string>& environment) {
    std::optional<std::filesystem::path> path;
    if (opts.config_path) {
        path = *opts.config_path;
    } else {
        const auto xdg = environment.find("XDG_CONFIG_HOME");
        const auto home = environment.find("HOME");
        path = ConfigLoader::default_path(
            xdg != environment.end() ? xdg->second.c_str() : nullptr,
            home != environment.end() ? home->second.c_str() : nullptr);

        std::error_code ec;
        if (!path || !std::filesystem::exists(*path, ec)) {
            return Result<BiipConfig>::ok(BiipConfig{});
        }
    }

    utils::log::debug(std::format("Loading configuration from {}", path->string()));
    auto result = ConfigLoader::load_from_file(path->string());
    if (!result.success) {
        return Result<BiipConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("{}: {}", path->string(), result.error_message));
    }
    return Result<BiipConfig>::ok(std::move(result.config));
}

void apply_log_level(const CliOptions& opts, const BiipConfig& config) {
    if (const auto level = utils::log::parse_level(utils::to_lower(config.logging.level))) {
        utils::log::set_level(*level);
    }
    if (opts.verbose) utils::log::set_level(utils::log::Level::DEBUG);
    if (opts.quiet) utils::log::set_level(utils::log::Level::ERROR);
}

Context load_context(const CliOptions& opts, const BiipConfig& config,
                     const std::map<std::string, std::string>& environment,
                     const TokenSet& tokens) {
    std::optional<std::string> dotenv;
    if (config.secrets.dotenv && !opts.no_dotenv) {
        auto read = read_dotenv(std::filesystem::current_path() / ".env");
        if (read.is_ok()) {
            dotenv = std::move(read.value());
        } else {
            utils::log::warn(std::format(".env ignored: {}", read.error_message()));
        }
    }

    ContextOptions options;
    options.keywords = config.secrets.keywords;
    options.custom_prefix = config.secrets.custom_prefix;
    options.min_secret_length = config.secrets.min_length;
    options.tokens = tokens;

    return build_context(environment, dotenv,
                         current_username(environment),
                         home_directory(environment),
                         options);
}

int run_clipboard(const std::map<std::string, std::string>& environment,
                  const RedactionEngine& engine, const BinaryScreener& screener) {
    const auto path_env = environment.find("PATH");
    auto clipboard = Clipboard::detect(
        path_env != environment.end() ? std::string_view(path_env->second) : std::string_view());
    if (clipboard.is_error()) {
        std::cerr << std::format("biip: {}\n", clipboard.error_message());
        return kExitIoFailure;
    }

    const auto contents = clipboard.value().read();
    if (contents.is_error()) {
        std::cerr << std::format("biip: {}\n", contents.error_message());
        return kExitIoFailure;
    }
    if (screener.is_binary(contents.value())) {
        std::cerr << "warning: clipboard holds binary data, left unchanged\n";
        return kExitOk;
    }

    RedactionReport report;
    const auto redacted = engine.redact(contents.value(), report);
    if (report.total() == 0) {
        utils::log::info("Clipboard: nothing to redact");
        return kExitOk;
    }

    const auto written = clipboard.value().write(redacted);
    if (written.is_error()) {
        std::cerr << std::format("biip: {}\n", written.error_message());
        return kExitIoFailure;
    }
    std::cerr << std::format("Clipboard: {} redaction(s)\n", report.total());
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto parsed = parse_args(argc, argv);
        if (parsed.is_error()) {
            std::cerr << std::format("biip: {}\nTry 'biip --help' for more information.\n",
                                     parsed.error_message());
            return kExitUsage;
        }
        const CliOptions& opts = parsed.value();

        if (opts.help) {
            std::cout << help_text();
            return kExitOk;
        }
        if (opts.version) {
            std::cout << std::format("biip {}\n", kVersion);
            return kExitOk;
        }

        const auto environment = collect_environment(environ);

        auto config_result = load_config(opts, environment);
        if (config_result.is_error()) {
            std::cerr << std::format("biip: {}\n", config_result.error_message());
            return kExitUsage;
        }
        const BiipConfig& config = config_result.value();
        apply_log_level(opts, config);

        utils::Timer timer;
        PatternCatalog::Config catalog_config;
        catalog_config.tokens = ConfigLoader::build_token_set(config);
        catalog_config.extra_api_keys = ConfigLoader::build_api_key_shapes(config);
        const PatternCatalog catalog(catalog_config);

        const Context context = load_context(opts, config, environment, catalog.tokens());
        const RedactionEngine engine(catalog, context);
        const BinaryScreener screener(config.binary);

        utils::log::debug(std::format(
            "Engine ready: {} detectors, {} secret literal(s), {} custom, in {}us",
            catalog.size(), context.secret_count(), context.custom_count(),
            timer.elapsed_us().count()));

        if (opts.clipboard) {
            return run_clipboard(environment, engine, screener);
        }

        if (!opts.files.empty()) {
            FileProcessor::Options fp;
            fp.max_file_size = config.input.max_file_size;
            fp.jobs = opts.jobs.value_or(config.input.jobs);
            fp.header = config.input.header && !opts.no_header;
            fp.binary = config.binary;

            const FileProcessor processor(engine, fp);
            const auto outcomes = processor.process(opts.files);
            return processor.write(outcomes, std::cout, std::cerr) ? kExitOk : kExitIoFailure;
        }

        if (::isatty(STDIN_FILENO)) {
            redact_paste(std::cin, std::cout, std::cerr, engine, screener);
        } else {
            redact_stream(std::cin, std::cout, engine, screener);
        }
        return kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitUsage;
    }
}
