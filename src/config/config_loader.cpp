#include "config/config_loader.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace biip {

// ============================================================================
// TOML Extraction Helpers
// ============================================================================

namespace {

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Sizes are written as TOML integers; a negative value is a load error.
size_t toml_size(const toml::table& tbl, const std::string_view section,
                 const std::string_view key, const size_t default_val) {
    const int64_t raw = tbl[key].value_or(static_cast<int64_t>(default_val));
    if (raw < 0) {
        throw std::runtime_error(
            std::format("{}.{} must not be negative, got {}", section, key, raw));
    }
    return static_cast<size_t>(raw);
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* l = root["logging"].as_table();
    if (!l) return cfg;
    cfg.level = (*l)["level"].value_or("warn"s);
    return cfg;
}

SecretsConfig ConfigLoader::extract_secrets(const toml::table& root) {
    SecretsConfig cfg;
    const auto* s = root["secrets"].as_table();
    if (!s) return cfg;

    if ((*s)["keywords"].is_array()) {
        cfg.keywords = toml_string_array(*s, "keywords");
    }
    cfg.custom_prefix = (*s)["custom_prefix"].value_or(cfg.custom_prefix);
    cfg.min_length = toml_size(*s, "secrets", "min_length", cfg.min_length);
    cfg.dotenv = (*s)["dotenv"].value_or(cfg.dotenv);
    return cfg;
}

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* in = root["input"].as_table();
    if (!in) return cfg;

    cfg.max_file_size = toml_size(*in, "input", "max_file_size", cfg.max_file_size);
    cfg.jobs = toml_size(*in, "input", "jobs", cfg.jobs);
    cfg.header = (*in)["header"].value_or(cfg.header);
    return cfg;
}

BinaryScreener::Config ConfigLoader::extract_binary(const toml::table& root) {
    BinaryScreener::Config cfg;
    const auto* b = root["binary"].as_table();
    if (!b) return cfg;

    cfg.sample_size = toml_size(*b, "binary", "sample_size", cfg.sample_size);
    cfg.max_non_printable_ratio =
        (*b)["max_non_printable_ratio"].value_or(cfg.max_non_printable_ratio);
    return cfg;
}

std::vector<std::pair<std::string, std::string>> ConfigLoader::extract_tokens(
    const toml::table& root) {
    std::vector<std::pair<std::string, std::string>> result;
    const auto* t = root["tokens"].as_table();
    if (!t) return result;

    for (const auto& [key, val] : *t) {
        const auto* s = val.as_string();
        if (!s) {
            throw std::runtime_error(
                std::format("tokens.{} must be a string", key.str()));
        }
        result.emplace_back(std::string(key.str()), s->get());
    }
    return result;
}

std::vector<ApiKeyConfigEntry> ConfigLoader::extract_api_keys(const toml::table& root) {
    std::vector<ApiKeyConfigEntry> result;
    const auto* arr = root["api_keys"].as_array();
    if (!arr) return result;

    for (const auto& elem : *arr) {
        const auto* k = elem.as_table();
        if (!k) continue;

        ApiKeyConfigEntry entry;
        entry.provider = (*k)["provider"].value_or(""s);

        // prefix = "acme_" or prefix = ["acme_", "acmetest_"]
        if ((*k)["prefix"].is_array()) {
            entry.prefixes = toml_string_array(*k, "prefix");
        } else if (const auto* p = (*k)["prefix"].as_string()) {
            entry.prefixes.emplace_back(p->get());
        }

        entry.alphabet = (*k)["alphabet"].value_or(entry.alphabet);
        entry.min_length = toml_size(*k, "api_keys", "min_length", 0);
        entry.max_length = toml_size(*k, "api_keys", "max_length", entry.min_length);
        result.push_back(std::move(entry));
    }
    return result;
}

BiipConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    BiipConfig config;
    config.logging = extract_logging(root);
    config.secrets = extract_secrets(root);
    config.input = extract_input(root);
    config.binary = extract_binary(root);
    config.token_overrides = extract_tokens(root);
    config.api_keys = extract_api_keys(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BiipConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::optional<std::filesystem::path> ConfigLoader::default_path(
    const char* xdg_config_home, const char* home) {
    if (xdg_config_home && *xdg_config_home) {
        return std::filesystem::path(xdg_config_home) / "biip" / "config.toml";
    }
    if (home && *home) {
        return std::filesystem::path(home) / ".config" / "biip" / "config.toml";
    }
    return std::nullopt;
}

TokenSet ConfigLoader::build_token_set(const BiipConfig& config) {
    TokenSet tokens;
    for (const auto& [name, token] : config.token_overrides) {
        if (const auto category = parse_category(name)) {
            tokens.set(*category, token);
        }
    }
    return tokens;
}

std::vector<ApiKeyShape> ConfigLoader::build_api_key_shapes(const BiipConfig& config) {
    std::vector<ApiKeyShape> shapes;
    shapes.reserve(config.api_keys.size());
    for (const auto& entry : config.api_keys) {
        const auto alphabet = parse_key_alphabet(entry.alphabet);
        if (!alphabet) continue;

        ApiKeyShape shape;
        shape.provider = entry.provider;
        shape.prefixes = entry.prefixes;
        shape.alphabet = *alphabet;
        shape.min_length = entry.min_length;
        shape.max_length = entry.max_length;
        shapes.push_back(std::move(shape));
    }
    return shapes;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BiipConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(utils::to_lower(config.logging.level))) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    for (const auto& [name, token] : config.token_overrides) {
        if (!parse_category(name)) {
            errors.push_back(std::format("tokens.{} is not a known category", name));
        } else if (token.empty()) {
            errors.push_back(std::format("tokens.{} must not be empty", name));
        }
    }

    for (size_t i = 0; i < config.secrets.keywords.size(); ++i) {
        if (config.secrets.keywords[i].empty()) {
            errors.push_back(std::format("secrets.keywords[{}] must not be empty", i));
        }
    }
    if (config.secrets.custom_prefix.empty()) {
        errors.push_back("secrets.custom_prefix must not be empty");
    }

    if (config.input.max_file_size == 0) {
        errors.push_back("input.max_file_size must be > 0");
    }

    if (config.binary.sample_size == 0) {
        errors.push_back("binary.sample_size must be > 0");
    }
    if (config.binary.max_non_printable_ratio < 0.0 ||
        config.binary.max_non_printable_ratio > 1.0) {
        errors.push_back(std::format(
            "binary.max_non_printable_ratio must be within [0, 1], got {}",
            config.binary.max_non_printable_ratio));
    }

    for (size_t i = 0; i < config.api_keys.size(); ++i) {
        const auto& k = config.api_keys[i];
        if (k.provider.empty()) {
            errors.push_back(std::format("api_keys[{}].provider must not be empty", i));
        }
        if (k.prefixes.empty()) {
            errors.push_back(std::format("api_keys[{}].prefix is required", i));
        }
        for (const auto& prefix : k.prefixes) {
            if (prefix.empty()) {
                errors.push_back(std::format("api_keys[{}].prefix must not be empty", i));
                break;
            }
        }
        if (!parse_key_alphabet(k.alphabet)) {
            errors.push_back(std::format(
                "api_keys[{}].alphabet '{}' is not one of alnum, alnum_dash, "
                "upper_digit, hex, base64url", i, k.alphabet));
        }
        if (k.min_length == 0) {
            errors.push_back(std::format("api_keys[{}].min_length must be > 0", i));
        }
        if (k.min_length > k.max_length) {
            errors.push_back(std::format(
                "api_keys[{}].min_length ({}) > max_length ({})",
                i, k.min_length, k.max_length));
        }
    }

    return errors;
}

} // namespace biip
