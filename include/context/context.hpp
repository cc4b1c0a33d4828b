#pragma once

#include "core/types.hpp"
#include "catalog/token_set.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief Process-scoped runtime facts consumed by the detectors
 *
 * Built once at startup, read-only afterwards. secret_literals is ordered
 * longest value first (ties broken lexicographically) and holds each
 * value once.
 */
struct Context {
    std::string username;
    std::string home_dir;
    std::vector<SecretLiteral> secret_literals;

    [[nodiscard]] size_t secret_count() const;
    [[nodiscard]] size_t custom_count() const;
};

struct ContextOptions {
    std::vector<std::string> keywords = {
        "username", "password", "email", "secret", "token", "key"
    };
    std::string custom_prefix = "BIIP_";
    size_t min_secret_length = 1;
    TokenSet tokens;
};

/**
 * @brief Classify an environment variable name
 * @return CUSTOM for the custom prefix, KEYWORD when the lowercased name
 *         contains a keyword, nullopt otherwise
 */
[[nodiscard]] std::optional<SecretClass> classify_variable(
    std::string_view name, const ContextOptions& options);

/**
 * @brief Build the Context from already-materialized inputs
 *
 * Pure: performs no I/O. Process environment entries take precedence over
 * .env entries with the same key.
 *
 * @param environment Process environment variables
 * @param dotenv_contents Contents of a .env file, if one was found
 * @param current_user Login name of the invoking user (may be empty)
 * @param home_dir Home directory of the invoking user (may be empty)
 */
[[nodiscard]] Context build_context(
    const std::map<std::string, std::string>& environment,
    const std::optional<std::string>& dotenv_contents,
    std::string current_user,
    std::string home_dir,
    const ContextOptions& options = {});

} // namespace biip
