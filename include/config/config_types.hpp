#pragma once

#include "screen/binary_screener.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace biip {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "warn";
};

struct SecretsConfig {
    std::vector<std::string> keywords = {
        "username", "password", "email", "secret", "token", "key"
    };
    std::string custom_prefix = "BIIP_";
    size_t min_length = 1;
    bool dotenv = true;               // read .env from the working directory
};

struct InputConfig {
    size_t max_file_size = 10 * 1024 * 1024;
    size_t jobs = 0;                  // 0 = hardware concurrency
    bool header = true;               // "─── path ───" before each file
};

/**
 * @brief Additional API key provider, as written in [[api_keys]]
 */
struct ApiKeyConfigEntry {
    std::string provider;
    std::vector<std::string> prefixes;
    std::string alphabet = "alnum";
    size_t min_length = 0;
    size_t max_length = 0;
};

struct BiipConfig {
    LoggingConfig logging;
    SecretsConfig secrets;
    InputConfig input;
    BinaryScreener::Config binary;

    // [tokens] category = "replacement", in file order
    std::vector<std::pair<std::string, std::string>> token_overrides;

    std::vector<ApiKeyConfigEntry> api_keys;
};

} // namespace biip
