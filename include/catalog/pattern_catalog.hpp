#pragma once

#include "catalog/api_key_detector.hpp"
#include "catalog/detector.hpp"
#include "catalog/token_set.hpp"

#include <memory>
#include <vector>

namespace biip {

/**
 * @brief Static detector table
 *
 * Holds every text-pattern detector: URL credentials, JWT, one entry per
 * API key provider, credit card, UUID, email, MAC, IPv4, IPv6 and phone.
 * Detectors that depend on runtime facts (username, home directory,
 * secret literals) are built by the DetectorEngine from the Context.
 *
 * Constructed once, never mutated; safe to share across worker threads.
 */
class PatternCatalog {
public:
    struct Config {
        TokenSet tokens;
        std::vector<ApiKeyShape> extra_api_keys;
    };

    PatternCatalog() : PatternCatalog(Config{}) {}
    explicit PatternCatalog(const Config& config);

    PatternCatalog(const PatternCatalog&) = delete;
    PatternCatalog& operator=(const PatternCatalog&) = delete;

    /**
     * @brief Process-wide catalog with default tokens and built-in providers
     */
    [[nodiscard]] static const PatternCatalog& default_catalog();

    [[nodiscard]] const std::vector<std::unique_ptr<IDetector>>& detectors() const {
        return detectors_;
    }

    [[nodiscard]] const TokenSet& tokens() const { return tokens_; }

    [[nodiscard]] size_t size() const { return detectors_.size(); }

private:
    void add_regex(std::string name, Category category, int priority,
                   std::string pattern, Validator validator = nullptr,
                   size_t capture_group = 0);

    TokenSet tokens_;
    std::vector<std::unique_ptr<IDetector>> detectors_;
};

} // namespace biip
