#include "catalog/pattern_catalog.hpp"
#include "catalog/regex_detector.hpp"
#include "catalog/validators.hpp"

namespace biip {

PatternCatalog::PatternCatalog(const Config& config)
    : tokens_(config.tokens) {

    // URL credentials: only the user:pass group is replaced
    add_regex("url_credentials", Category::URL_CREDENTIALS, priority::kUrlCredentials,
        R"(\b[A-Za-z][A-Za-z0-9+.\-]*://([^\s:/@]+:[^\s/@]+)@)",
        nullptr, 1);

    // JWT: header and payload are base64url JSON objects ("ey" == '{"')
    add_regex("jwt", Category::JWT, priority::kJwt,
        R"(\bey[A-Za-z0-9_\-]{10,}\.ey[A-Za-z0-9_\-]{10,}\.[A-Za-z0-9_\-]*)",
        validators::is_plausible_jwt);

    // One entry per provider family
    for (const auto& shape : builtin_api_key_shapes()) {
        detectors_.push_back(std::make_unique<ApiKeyDetector>(shape, tokens_.get(Category::API_KEY)));
    }
    for (const auto& shape : config.extra_api_keys) {
        detectors_.push_back(std::make_unique<ApiKeyDetector>(shape, tokens_.get(Category::API_KEY)));
    }

    // Credit card: 13-19 digits with optional single separators, Luhn checked
    add_regex("credit_card", Category::CREDIT_CARD, priority::kCreditCard,
        R"(\b\d(?:[ \-]?\d){12,18}\b)",
        validators::luhn_validate);

    add_regex("uuid", Category::UUID, priority::kUuid,
        R"(\b[0-9A-Fa-f]{8}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{4}-[0-9A-Fa-f]{12}\b)");

    add_regex("email", Category::EMAIL, priority::kEmail,
        R"(\b[A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,}\b)");

    // MAC: six octets, one delimiter style per address
    add_regex("mac_address", Category::MAC_ADDRESS, priority::kMacAddress,
        R"(\b(?:(?:[0-9A-Fa-f]{2}:){5}|(?:[0-9A-Fa-f]{2}-){5})[0-9A-Fa-f]{2}\b)");

    add_regex("ipv4", Category::IPV4, priority::kIpAddress,
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
        validators::is_public_ipv4);

    // Broad candidate; the validator parses and drops non-public scopes
    add_regex("ipv6", Category::IPV6, priority::kIpAddress,
        R"(\b[0-9A-Fa-f:]+:[0-9A-Fa-f:]*[0-9A-Fa-f]\b)",
        validators::is_public_ipv6);

    // A +CC prefix may run straight into the area code
    add_regex("phone", Category::PHONE, priority::kPhone,
        R"((?:\+\d{1,3}[ .\-]?(?:\(\d{3}\)[ .\-]?|\d{3}[ .\-]?)|\(\d{3}\)[ .\-]?|\b\d{3}[ .\-]?)\d{3}[ .\-]?\d{4}\b)");
}

void PatternCatalog::add_regex(std::string name, Category category, int priority,
                               std::string pattern, Validator validator,
                               size_t capture_group) {
    RegexDetector::Config cfg;
    cfg.name = std::move(name);
    cfg.category = category;
    cfg.priority = priority;
    cfg.token = tokens_.get(category);
    cfg.pattern = std::move(pattern);
    cfg.validator = validator;
    cfg.capture_group = capture_group;
    detectors_.push_back(std::make_unique<RegexDetector>(std::move(cfg)));
}

const PatternCatalog& PatternCatalog::default_catalog() {
    static const PatternCatalog kCatalog;
    return kCatalog;
}

} // namespace biip
