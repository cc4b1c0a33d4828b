#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

// ============================================================================
// Categories
// ============================================================================

enum class Category : uint8_t {
    USERNAME,
    HOME_DIR,
    URL_CREDENTIALS,
    EMAIL,
    MAC_ADDRESS,
    IPV4,
    IPV6,
    PHONE,
    CREDIT_CARD,
    JWT,
    API_KEY,
    UUID,
    ENV_SECRET,
    CUSTOM_PATTERN
};

inline constexpr size_t kCategoryCount = 14;

inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::USERNAME, Category::HOME_DIR, Category::URL_CREDENTIALS,
    Category::EMAIL, Category::MAC_ADDRESS, Category::IPV4, Category::IPV6,
    Category::PHONE, Category::CREDIT_CARD, Category::JWT, Category::API_KEY,
    Category::UUID, Category::ENV_SECRET, Category::CUSTOM_PATTERN
};

[[nodiscard]] inline constexpr size_t category_index(Category c) noexcept {
    return static_cast<size_t>(c);
}

[[nodiscard]] inline std::string_view category_to_string(Category c) {
    switch (c) {
        case Category::USERNAME:        return "username";
        case Category::HOME_DIR:        return "home_dir";
        case Category::URL_CREDENTIALS: return "url_credentials";
        case Category::EMAIL:           return "email";
        case Category::MAC_ADDRESS:     return "mac_address";
        case Category::IPV4:            return "ipv4";
        case Category::IPV6:            return "ipv6";
        case Category::PHONE:           return "phone";
        case Category::CREDIT_CARD:     return "credit_card";
        case Category::JWT:             return "jwt";
        case Category::API_KEY:         return "api_key";
        case Category::UUID:            return "uuid";
        case Category::ENV_SECRET:      return "env_secret";
        case Category::CUSTOM_PATTERN:  return "custom_pattern";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Category> parse_category(std::string_view name) {
    for (const auto c : kAllCategories) {
        if (category_to_string(c) == name) return c;
    }
    return std::nullopt;
}

// ============================================================================
// Priorities (lower number wins at equal start)
// ============================================================================

namespace priority {
    inline constexpr int kSecretLiteral  = 0;
    inline constexpr int kUrlCredentials = 1;
    inline constexpr int kJwt            = 2;
    inline constexpr int kApiKey         = 3;
    inline constexpr int kCreditCard     = 4;
    inline constexpr int kUuid           = 5;
    inline constexpr int kEmail          = 6;
    inline constexpr int kMacAddress     = 7;
    inline constexpr int kIpAddress      = 8;
    inline constexpr int kPhone          = 9;
    inline constexpr int kIdentity       = 10;
}

// ============================================================================
// Spans and Matches
// ============================================================================

/**
 * @brief Half-open [start, end) byte range into a text buffer
 */
struct Span {
    size_t start = 0;
    size_t end = 0;

    Span() = default;
    Span(size_t s, size_t e) : start(s), end(e) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }

    bool operator==(const Span&) const = default;
};

/**
 * @brief A span tagged with the detector that produced it.
 *
 * The token is a view into storage owned by the catalog or context,
 * both of which outlive every match.
 */
struct Match {
    Span span;
    Category category = Category::EMAIL;
    int priority = 0;
    std::string_view token;
    uint32_t detector_order = 0;   // registration order, final tie-break

    Match() = default;
    Match(Span s, Category c, int p, std::string_view t, uint32_t order = 0)
        : span(s), category(c), priority(p), token(t), detector_order(order) {}
};

// ============================================================================
// Secret Literals
// ============================================================================

enum class SecretClass : uint8_t {
    KEYWORD,    // name contains a sensitive keyword
    CUSTOM      // name carries the custom prefix
};

struct SecretLiteral {
    std::string value;
    SecretClass source = SecretClass::KEYWORD;
    std::string token;

    SecretLiteral() = default;
    SecretLiteral(std::string v, SecretClass s, std::string t)
        : value(std::move(v)), source(s), token(std::move(t)) {}

    [[nodiscard]] Category category() const {
        return source == SecretClass::CUSTOM ? Category::CUSTOM_PATTERN : Category::ENV_SECRET;
    }
};

} // namespace biip
