#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

namespace biip {

/**
 * @brief Category → replacement token mapping
 *
 * Exactly one token per category. Defaults contain no ASCII letters or
 * digits (except the username token) so a redacted text never re-matches
 * a structural detector.
 */
class TokenSet {
public:
    TokenSet();

    [[nodiscard]] static const TokenSet& defaults();

    [[nodiscard]] const std::string& get(Category category) const {
        return tokens_[category_index(category)];
    }

    void set(Category category, std::string token) {
        tokens_[category_index(category)] = std::move(token);
    }

    /**
     * @brief True if value occurs inside any category's token
     */
    [[nodiscard]] bool occurs_in_any(std::string_view value) const {
        return std::any_of(tokens_.begin(), tokens_.end(),
            [value](const std::string& token) { return token.find(value) != std::string::npos; });
    }

private:
    std::array<std::string, kCategoryCount> tokens_;
};

} // namespace biip
