#pragma once

#include "catalog/detector.hpp"

#include <re2/re2.h>

#include <memory>
#include <string>

namespace biip {

/**
 * @brief Structural detector backed by a precompiled RE2 pattern
 *
 * Matching is linear in the input length, including long unbroken runs
 * such as minified code or base64 blobs. Candidates are scanned left to
 * right without overlap. When a capture
 * group is configured, only that group becomes the match span (used for
 * URL credentials, where scheme and host stay visible).
 */
class RegexDetector : public IDetector {
public:
    struct Config {
        std::string name;
        Category category = Category::EMAIL;
        int priority = 0;
        std::string token;
        std::string pattern;
        Validator validator = nullptr;
        size_t capture_group = 0;
    };

    /**
     * @throws std::invalid_argument if the pattern does not compile or has
     *         fewer groups than capture_group
     */
    explicit RegexDetector(Config config);

    [[nodiscard]] std::string_view name() const override { return config_.name; }

    void find(std::string_view text, uint32_t order, std::vector<Match>& out) const override;

private:
    Config config_;
    std::unique_ptr<re2::RE2> regex_;
};

} // namespace biip
