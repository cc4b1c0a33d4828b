#pragma once

#include "catalog/detector.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

enum class KeyAlphabet : uint8_t {
    ALNUM,          // [A-Za-z0-9]
    ALNUM_DASH,     // [A-Za-z0-9_-]
    UPPER_DIGIT,    // [A-Z0-9]
    HEX,            // [0-9a-fA-F]
    BASE64URL       // [A-Za-z0-9_-] plus '='
};

[[nodiscard]] std::string_view key_alphabet_to_string(KeyAlphabet alphabet);
[[nodiscard]] std::optional<KeyAlphabet> parse_key_alphabet(std::string_view name);
[[nodiscard]] bool in_alphabet(KeyAlphabet alphabet, char c);

/**
 * @brief Provider key format: fixed prefix, then a suffix drawn from one
 * alphabet with a bounded length (suffix length excludes the prefix)
 */
struct ApiKeyShape {
    std::string provider;
    std::vector<std::string> prefixes;
    KeyAlphabet alphabet = KeyAlphabet::ALNUM;
    size_t min_length = 0;
    size_t max_length = 0;
};

/**
 * @brief Built-in provider shapes
 */
[[nodiscard]] const std::vector<ApiKeyShape>& builtin_api_key_shapes();

/**
 * @brief Prefix + alphabet + length matcher for one provider family
 *
 * A key must not be glued to neighbouring alphabet characters: the byte
 * before the prefix and the byte after the suffix are outside the alphabet.
 */
class ApiKeyDetector : public IDetector {
public:
    ApiKeyDetector(ApiKeyShape shape, std::string token);

    [[nodiscard]] std::string_view name() const override { return shape_.provider; }

    void find(std::string_view text, uint32_t order, std::vector<Match>& out) const override;

private:
    [[nodiscard]] std::optional<size_t> match_at(std::string_view text, size_t pos,
                                                 std::string_view prefix) const;

    ApiKeyShape shape_;
    std::string token_;
};

} // namespace biip
