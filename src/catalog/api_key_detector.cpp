#include "catalog/api_key_detector.hpp"

#include <cctype>

namespace biip {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

std::string_view key_alphabet_to_string(KeyAlphabet alphabet) {
    switch (alphabet) {
        case KeyAlphabet::ALNUM:       return "alnum";
        case KeyAlphabet::ALNUM_DASH:  return "alnum_dash";
        case KeyAlphabet::UPPER_DIGIT: return "upper_digit";
        case KeyAlphabet::HEX:         return "hex";
        case KeyAlphabet::BASE64URL:   return "base64url";
    }
    return "unknown";
}

std::optional<KeyAlphabet> parse_key_alphabet(std::string_view name) {
    if (name == "alnum") return KeyAlphabet::ALNUM;
    if (name == "alnum_dash") return KeyAlphabet::ALNUM_DASH;
    if (name == "upper_digit") return KeyAlphabet::UPPER_DIGIT;
    if (name == "hex") return KeyAlphabet::HEX;
    if (name == "base64url") return KeyAlphabet::BASE64URL;
    return std::nullopt;
}

bool in_alphabet(KeyAlphabet alphabet, char c) {
    const auto uc = static_cast<unsigned char>(c);
    switch (alphabet) {
        case KeyAlphabet::ALNUM:
            return std::isalnum(uc) != 0;
        case KeyAlphabet::ALNUM_DASH:
            return std::isalnum(uc) != 0 || c == '_' || c == '-';
        case KeyAlphabet::UPPER_DIGIT:
            return std::isdigit(uc) != 0 || (c >= 'A' && c <= 'Z');
        case KeyAlphabet::HEX:
            return std::isxdigit(uc) != 0;
        case KeyAlphabet::BASE64URL:
            return std::isalnum(uc) != 0 || c == '_' || c == '-' || c == '=';
    }
    return false;
}

const std::vector<ApiKeyShape>& builtin_api_key_shapes() {
    static const std::vector<ApiKeyShape> kShapes = {
        {"aws_access_key",   {"AKIA", "ASIA"},                 KeyAlphabet::UPPER_DIGIT, 16, 16},
        {"openai",           {"sk-"},                          KeyAlphabet::ALNUM_DASH,  32, 164},
        {"anthropic",        {"sk-ant-"},                      KeyAlphabet::ALNUM_DASH,  32, 128},
        {"google",           {"AIza"},                         KeyAlphabet::ALNUM_DASH,  35, 35},
        {"gcp",              {"gcp_"},                         KeyAlphabet::ALNUM_DASH,  30, 40},
        {"xai",              {"xai-"},                         KeyAlphabet::ALNUM,       32, 100},
        {"cerebras",         {"csk-"},                         KeyAlphabet::ALNUM,       40, 50},
        {"github",           {"ghp_", "gho_", "ghs_", "ghu_", "ghr_"}, KeyAlphabet::ALNUM, 36, 36},
        {"github_fine_grained", {"github_pat_"},               KeyAlphabet::ALNUM_DASH,  82, 82},
        {"huggingface",      {"hf_"},                          KeyAlphabet::ALNUM,       30, 40},
        {"slack",            {"xoxb-", "xoxp-", "xoxa-"},      KeyAlphabet::ALNUM_DASH,  10, 80},
        {"stripe",           {"sk_live_", "rk_live_"},         KeyAlphabet::ALNUM,       24, 99},
    };
    return kShapes;
}

ApiKeyDetector::ApiKeyDetector(ApiKeyShape shape, std::string token)
    : shape_(std::move(shape)), token_(std::move(token)) {}

std::optional<size_t> ApiKeyDetector::match_at(
    std::string_view text, size_t pos, std::string_view prefix) const {

    // Left edge: the prefix must start a word
    if (pos > 0 && is_word_char(text[pos - 1])) return std::nullopt;

    size_t end = pos + prefix.size();
    while (end < text.size() && in_alphabet(shape_.alphabet, text[end])) {
        ++end;
    }
    const size_t suffix_len = end - pos - prefix.size();
    if (suffix_len < shape_.min_length || suffix_len > shape_.max_length) {
        return std::nullopt;
    }

    // Right edge: not glued to a longer identifier
    if (end < text.size() && is_word_char(text[end])) return std::nullopt;
    return end;
}

void ApiKeyDetector::find(std::string_view text, uint32_t order, std::vector<Match>& out) const {
    for (const auto& prefix : shape_.prefixes) {
        if (prefix.empty()) continue;

        size_t pos = text.find(prefix);
        while (pos != std::string_view::npos) {
            if (const auto end = match_at(text, pos, prefix)) {
                out.emplace_back(Span{pos, *end}, Category::API_KEY,
                                 priority::kApiKey, token_, order);
                pos = text.find(prefix, *end);
            } else {
                pos = text.find(prefix, pos + 1);
            }
        }
    }
}

} // namespace biip
