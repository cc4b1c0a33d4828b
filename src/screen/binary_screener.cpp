#include "screen/binary_screener.hpp"

#include <algorithm>
#include <cstdint>

namespace biip {

namespace {

bool is_text_ascii(uint8_t b) {
    return (b >= 0x20 && b < 0x7f) || b == '\t' || b == '\n' || b == '\r' ||
           b == '\f' || b == '\v';
}

bool is_continuation(uint8_t b) {
    return (b & 0xc0) == 0x80;
}

/**
 * @brief Length of the well-formed UTF-8 sequence at data[0]
 * @return sequence length, 0 if malformed, or SIZE_MAX if the sample ends
 *         inside an otherwise well-formed prefix
 */
size_t utf8_sequence_length(const uint8_t* data, size_t available) {
    const uint8_t lead = data[0];
    size_t len = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xbf;

    if (lead >= 0xc2 && lead <= 0xdf) {
        len = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
        len = 3;
        if (lead == 0xe0) lo = 0xa0;        // overlong
        if (lead == 0xed) hi = 0x9f;        // surrogates
    } else if (lead >= 0xf0 && lead <= 0xf4) {
        len = 4;
        if (lead == 0xf0) lo = 0x90;        // overlong
        if (lead == 0xf4) hi = 0x8f;        // > U+10FFFF
    } else {
        return 0;
    }

    for (size_t i = 1; i < len; ++i) {
        if (i >= available) return SIZE_MAX;
        const uint8_t b = data[i];
        if (i == 1 ? (b < lo || b > hi) : !is_continuation(b)) return 0;
    }
    return len;
}

} // anonymous namespace

BinaryScreener::BinaryScreener(const Config& config) : config_(config) {}

bool BinaryScreener::is_binary(std::string_view buffer) const {
    const size_t sample_len = std::min(buffer.size(), config_.sample_size);
    if (sample_len == 0) return false;

    const auto* data = reinterpret_cast<const uint8_t*>(buffer.data());

    size_t non_printable = 0;
    size_t i = 0;
    while (i < sample_len) {
        const uint8_t b = data[i];
        if (b == 0) return true;

        if (b < 0x80) {
            if (!is_text_ascii(b)) ++non_printable;
            ++i;
            continue;
        }

        const size_t len = utf8_sequence_length(data + i, sample_len - i);
        if (len == SIZE_MAX) break;         // cut by the sample boundary
        if (len == 0) {
            ++non_printable;
            ++i;
            continue;
        }
        i += len;
    }

    const double ratio = static_cast<double>(non_printable) / static_cast<double>(sample_len);
    return ratio > config_.max_non_printable_ratio;
}

bool is_binary(std::string_view buffer) {
    static const BinaryScreener kDefault;
    return kDefault.is_binary(buffer);
}

} // namespace biip
