#pragma once

#include <cstddef>
#include <string_view>

namespace biip {

/**
 * @brief Text/binary classification over a bounded prefix of a buffer
 *
 * A sample containing NUL is binary. Otherwise, bytes that are neither
 * printable ASCII, common whitespace, nor part of a well-formed UTF-8
 * sequence count as non-printable; exceeding the ratio makes it binary.
 * A multi-byte sequence cut off by the sample boundary is not penalized.
 */
class BinaryScreener {
public:
    struct Config {
        size_t sample_size = 8192;
        double max_non_printable_ratio = 0.30;
    };

    BinaryScreener() : BinaryScreener(Config{}) {}
    explicit BinaryScreener(const Config& config);

    [[nodiscard]] bool is_binary(std::string_view buffer) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

/**
 * @brief Classification with the default policy
 */
[[nodiscard]] bool is_binary(std::string_view buffer);

} // namespace biip
