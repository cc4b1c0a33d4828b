#pragma once

#include <string>
#include <string_view>

namespace biip::validators {

/**
 * @brief Luhn checksum over the digits of a card-shaped string
 * Separators are ignored. Requires 13-19 digits.
 */
[[nodiscard]] bool luhn_validate(std::string_view number);

/**
 * @brief True for a dotted-quad IPv4 address outside private, loopback,
 * link-local, shared, multicast, reserved and documentation ranges
 */
[[nodiscard]] bool is_public_ipv4(std::string_view address);

/**
 * @brief True for a parseable IPv6 address outside loopback, unspecified,
 * link-local, unique-local, multicast, documentation and IPv4-mapped ranges
 */
[[nodiscard]] bool is_public_ipv6(std::string_view address);

/**
 * @brief True if the first segment of a dotted token decodes to a JSON
 * object carrying "alg" or "typ"
 */
[[nodiscard]] bool is_plausible_jwt(std::string_view token);

/**
 * @brief Decode base64url (unpadded) input; empty string on failure
 */
[[nodiscard]] std::string base64url_decode(std::string_view input);

} // namespace biip::validators
