#include "catalog/validators.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace biip::validators {

namespace {

struct CidrRange {
    uint32_t network;
    uint32_t mask;
};

constexpr uint32_t make_ip(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    return (a << 24) | (b << 16) | (c << 8) | d;
}

constexpr uint32_t prefix_mask(uint32_t prefix) {
    return (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
}

// Non-public IPv4 blocks (RFC 1918, RFC 6890 special-purpose registry)
constexpr std::array<CidrRange, 14> kReservedV4 = {{
    {make_ip(0, 0, 0, 0),       prefix_mask(8)},    // "this network"
    {make_ip(10, 0, 0, 0),      prefix_mask(8)},    // private
    {make_ip(100, 64, 0, 0),    prefix_mask(10)},   // shared address space
    {make_ip(127, 0, 0, 0),     prefix_mask(8)},    // loopback
    {make_ip(169, 254, 0, 0),   prefix_mask(16)},   // link-local
    {make_ip(172, 16, 0, 0),    prefix_mask(12)},   // private
    {make_ip(192, 0, 0, 0),     prefix_mask(24)},   // IETF protocol assignments
    {make_ip(192, 0, 2, 0),     prefix_mask(24)},   // TEST-NET-1
    {make_ip(192, 168, 0, 0),   prefix_mask(16)},   // private
    {make_ip(198, 18, 0, 0),    prefix_mask(15)},   // benchmarking
    {make_ip(198, 51, 100, 0),  prefix_mask(24)},   // TEST-NET-2
    {make_ip(203, 0, 113, 0),   prefix_mask(24)},   // TEST-NET-3
    {make_ip(224, 0, 0, 0),     prefix_mask(4)},    // multicast
    {make_ip(240, 0, 0, 0),     prefix_mask(4)},    // reserved + broadcast
}};

/**
 * @brief Strict dotted-quad parser: four 0-255 octets, no leading zeros
 */
bool parse_ipv4(std::string_view ip, uint32_t& out) {
    uint32_t octets[4]{};
    size_t octet_idx = 0;
    uint32_t val = 0;
    size_t digits = 0;
    bool leading_zero = false;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || val > 255 || octet_idx > 3) return false;
            if (leading_zero && digits > 1) return false;
            octets[octet_idx++] = val;
            val = 0;
            digits = 0;
            leading_zero = false;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            if (digits == 0 && ip[i] == '0') leading_zero = true;
            val = val * 10 + static_cast<uint32_t>(ip[i] - '0');
            if (++digits > 3) return false;
        } else {
            return false;
        }
    }
    if (octet_idx != 4) return false;
    out = (octets[0] << 24) | (octets[1] << 16) | (octets[2] << 8) | octets[3];
    return true;
}

} // anonymous namespace

bool luhn_validate(std::string_view number) {
    // Extract digits only
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool is_public_ipv4(std::string_view address) {
    uint32_t ip = 0;
    if (!parse_ipv4(address, ip)) return false;

    return std::none_of(kReservedV4.begin(), kReservedV4.end(),
        [ip](const CidrRange& range) { return (ip & range.mask) == range.network; });
}

bool is_public_ipv6(std::string_view address) {
    // INET6_ADDRSTRLEN bounds every textual form inet_pton accepts
    if (address.empty() || address.size() >= INET6_ADDRSTRLEN) return false;

    // Hex-letter identifiers like Cafe::dead or Bad::Add parse but are code
    if (std::none_of(address.begin(), address.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }

    const std::string buf(address);
    unsigned char bytes[16];
    if (::inet_pton(AF_INET6, buf.c_str(), bytes) != 1) return false;

    static constexpr unsigned char kZero[16] = {};

    // :: and ::1
    if (std::memcmp(bytes, kZero, 15) == 0 && (bytes[15] == 0 || bytes[15] == 1)) {
        return false;
    }
    // fe80::/10 link-local
    if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80) return false;
    // fc00::/7 unique local
    if ((bytes[0] & 0xfe) == 0xfc) return false;
    // ff00::/8 multicast
    if (bytes[0] == 0xff) return false;
    // 2001:db8::/32 documentation
    if (bytes[0] == 0x20 && bytes[1] == 0x01 && bytes[2] == 0x0d && bytes[3] == 0xb8) {
        return false;
    }
    // ::ffff:0:0/96 IPv4-mapped
    if (std::memcmp(bytes, kZero, 10) == 0 && bytes[10] == 0xff && bytes[11] == 0xff) {
        return false;
    }
    return true;
}

std::string base64url_decode(std::string_view input) {
    // Convert base64url to standard base64
    std::string b64(input);
    std::replace(b64.begin(), b64.end(), '-', '+');
    std::replace(b64.begin(), b64.end(), '_', '/');

    // Add padding
    while (b64.size() % 4 != 0) {
        b64 += '=';
    }

    // Decode using OpenSSL EVP
    const size_t max_decoded_len = (b64.size() / 4) * 3 + 3;
    std::string decoded(max_decoded_len, '\0');

    EVP_ENCODE_CTX* ctx = EVP_ENCODE_CTX_new();
    if (!ctx) return "";

    EVP_DecodeInit(ctx);
    int out_len = 0;
    int tmp_len = 0;

    int rc = EVP_DecodeUpdate(ctx,
        reinterpret_cast<unsigned char*>(decoded.data()), &out_len,
        reinterpret_cast<const unsigned char*>(b64.data()),
        static_cast<int>(b64.size()));

    if (rc < 0) {
        EVP_ENCODE_CTX_free(ctx);
        return "";
    }

    rc = EVP_DecodeFinal(ctx,
        reinterpret_cast<unsigned char*>(decoded.data()) + out_len, &tmp_len);
    EVP_ENCODE_CTX_free(ctx);

    if (rc < 0) return "";

    decoded.resize(static_cast<size_t>(out_len + tmp_len));
    return decoded;
}

bool is_plausible_jwt(std::string_view token) {
    const auto dot = token.find('.');
    if (dot == std::string_view::npos || dot == 0) return false;

    const std::string header_json = base64url_decode(token.substr(0, dot));
    if (header_json.empty()) return false;

    // Non-throwing parse: malformed headers are simply not tokens
    const auto header = nlohmann::json::parse(header_json, nullptr, false);
    if (header.is_discarded() || !header.is_object()) return false;

    return header.contains("alg") || header.contains("typ");
}

} // namespace biip::validators
