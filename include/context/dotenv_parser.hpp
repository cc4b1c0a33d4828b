#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace biip {

/**
 * @brief Parse .env-formatted content into ordered KEY/VALUE pairs
 *
 * Supported:
 * - blank lines and # comment lines
 * - optional "export " prefix
 * - KEY=VALUE with whitespace around key and '=' trimmed
 * - 'single quoted' values, taken literally
 * - "double quoted" values with \n \r \t \" \\ escapes, may span lines
 * - unquoted values ending at " #" inline comments
 *
 * Malformed lines are skipped; parsing never fails. A key defined twice
 * keeps its last value.
 */
[[nodiscard]] std::vector<std::pair<std::string, std::string>> parse_dotenv(std::string_view content);

} // namespace biip
