#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief Splices replacement tokens into a text
 *
 * Text outside the given matches is copied verbatim. Matches must be
 * disjoint, sorted by start and within bounds (MatchResolver output);
 * any match violating that is skipped rather than applied.
 */
class Redactor {
public:
    [[nodiscard]] static std::string apply(std::string_view text, const std::vector<Match>& matches);
};

} // namespace biip
