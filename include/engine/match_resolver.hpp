#pragma once

#include "core/types.hpp"

#include <vector>

namespace biip {

/**
 * @brief Reduces overlapping candidates to an ordered, disjoint set
 *
 * Candidates are sorted by (start asc, priority asc, length desc,
 * detector order asc), then swept left to right: a candidate is kept when
 * it starts at or after the end of the last kept match, otherwise dropped.
 * Acceptance follows scan position, so an earlier-starting lower-priority
 * match suppresses a later-starting overlapping one regardless of priority.
 */
class MatchResolver {
public:
    [[nodiscard]] static std::vector<Match> resolve(std::vector<Match> candidates);
};

} // namespace biip
