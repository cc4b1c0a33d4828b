#include "engine/match_resolver.hpp"

#include <algorithm>

namespace biip {

std::vector<Match> MatchResolver::resolve(std::vector<Match> candidates) {
    std::sort(candidates.begin(), candidates.end(), [](const Match& a, const Match& b) {
        if (a.span.start != b.span.start) return a.span.start < b.span.start;
        if (a.priority != b.priority) return a.priority < b.priority;
        if (a.span.end != b.span.end) return a.span.end > b.span.end;
        return a.detector_order < b.detector_order;
    });

    std::vector<Match> accepted;
    accepted.reserve(candidates.size());

    // End of the last accepted match; offset 0 admits the first candidate
    size_t cursor = 0;
    for (auto& candidate : candidates) {
        if (candidate.span.start >= candidate.span.end) continue;
        if (candidate.span.start < cursor) continue;

        cursor = candidate.span.end;
        accepted.push_back(std::move(candidate));
    }
    return accepted;
}

} // namespace biip
