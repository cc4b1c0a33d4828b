#include "engine/redaction_engine.hpp"
#include "engine/match_resolver.hpp"
#include "engine/redactor.hpp"

#include <numeric>

namespace biip {

size_t RedactionReport::total() const {
    return std::accumulate(counts.begin(), counts.end(), size_t{0});
}

void RedactionReport::merge(const RedactionReport& other) {
    for (size_t i = 0; i < counts.size(); ++i) {
        counts[i] += other.counts[i];
    }
}

RedactionEngine::RedactionEngine(const Context& context)
    : RedactionEngine(PatternCatalog::default_catalog(), context) {}

RedactionEngine::RedactionEngine(const PatternCatalog& catalog, const Context& context)
    : detectors_(catalog, context) {}

std::vector<Match> RedactionEngine::scan(std::string_view text) const {
    return MatchResolver::resolve(detectors_.find_all(text));
}

std::string RedactionEngine::redact(std::string_view text) const {
    return Redactor::apply(text, scan(text));
}

std::string RedactionEngine::redact(std::string_view text, RedactionReport& report) const {
    const auto matches = scan(text);
    for (const auto& m : matches) {
        ++report.counts[category_index(m.category)];
    }
    return Redactor::apply(text, matches);
}

std::string redact(std::string_view text, const Context& context) {
    const RedactionEngine engine(context);
    return engine.redact(text);
}

} // namespace biip
