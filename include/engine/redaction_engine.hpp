#pragma once

#include "catalog/pattern_catalog.hpp"
#include "context/context.hpp"
#include "engine/detector_engine.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief Per-call redaction summary: counts only, never matched text
 */
struct RedactionReport {
    std::array<size_t, kCategoryCount> counts{};

    [[nodiscard]] size_t total() const;
    [[nodiscard]] size_t count(Category c) const { return counts[category_index(c)]; }
    void merge(const RedactionReport& other);
};

/**
 * @brief Detector engine + match resolver + redactor behind one call
 *
 * redact() is a pure function of (text, Context): no shared mutable
 * state, safe to call concurrently from several threads on one instance.
 */
class RedactionEngine {
public:
    explicit RedactionEngine(const Context& context);

    /**
     * @param catalog Must outlive the engine
     */
    RedactionEngine(const PatternCatalog& catalog, const Context& context);

    [[nodiscard]] std::string redact(std::string_view text) const;

    [[nodiscard]] std::string redact(std::string_view text, RedactionReport& report) const;

    /**
     * @brief Resolved, disjoint matches in offset order
     */
    [[nodiscard]] std::vector<Match> scan(std::string_view text) const;

private:
    DetectorEngine detectors_;
};

/**
 * @brief One-shot redaction with the default catalog
 */
[[nodiscard]] std::string redact(std::string_view text, const Context& context);

} // namespace biip
