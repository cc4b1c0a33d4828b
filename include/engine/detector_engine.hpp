#pragma once

#include "catalog/pattern_catalog.hpp"
#include "context/context.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief Runs every detector over a text buffer
 *
 * Detector list, in registration order:
 * 1. Secret literals from the Context (priority 0)
 * 2. Catalog detectors (URL credentials ... phone)
 * 3. Home directory and username from the Context (priority 10)
 *
 * Output is the raw, possibly overlapping candidate set. No detector can
 * abort the scan; a detector that finds nothing contributes nothing.
 */
class DetectorEngine {
public:
    /**
     * @param catalog Must outlive the engine
     * @param context Copied into context-derived detectors
     */
    DetectorEngine(const PatternCatalog& catalog, const Context& context);

    [[nodiscard]] std::vector<Match> find_all(std::string_view text) const;

private:
    const PatternCatalog& catalog_;
    std::vector<std::unique_ptr<IDetector>> leading_;
    std::vector<std::unique_ptr<IDetector>> trailing_;
};

} // namespace biip
