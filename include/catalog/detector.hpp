#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief Detector interface
 *
 * A detector scans a text buffer and appends candidate matches. Detectors
 * are immutable after construction and safe to share across threads.
 * Validation failures are not errors: the candidate is simply not emitted.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Append every accepted match found in text
     * @param order Registration index, carried into each Match for tie-breaks
     */
    virtual void find(std::string_view text, uint32_t order, std::vector<Match>& out) const = 0;
};

using Validator = bool (*)(std::string_view);

} // namespace biip
