#include "engine/redactor.hpp"

#include <algorithm>

namespace biip {

std::string Redactor::apply(std::string_view text, const std::vector<Match>& matches) {
    if (matches.empty()) return std::string(text);

    size_t replaced_len = 0;
    size_t token_len = 0;
    for (const auto& m : matches) {
        replaced_len += m.span.length();
        token_len += m.token.size();
    }

    std::string result;
    result.reserve(text.size() - std::min(replaced_len, text.size()) + token_len);

    size_t cursor = 0;
    for (const auto& m : matches) {
        if (m.span.start < cursor || m.span.end > text.size() || m.span.start >= m.span.end) {
            continue;
        }
        result.append(text.substr(cursor, m.span.start - cursor));
        result.append(m.token);
        cursor = m.span.end;
    }
    result.append(text.substr(cursor));
    return result;
}

} // namespace biip
