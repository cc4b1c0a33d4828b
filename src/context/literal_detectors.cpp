#include "context/literal_detectors.hpp"

#include <cctype>
#include <map>

namespace biip {

namespace {

bool is_path_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

// Claimed regions are disjoint, keyed by start
bool intersects_claimed(const std::map<size_t, size_t>& claimed, Span span) {
    auto it = claimed.lower_bound(span.end);
    if (it == claimed.begin()) return false;
    --it;
    return it->second > span.start;
}

} // anonymous namespace

// ============================================================================
// SecretLiteralDetector
// ============================================================================

SecretLiteralDetector::SecretLiteralDetector(std::vector<SecretLiteral> literals)
    : literals_(std::move(literals)) {}

void SecretLiteralDetector::find(std::string_view text, uint32_t order, std::vector<Match>& out) const {
    std::map<size_t, size_t> claimed;

    for (const auto& literal : literals_) {
        const std::string_view value = literal.value;
        if (value.empty() || value.size() > text.size()) continue;

        size_t pos = text.find(value);
        while (pos != std::string_view::npos) {
            const Span span{pos, pos + value.size()};
            if (intersects_claimed(claimed, span)) {
                pos = text.find(value, pos + 1);
                continue;
            }
            claimed.emplace(span.start, span.end);
            out.emplace_back(span, literal.category(), priority::kSecretLiteral,
                             literal.token, order);
            pos = text.find(value, span.end);
        }
    }
}

// ============================================================================
// UsernameDetector
// ============================================================================

UsernameDetector::UsernameDetector(std::string username, std::string token)
    : username_(std::move(username)), token_(std::move(token)) {
    // A name contained in its own token would re-match on every pass
    enabled_ = !username_.empty() && token_.find(username_) == std::string::npos;
}

void UsernameDetector::find(std::string_view text, uint32_t order, std::vector<Match>& out) const {
    if (!enabled_) return;

    size_t pos = text.find(username_);
    while (pos != std::string_view::npos) {
        out.emplace_back(Span{pos, pos + username_.size()}, Category::USERNAME,
                         priority::kIdentity, token_, order);
        pos = text.find(username_, pos + username_.size());
    }
}

// ============================================================================
// HomeDirDetector
// ============================================================================

HomeDirDetector::HomeDirDetector(std::string home_dir, std::string token)
    : home_dir_(std::move(home_dir)), token_(std::move(token)) {}

void HomeDirDetector::find(std::string_view text, uint32_t order, std::vector<Match>& out) const {
    if (home_dir_.empty()) return;

    size_t pos = text.find(home_dir_);
    while (pos != std::string_view::npos) {
        const size_t end = pos + home_dir_.size();
        // Must start the path, not sit inside a longer one
        const bool inside_path = pos > 0 && (is_path_name_char(text[pos - 1]) || text[pos - 1] == '/');
        if (inside_path || (end < text.size() && is_path_name_char(text[end]))) {
            pos = text.find(home_dir_, pos + 1);
            continue;
        }
        out.emplace_back(Span{pos, end}, Category::HOME_DIR, priority::kIdentity, token_, order);
        pos = text.find(home_dir_, end);
    }
}

} // namespace biip
