#include "catalog/regex_detector.hpp"

#include <format>
#include <stdexcept>

namespace biip {

namespace {

re2::RE2::Options scan_options() {
    re2::RE2::Options options;
    // Input is arbitrary bytes; offsets are byte offsets
    options.set_encoding(re2::RE2::Options::EncodingLatin1);
    options.set_log_errors(false);
    return options;
}

} // anonymous namespace

RegexDetector::RegexDetector(Config config)
    : config_(std::move(config)),
      regex_(std::make_unique<re2::RE2>(config_.pattern, scan_options())) {
    if (!regex_->ok()) {
        throw std::invalid_argument(std::format("detector '{}': invalid pattern: {}",
            config_.name, regex_->error()));
    }
    if (config_.capture_group > static_cast<size_t>(regex_->NumberOfCapturingGroups())) {
        throw std::invalid_argument(std::format("detector '{}': pattern has no group {}",
            config_.name, config_.capture_group));
    }
}

void RegexDetector::find(std::string_view text, uint32_t order, std::vector<Match>& out) const {
    const re2::StringPiece input(text.data(), text.size());
    const int groups = static_cast<int>(config_.capture_group) + 1;
    std::vector<re2::StringPiece> m(static_cast<size_t>(groups));

    size_t pos = 0;
    while (pos < text.size()) {
        // The whole text stays visible, so \b sees the byte before pos
        if (!regex_->Match(input, pos, text.size(), re2::RE2::UNANCHORED, m.data(), groups)) break;

        const size_t start = static_cast<size_t>(m[0].data() - text.data());
        const size_t stop = start + m[0].size();
        if (stop == start) {
            pos = start + 1;
            continue;
        }

        const auto& group = m[config_.capture_group];
        if (group.data() == nullptr || group.empty()) {
            pos = stop;
            continue;
        }
        const size_t group_start = static_cast<size_t>(group.data() - text.data());
        const size_t group_end = group_start + group.size();

        if (config_.validator &&
            !config_.validator(text.substr(group_start, group_end - group_start))) {
            pos = stop;
            continue;
        }

        out.emplace_back(Span{group_start, group_end}, config_.category,
                         config_.priority, config_.token, order);
        pos = stop;
    }
}

} // namespace biip
