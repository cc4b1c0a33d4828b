#include "engine/detector_engine.hpp"
#include "context/literal_detectors.hpp"

namespace biip {

DetectorEngine::DetectorEngine(const PatternCatalog& catalog, const Context& context)
    : catalog_(catalog) {

    if (!context.secret_literals.empty()) {
        leading_.push_back(std::make_unique<SecretLiteralDetector>(context.secret_literals));
    }

    const TokenSet& tokens = catalog.tokens();
    if (!context.home_dir.empty()) {
        trailing_.push_back(std::make_unique<HomeDirDetector>(
            context.home_dir, tokens.get(Category::HOME_DIR)));
    }
    if (!context.username.empty()) {
        trailing_.push_back(std::make_unique<UsernameDetector>(
            context.username, tokens.get(Category::USERNAME)));
    }
}

std::vector<Match> DetectorEngine::find_all(std::string_view text) const {
    std::vector<Match> matches;
    if (text.empty()) return matches;

    uint32_t order = 0;
    for (const auto& detector : leading_) {
        detector->find(text, order++, matches);
    }
    for (const auto& detector : catalog_.detectors()) {
        detector->find(text, order++, matches);
    }
    for (const auto& detector : trailing_) {
        detector->find(text, order++, matches);
    }
    return matches;
}

} // namespace biip
