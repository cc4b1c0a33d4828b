#include "context/context.hpp"
#include "context/dotenv_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace biip {

namespace {

std::string normalize_home(std::string home) {
    while (home.size() > 1 && home.back() == '/') {
        home.pop_back();
    }
    // "/" as a home would turn every absolute path into "~"
    if (home == "/") return "";
    return home;
}

} // anonymous namespace

size_t Context::secret_count() const {
    return static_cast<size_t>(std::count_if(secret_literals.begin(), secret_literals.end(),
        [](const SecretLiteral& s) { return s.source == SecretClass::KEYWORD; }));
}

size_t Context::custom_count() const {
    return static_cast<size_t>(std::count_if(secret_literals.begin(), secret_literals.end(),
        [](const SecretLiteral& s) { return s.source == SecretClass::CUSTOM; }));
}

std::optional<SecretClass> classify_variable(std::string_view name, const ContextOptions& options) {
    if (!options.custom_prefix.empty() && name.starts_with(options.custom_prefix)) {
        return SecretClass::CUSTOM;
    }

    const std::string lower = utils::to_lower(name);
    for (const auto& keyword : options.keywords) {
        if (!keyword.empty() && lower.find(utils::to_lower(keyword)) != std::string::npos) {
            return SecretClass::KEYWORD;
        }
    }
    return std::nullopt;
}

Context build_context(
    const std::map<std::string, std::string>& environment,
    const std::optional<std::string>& dotenv_contents,
    std::string current_user,
    std::string home_dir,
    const ContextOptions& options) {

    Context ctx;
    ctx.username = utils::trim(current_user);
    ctx.home_dir = normalize_home(utils::trim(home_dir));

    // .env first, then the process environment overrides it
    std::map<std::string, std::string> variables;
    if (dotenv_contents) {
        for (auto& [key, value] : parse_dotenv(*dotenv_contents)) {
            variables[key] = std::move(value);
        }
    }
    for (const auto& [key, value] : environment) {
        variables[key] = value;
    }

    // value → class; a custom classification wins over a keyword one
    std::map<std::string, SecretClass> harvested;
    size_t shadowed = 0;
    for (const auto& [name, raw_value] : variables) {
        const auto cls = classify_variable(name, options);
        if (!cls) continue;

        std::string value = utils::trim(raw_value);
        if (value.empty() || value.size() < options.min_secret_length) continue;

        // A value found inside a token would re-match redacted output
        if (options.tokens.occurs_in_any(value)) {
            ++shadowed;
            continue;
        }

        auto [it, inserted] = harvested.emplace(std::move(value), *cls);
        if (!inserted && *cls == SecretClass::CUSTOM) {
            it->second = SecretClass::CUSTOM;
        }
    }

    ctx.secret_literals.reserve(harvested.size());
    for (const auto& [value, cls] : harvested) {
        const Category category = (cls == SecretClass::CUSTOM)
            ? Category::CUSTOM_PATTERN : Category::ENV_SECRET;
        ctx.secret_literals.emplace_back(value, cls, options.tokens.get(category));
    }

    std::stable_sort(ctx.secret_literals.begin(), ctx.secret_literals.end(),
        [](const SecretLiteral& a, const SecretLiteral& b) {
            if (a.value.size() != b.value.size()) return a.value.size() > b.value.size();
            return a.value < b.value;
        });

    if (shadowed > 0) {
        utils::log::warn(std::format("Context: {} secret value(s) ignored, contained in a redaction token",
            shadowed));
    }

    utils::log::debug(std::format("Context: {} secret literals, {} custom literals, user={}, home={}",
        ctx.secret_count(), ctx.custom_count(),
        ctx.username.empty() ? "unset" : "set",
        ctx.home_dir.empty() ? "unset" : "set"));

    return ctx;
}

} // namespace biip
