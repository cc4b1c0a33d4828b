#include "catalog/token_set.hpp"

namespace biip {

TokenSet::TokenSet() {
    set(Category::USERNAME,        "user");
    set(Category::HOME_DIR,        "~");
    set(Category::URL_CREDENTIALS, "••••:••••");
    set(Category::EMAIL,           "•••@•••");
    set(Category::MAC_ADDRESS,     "••:••:••:••:••:••");
    set(Category::IPV4,            "••.••.••.••");
    set(Category::IPV6,            "••:••:••:••:••:••:••:••");
    set(Category::PHONE,           "(•••) •••-••••");
    set(Category::CREDIT_CARD,     "•••• •••• •••• ••••");
    set(Category::JWT,             "••••🌐•");
    set(Category::API_KEY,         "••••☁️•");
    set(Category::UUID,            "••••••••-••••-••••-••••-••••••••••••");
    set(Category::ENV_SECRET,      "••••••••");
    set(Category::CUSTOM_PATTERN,  "••••🔒•");
}

const TokenSet& TokenSet::defaults() {
    static const TokenSet kDefaults;
    return kDefaults;
}

} // namespace biip
