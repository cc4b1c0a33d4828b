#include "cli/environment.hpp"
#include "cli/input_reader.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstring>
#include <format>
#include <system_error>
#include <vector>

namespace biip {

namespace {

std::optional<std::string> lookup(const std::map<std::string, std::string>& environment,
                                  const std::string& key) {
    const auto it = environment.find(key);
    if (it == environment.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

// Current user's passwd entry, copied out of the reentrant buffer.
std::optional<passwd> passwd_entry(std::vector<char>& buf) {
    long size = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    buf.resize(size > 0 ? static_cast<size_t>(size) : 16384);

    passwd pwd{};
    passwd* result = nullptr;
    if (::getpwuid_r(::getuid(), &pwd, buf.data(), buf.size(), &result) != 0 || !result) {
        return std::nullopt;
    }
    return pwd;
}

} // anonymous namespace

std::map<std::string, std::string> collect_environment(const char* const* envp) {
    std::map<std::string, std::string> environment;
    if (!envp) return environment;

    for (const char* const* e = envp; *e; ++e) {
        const char* eq = std::strchr(*e, '=');
        if (!eq || eq == *e) continue;
        environment.emplace(std::string(*e, eq), std::string(eq + 1));
    }
    return environment;
}

std::string current_username(const std::map<std::string, std::string>& environment) {
    if (auto user = lookup(environment, "USER")) return *user;
    if (auto user = lookup(environment, "LOGNAME")) return *user;

    std::vector<char> buf;
    if (const auto pwd = passwd_entry(buf); pwd && pwd->pw_name) {
        return pwd->pw_name;
    }
    return {};
}

std::string home_directory(const std::map<std::string, std::string>& environment) {
    if (auto home = lookup(environment, "HOME")) return *home;

    std::vector<char> buf;
    if (const auto pwd = passwd_entry(buf); pwd && pwd->pw_dir) {
        return pwd->pw_dir;
    }
    return {};
}

Result<std::optional<std::string>> read_dotenv(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    auto contents = read_file(path.string());
    if (contents.is_error()) {
        return Result<std::optional<std::string>>::error(
            contents.error_category(), contents.error_message());
    }
    return Result<std::optional<std::string>>::ok(std::move(contents.value()));
}

} // namespace biip
