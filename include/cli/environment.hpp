#pragma once

#include "core/error.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace biip {

/**
 * @brief Snapshot of the process environment as KEY -> VALUE
 * @param envp NULL-terminated "KEY=VALUE" array (normally ::environ)
 */
[[nodiscard]] std::map<std::string, std::string> collect_environment(const char* const* envp);

/**
 * @brief Login name: $USER, then $LOGNAME, then the passwd entry
 * @return Empty string when none is known
 */
[[nodiscard]] std::string current_username(const std::map<std::string, std::string>& environment);

/**
 * @brief Home directory: $HOME, then the passwd entry
 */
[[nodiscard]] std::string home_directory(const std::map<std::string, std::string>& environment);

/**
 * @brief Read a .env file if present
 * @return ok(nullopt) when the file does not exist, IO_ERROR when it
 *         exists but cannot be read
 */
[[nodiscard]] Result<std::optional<std::string>> read_dotenv(const std::filesystem::path& path);

} // namespace biip
