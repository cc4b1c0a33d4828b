#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <istream>
#include <string>

namespace biip {

/**
 * @brief Read a whole file as bytes
 * @return IO_ERROR when the file cannot be opened or read
 */
[[nodiscard]] Result<std::string> read_file(const std::string& path);

/**
 * @brief Size of a regular file
 * @return IO_ERROR for missing files, directories and stat failures
 */
[[nodiscard]] Result<size_t> regular_file_size(const std::string& path);

/**
 * @brief Drain a stream to EOF
 */
[[nodiscard]] std::string read_all(std::istream& in);

} // namespace biip
