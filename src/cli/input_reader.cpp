#include "cli/input_reader.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace biip {

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("cannot open {}: {}", path, std::strerror(errno)));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("read failed: {}", path));
    }
    return Result<std::string>::ok(std::move(buffer).str());
}

Result<size_t> regular_file_size(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    const auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("cannot access {}: no such file or directory", path));
    }
    if (ec) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("cannot access {}: {}", path, ec.message()));
    }
    if (fs::is_directory(status)) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("{} is a directory", path));
    }
    if (!fs::is_regular_file(status)) {
        // FIFOs and character devices have no meaningful size
        return Result<size_t>::ok(0);
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("cannot stat {}: {}", path, ec.message()));
    }
    return Result<size_t>::ok(static_cast<size_t>(size));
}

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace biip
