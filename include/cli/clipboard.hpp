#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace biip {

/**
 * @brief System clipboard through an external helper program
 *
 * The helper is chosen once: wl-paste/wl-copy, xclip, xsel, then
 * pbpaste/pbcopy, whichever is found first on PATH.
 */
class Clipboard {
public:
    struct Tool {
        std::string name;
        std::vector<std::string> read_argv;
        std::vector<std::string> write_argv;
    };

    /**
     * @brief Known helpers in preference order
     */
    [[nodiscard]] static const std::vector<Tool>& known_tools();

    /**
     * @brief First known helper whose read program is on PATH
     * @param path_env Value of $PATH
     * @return CLIPBOARD_ERROR when none is installed
     */
    [[nodiscard]] static Result<Clipboard> detect(std::string_view path_env);

    explicit Clipboard(Tool tool) : tool_(std::move(tool)) {}

    [[nodiscard]] Result<std::string> read() const;

    /**
     * @return Number of bytes handed to the helper
     */
    [[nodiscard]] Result<size_t> write(std::string_view text) const;

    [[nodiscard]] const Tool& tool() const { return tool_; }

private:
    Tool tool_;
};

/**
 * @brief Locate an executable by name in a ':'-separated search path
 */
[[nodiscard]] std::optional<std::string> find_in_path(std::string_view program,
                                                      std::string_view path_env);

} // namespace biip
