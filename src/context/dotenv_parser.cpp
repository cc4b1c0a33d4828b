#include "context/dotenv_parser.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace biip {

namespace {

bool is_key_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_key_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool valid_key(std::string_view key) {
    if (key.empty() || !is_key_start(key.front())) return false;
    return std::all_of(key.begin(), key.end(), is_key_char);
}

size_t line_end(std::string_view content, size_t pos) {
    const size_t nl = content.find('\n', pos);
    return nl == std::string_view::npos ? content.size() : nl;
}

size_t skip_blanks(std::string_view content, size_t pos) {
    while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) ++pos;
    return pos;
}

/**
 * @brief Parse a double-quoted value starting after the opening quote.
 * @return Position after the closing quote, or npos if unterminated.
 */
size_t parse_double_quoted(std::string_view content, size_t pos, std::string& out) {
    while (pos < content.size()) {
        const char c = content[pos];
        if (c == '"') return pos + 1;
        if (c == '\\' && pos + 1 < content.size()) {
            switch (content[pos + 1]) {
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                default:
                    out += '\\';
                    out += content[pos + 1];
                    break;
            }
            pos += 2;
            continue;
        }
        out += c;
        ++pos;
    }
    return std::string_view::npos;
}

std::string parse_unquoted(std::string_view line) {
    // Inline comment needs whitespace before '#', so "a#b" stays intact
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] == '#' && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            line = line.substr(0, i);
            break;
        }
    }
    return utils::trim(line);
}

void upsert(std::vector<std::pair<std::string, std::string>>& entries,
            std::string key, std::string value) {
    const auto it = std::find_if(entries.begin(), entries.end(),
        [&key](const auto& entry) { return entry.first == key; });
    if (it != entries.end()) {
        it->second = std::move(value);
    } else {
        entries.emplace_back(std::move(key), std::move(value));
    }
}

} // anonymous namespace

std::vector<std::pair<std::string, std::string>> parse_dotenv(std::string_view content) {
    std::vector<std::pair<std::string, std::string>> entries;

    size_t pos = 0;
    while (pos < content.size()) {
        const size_t eol = line_end(content, pos);
        size_t cur = skip_blanks(content, pos);

        // Blank line or comment
        if (cur >= eol || content[cur] == '#' || content[cur] == '\r') {
            pos = eol + 1;
            continue;
        }

        if (content.substr(cur, 7) == "export " || content.substr(cur, 7) == "export\t") {
            cur = skip_blanks(content, cur + 7);
        }

        const size_t eq = content.find('=', cur);
        if (eq == std::string_view::npos || eq >= eol) {
            pos = eol + 1;
            continue;
        }

        std::string key = utils::trim(content.substr(cur, eq - cur));
        if (!valid_key(key)) {
            pos = eol + 1;
            continue;
        }

        size_t value_pos = skip_blanks(content, eq + 1);
        std::string value;

        if (value_pos < content.size() && content[value_pos] == '"') {
            const size_t close = parse_double_quoted(content, value_pos + 1, value);
            if (close == std::string_view::npos) {
                pos = eol + 1;
                continue;
            }
            upsert(entries, std::move(key), std::move(value));
            pos = line_end(content, close) + 1;
        } else if (value_pos < content.size() && content[value_pos] == '\'') {
            const size_t close = content.find('\'', value_pos + 1);
            if (close == std::string_view::npos) {
                pos = eol + 1;
                continue;
            }
            value.assign(content.substr(value_pos + 1, close - value_pos - 1));
            upsert(entries, std::move(key), std::move(value));
            pos = line_end(content, close) + 1;
        } else {
            const size_t value_end = std::max(value_pos, eol);
            upsert(entries, std::move(key),
                   parse_unquoted(content.substr(value_pos, value_end - value_pos)));
            pos = eol + 1;
        }
    }

    return entries;
}

} // namespace biip
