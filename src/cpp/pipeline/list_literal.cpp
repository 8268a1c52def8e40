#include "list_literal.hpp"
#include "../utils/logger.hpp"

namespace kvload {

std::string trim_copy(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static char unescape(char c) {
    switch (c) {
        case 'n': return '\n';
        case 't': return '\t';
        case 'r': return '\r';
        default:  return c;
    }
}

std::vector<std::string> parse_list_literal(const std::string& text) {
    std::string body = trim_copy(text);
    if (body.empty()) return {};

    if (body.front() == '[') {
        if (body.size() < 2 || body.back() != ']') {
            LOG_DBG("[list] Unmatched '[' in %.60s", body.c_str());
            return {};
        }
        body = body.substr(1, body.size() - 2);
    } else if (body.back() == ']') {
        LOG_DBG("[list] Unmatched ']' in %.60s", body.c_str());
        return {};
    }

    std::vector<std::string> items;
    std::string field;
    char quote = 0;

    auto finish = [&]() {
        std::string item = trim_copy(field);
        if (!item.empty()) items.push_back(std::move(item));
        field.clear();
    };

    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (quote) {
            if (c == '\\' && i + 1 < body.size()) {
                field += unescape(body[++i]);
            } else if (c == quote) {
                quote = 0;
            } else {
                field += c;
            }
        } else if ((c == '"' || c == '\'') && trim_copy(field).empty()) {
            // Quote opening an element; an apostrophe mid-word stays literal
            quote = c;
        } else if (c == ',') {
            finish();
        } else {
            field += c;
        }
    }

    if (quote) {
        LOG_DBG("[list] Unterminated %c quote in %.60s", quote, body.c_str());
        return {};
    }
    finish();
    return items;
}

} // namespace kvload
