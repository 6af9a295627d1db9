#include "core/escaping.hpp"

namespace uisanitizer {

std::string escape_sql(std::string_view value) {
    std::string result;
    result.reserve(value.size() + value.size() / 8);
    for (const char c : value) {
        result += c;
        if (c == '\'') result += '\'';
    }
    return result;
}

std::string escape_html(std::string_view value) {
    std::string result;
    result.reserve(value.size() + value.size() / 4);
    for (const char c : value) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#x27;"; break;
            default:   result += c;
        }
    }
    return result;
}

} // namespace uisanitizer
