#include "codegen/literal_escaper.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <unordered_map>

namespace uisanitizer {

namespace {

using EscapeFn = std::string (*)(std::string_view);

std::string java_style(std::string_view value) {
    return LiteralEscaper::double_quoted(value, true);
}

std::string c_style(std::string_view value) {
    return LiteralEscaper::double_quoted(value, false);
}

const std::unordered_map<std::string_view, EscapeFn>& escaper_table() {
    static const std::unordered_map<std::string_view, EscapeFn> table = {
        {"python",     &LiteralEscaper::python_repr},
        {"javascript", &java_style},
        {"js",         &java_style},
        {"java",       &java_style},
        {"go",         &c_style},
        {"c",          &c_style},
        {"csharp",     &c_style},
        {"cs",         &c_style},
        {"php",        &c_style},
        {"ruby",       &c_style},
        {"rust",       &c_style},
        {"swift",      &c_style},
        {"bash",       &LiteralEscaper::shell_single_quoted},
    };
    return table;
}

// Non-ASCII code points that a repr escapes: separators, format controls,
// C1 controls, surrogates, private use and non-characters. Unassigned code
// points (U+0378 and the like) are not listed, so they are copied through
// where Python's repr would write \u or \U escapes.
struct CodePointRange {
    char32_t first;
    char32_t last;
};

constexpr CodePointRange kNonPrintable[] = {
    {0x0080, 0x00A0}, {0x00AD, 0x00AD}, {0x0600, 0x0605}, {0x061C, 0x061C},
    {0x06DD, 0x06DD}, {0x070F, 0x070F}, {0x1680, 0x1680}, {0x180E, 0x180E},
    {0x2000, 0x200F}, {0x2028, 0x202F}, {0x205F, 0x2064}, {0x2066, 0x206F},
    {0x3000, 0x3000}, {0xD800, 0xF8FF}, {0xFEFF, 0xFEFF}, {0xFFF9, 0xFFFB},
    {0xFFFE, 0xFFFF}, {0xE0001, 0xE0001}, {0xE0020, 0xE007F}, {0xF0000, 0x10FFFF},
};

} // anonymous namespace

bool LiteralEscaper::is_printable(char32_t cp) {
    if (cp < 0x20 || cp == 0x7F) return false;
    if (cp < 0x7F) return true;
    return std::none_of(std::begin(kNonPrintable), std::end(kNonPrintable),
        [cp](const CodePointRange& r) { return cp >= r.first && cp <= r.last; });
}

std::string LiteralEscaper::python_repr(std::string_view value) {
    const bool has_single = value.find('\'') != std::string_view::npos;
    const bool has_double = value.find('"') != std::string_view::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';

    std::string result;
    result.reserve(value.size() + 2);
    result += quote;

    for (const auto& unit : utils::decode_utf8(value)) {
        const char32_t cp = unit.code_point;

        if (!unit.valid) {
            result += "\\x" + utils::to_hex(cp, 2);
            continue;
        }

        if (cp == static_cast<char32_t>(quote) || cp == U'\\') {
            result += '\\';
            result += static_cast<char>(cp);
        } else if (cp == U'\t') {
            result += "\\t";
        } else if (cp == U'\n') {
            result += "\\n";
        } else if (cp == U'\r') {
            result += "\\r";
        } else if (is_printable(cp)) {
            result.append(unit.bytes);
        } else if (cp <= 0xFF) {
            result += "\\x" + utils::to_hex(cp, 2);
        } else if (cp <= 0xFFFF) {
            result += "\\u" + utils::to_hex(cp, 4);
        } else {
            result += "\\U" + utils::to_hex(cp, 8);
        }
    }

    result += quote;
    return result;
}

std::string LiteralEscaper::double_quoted(std::string_view value, bool escape_cr) {
    std::string result;
    result.reserve(value.size() + 2);
    result += '"';
    for (const char c : value) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            case '\n': result += "\\n"; break;
            case '\r':
                if (escape_cr) {
                    result += "\\r";
                } else {
                    result += c;
                }
                break;
            default: result += c;
        }
    }
    result += '"';
    return result;
}

std::string LiteralEscaper::shell_single_quoted(std::string_view value) {
    std::string result;
    result.reserve(value.size() + 2);
    result += '\'';
    for (const char c : value) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
}

std::string LiteralEscaper::escape(std::string_view value, std::string_view language) {
    const std::string key = utils::to_lower(language);
    const auto& table = escaper_table();
    if (const auto it = table.find(key); it != table.end()) {
        return it->second(value);
    }
    return python_repr(value);
}

bool LiteralEscaper::is_known_language(std::string_view language) {
    return escaper_table().contains(utils::to_lower(language));
}

std::vector<std::string> LiteralEscaper::known_languages() {
    std::vector<std::string> names;
    names.reserve(escaper_table().size());
    for (const auto& [name, fn] : escaper_table()) {
        names.emplace_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace uisanitizer
