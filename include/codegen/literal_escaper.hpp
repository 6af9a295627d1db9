#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace uisanitizer {

/**
 * @brief Renders a string as a source-code literal for a target language
 *
 * Language names are matched case-insensitively against a fixed table:
 *
 *   python                          -> Python repr ('...' or "...")
 *   java, javascript, js            -> "..." escaping \ " \n \r
 *   c, go, csharp, cs, php, ruby,
 *   rust, swift                     -> "..." escaping \ " \n
 *   bash                            -> '...' with ' written as '\''
 *
 * Unknown names fall back to the Python repr. Control characters other than
 * the listed escapes are copied as-is in the double-quote families.
 *
 * The Python repr follows CPython except for unassigned code points, which
 * are treated as printable and copied unescaped.
 */
class LiteralEscaper {
public:
    [[nodiscard]] static std::string escape(std::string_view value, std::string_view language);

    [[nodiscard]] static bool is_known_language(std::string_view language);

    /// Table keys in a stable (sorted) order
    [[nodiscard]] static std::vector<std::string> known_languages();

    [[nodiscard]] static std::string python_repr(std::string_view value);
    [[nodiscard]] static std::string double_quoted(std::string_view value, bool escape_cr);
    [[nodiscard]] static std::string shell_single_quoted(std::string_view value);

private:
    static bool is_printable(char32_t cp);
};

[[nodiscard]] inline std::string escape_literal(std::string_view value, std::string_view language) {
    return LiteralEscaper::escape(value, language);
}

[[nodiscard]] inline std::string escape_for(std::string_view value, std::string_view language) {
    return LiteralEscaper::escape(value, language);
}

} // namespace uisanitizer
