#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace uisanitizer {

/**
 * @brief Field masking - obscures sensitive values for display/redaction
 *
 * Strategies:
 * - EMAIL:  each part keeps its first and last character ("alice@example.com"
 *           -> "a***e@e*****e.c*m"), surrounding text is dropped
 * - PHONE:  every digit except the last 2 becomes '*', layout kept
 * - URL:    query string (and the rest of the line) removed
 *
 * The masks are one-way; nothing here can be reversed.
 */
class MaskingEngine {
public:
    /**
     * @brief Mask the first email-shaped substring of value
     * @return Masked "local@domain", or value unchanged if none found
     */
    [[nodiscard]] static std::string mask_email(std::string_view value);

    /**
     * @brief Mask all but the last two digits, keeping delimiters in place
     *
     * With fewer than 4 digits the result is one '*' per digit and the
     * delimiters are dropped.
     */
    [[nodiscard]] static std::string mask_phone(std::string_view value);

    /**
     * @brief Truncate the first query-carrying URL of each line at its '?'
     */
    [[nodiscard]] static std::string strip_url_query(std::string_view value);

    /**
     * @brief Mask one email part (local part or domain label)
     *
     * "" -> "", "a" -> "a*", "ab" -> "a*", "abc" -> "a*c", "alice" -> "a***e".
     * Lengths count UTF-8 code points.
     */
    [[nodiscard]] static std::string mask_part(std::string_view part);

    static constexpr size_t kVisiblePhoneDigits = 2;
    static constexpr size_t kMinPhoneDigits = 4;
};

[[nodiscard]] inline std::string mask_email(std::string_view value) {
    return MaskingEngine::mask_email(value);
}

[[nodiscard]] inline std::string mask_phone(std::string_view value) {
    return MaskingEngine::mask_phone(value);
}

[[nodiscard]] inline std::string strip_url_query(std::string_view value) {
    return MaskingEngine::strip_url_query(value);
}

} // namespace uisanitizer
