#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace uisanitizer {

/**
 * @brief Single entry point: classify, then apply the kind's rule
 *
 *   EMAIL -> mask_email        PHONE -> mask_phone
 *   URL   -> strip_url_query   JSON  -> recursive leaf sanitization
 *   ENV   -> per-line value sanitization
 *   TEXT  -> escape_sql, then escape_html
 *
 * JSON that does not parse (only reachable through an override) comes
 * back as TEXT with the raw input HTML-escaped.
 *
 * Pure: no I/O, no shared state; safe to call from any thread.
 */
class Sanitizer {
public:
    /**
     * @brief Sanitize input as `kind`, or as its detected kind if none given
     */
    [[nodiscard]] static SanitizeResult sanitize(
        std::string_view input,
        std::optional<Kind> kind = std::nullopt);
};

[[nodiscard]] inline SanitizeResult sanitize(
    std::string_view input,
    std::optional<Kind> kind = std::nullopt) {
    return Sanitizer::sanitize(input, kind);
}

/**
 * @brief Sanitize with auto-detection, returning only the cleaned value
 */
[[nodiscard]] inline std::string sanitize_text(std::string_view input) {
    return Sanitizer::sanitize(input).value;
}

} // namespace uisanitizer
