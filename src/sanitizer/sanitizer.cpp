#include "sanitizer/sanitizer.hpp"
#include "sanitizer/structured_sanitizer.hpp"
#include "classifier/type_detector.hpp"
#include "core/escaping.hpp"
#include "core/masking.hpp"

namespace uisanitizer {

SanitizeResult Sanitizer::sanitize(std::string_view input, std::optional<Kind> kind) {
    const Kind detected = kind ? *kind : TypeDetector::detect(input);

    switch (detected) {
        case Kind::EMAIL:
            return {Kind::EMAIL, MaskingEngine::mask_email(input)};

        case Kind::PHONE:
            return {Kind::PHONE, MaskingEngine::mask_phone(input)};

        case Kind::URL:
            return {Kind::URL, MaskingEngine::strip_url_query(input)};

        case Kind::JSON: {
            auto result = StructuredSanitizer::sanitize_json(input);
            if (result.is_error()) {
                return {Kind::TEXT, escape_html(input)};
            }
            return {Kind::JSON, std::move(result.value())};
        }

        case Kind::ENV:
            return {Kind::ENV, StructuredSanitizer::sanitize_env(input)};

        case Kind::TEXT:
            break;
    }

    return {Kind::TEXT, escape_html(escape_sql(input))};
}

} // namespace uisanitizer
